#pragma once

#include "sc/scroll/anchor_tracker.hpp"
#include "sc/scroll/geometry.hpp"
#include "sc/scroll/input_translator.hpp"
#include "sc/scroll/keyed_state_store.hpp"
#include "sc/scroll/layout_engine.hpp"
#include "sc/scroll/scroll_animator.hpp"
#include "sc/scroll/scroll_item.hpp"
#include "sc/scroll/viewport_notifier.hpp"
#include "sc/scroll/viewport_registry.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace sc::scroll
{

// Vertical scroll container for a changing list of variable-height items.
//
// The host drives one frame as:
//   layout()       - every time the item list or the viewport size may have changed
//   handleInput()  - for each input event routed to the viewport
//   tick()         - on each redraw while needsRedraw() reports true
//   finishFrame()  - emits the scroll notification if the offset moved
// External code reaches the viewport through a ViewportRegistry under its id.
//
// Keys identify items across frames and must be unique within one call to layout().
template <typename Key, typename Hash = std::hash<Key>>
class ScrollViewport : public ScrollTarget
{
public:
    using Clock = ScrollAnimator::Clock;
    using ItemPtr = std::shared_ptr<const ScrollItem>;

    struct Entry
    {
        ItemPtr item;
        Key key;
    };

    ScrollViewport() = default;

    ScrollViewport(ViewportRegistry &registry, ViewportId id)
    {
        registration_.emplace(registry, std::move(id), *this);
    }

    ScrollViewport(const ScrollViewport &) = delete;
    ScrollViewport &operator=(const ScrollViewport &) = delete;

    void setNaturalScrolling(bool enabled) noexcept { naturalScrolling_ = enabled; }
    bool naturalScrolling() const noexcept { return naturalScrolling_; }

    void setAnimationRate(float rate) noexcept { animator_.setRate(rate); }

    void setScrollCallback(ViewportNotifier::Callback callback) { notifier_.setCallback(std::move(callback)); }

    void layout(const std::vector<Entry> &entries, const Rect &bounds)
    {
        std::vector<Key> keys;
        keys.reserve(entries.size());
        for (const auto &entry : entries)
            keys.push_back(entry.key);

        states_.diff(
            std::span<const Key>(keys),
            [&](std::size_t index) {
                std::unique_ptr<ItemState> state = entries[index].item->createState();
                if (!state)
                    state = std::make_unique<ItemState>();
                return state;
            },
            [&](std::size_t index, std::unique_ptr<ItemState> &state) { entries[index].item->syncState(*state); });

        StackedLayout stacked =
            stackVertically(entries.size(), itemLimits(bounds.size()), [&](std::size_t index, const Limits &limits) {
                return entries[index].item->layout(*states_.stateAt(index), limits);
            });

        LayoutTable<Key> table;
        table.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i)
            table.push_back(LayoutRecord<Key>{stacked.bounds[i], std::move(keys[i])});

        AnchorResult anchor =
            trackAnchor(translation_, bounds_, contentBounds_, layouts_, bounds, stacked.contentBounds, table);
        animator_.shift(anchor.shift);

        layouts_ = std::move(table);
        bounds_ = bounds;
        contentBounds_ = stacked.contentBounds;

        animator_.clampTo(maxTranslation(bounds_, contentBounds_));
        setTranslation(anchor.translation);
    }

    // Returns true if the event started or extended a scroll animation.
    bool handleInput(const InputEvent &event, std::optional<Point> pointer, Clock::time_point now)
    {
        std::optional<float> delta = translateInput(event, InputContext{bounds_, pointer, naturalScrolling_});
        if (!delta)
            return false;
        animator_.request(*delta, translation_, now);
        return true;
    }

    // Advances a running animation. Returns true if the offset changed.
    bool tick(Clock::time_point now)
    {
        std::optional<float> next = animator_.advance(now, maxTranslation(bounds_, contentBounds_));
        return next && setTranslation(*next);
    }

    bool needsRedraw(const Rect &visibleRegion) const noexcept
    {
        return animator_.animating() && bounds_.intersects(visibleRegion);
    }

    bool finishFrame() { return notifier_.flush(snapshot()); }

    void scrollToItem(std::ptrdiff_t index) override
    {
        if (index < 0 || static_cast<std::size_t>(index) >= layouts_.size())
            return;
        jumpTo(layouts_[static_cast<std::size_t>(index)].bounds.y);
    }

    void snapTo(float fraction) override { jumpTo(std::clamp(fraction, 0.0f, 1.0f) * contentBounds_.height); }

    void scrollTo(float offset) override { jumpTo(offset); }

    void scrollBy(float delta) override { jumpTo(translation_ + delta); }

    float translation() const noexcept { return translation_; }
    const Rect &bounds() const noexcept { return bounds_; }
    const Rect &contentBounds() const noexcept { return contentBounds_; }
    const LayoutTable<Key> &layoutTable() const noexcept { return layouts_; }
    const std::optional<Animation> &animation() const noexcept { return animator_.animation(); }
    std::size_t size() const noexcept { return layouts_.size(); }

    ItemState &stateAt(std::size_t index) const { return *states_.stateAt(index); }

    ViewportSnapshot snapshot() const { return ViewportSnapshot{translation_, bounds_, contentBounds_}; }
    bool isAtTop() const noexcept { return scroll::isAtTop(translation_); }
    bool isAtBottom() const noexcept { return scroll::isAtBottom(translation_, bounds_, contentBounds_); }

    // Calls fn(index, bounds, state) for every item overlapping the visible area.
    // `bounds` is in the coordinate space of the viewport's own bounds.
    template <typename Fn>
    void forEachVisible(Fn &&fn) const
    {
        float top = translation_;
        float bottom = translation_ + bounds_.height;
        for (std::size_t i = 0; i < layouts_.size(); ++i)
        {
            const Rect &itemBounds = layouts_[i].bounds;
            if (itemBounds.bottom() <= top || itemBounds.y >= bottom)
                continue;
            fn(i, itemBounds.translated(bounds_.x, bounds_.y - translation_), *states_.stateAt(i));
        }
    }

private:
    void jumpTo(float offset)
    {
        animator_.cancel();
        setTranslation(clampTranslation(offset, bounds_, contentBounds_));
    }

    bool setTranslation(float translation) noexcept
    {
        if (translation == translation_)
            return false;
        translation_ = translation;
        notifier_.markScrolled();
        return true;
    }

    KeyedStateStore<Key, std::unique_ptr<ItemState>, Hash> states_;
    LayoutTable<Key> layouts_;
    Rect bounds_;
    Rect contentBounds_;
    float translation_ = 0.0f;
    bool naturalScrolling_ = false;
    ScrollAnimator animator_;
    ViewportNotifier notifier_;
    std::optional<ViewportRegistration> registration_;
};

} // namespace sc::scroll
