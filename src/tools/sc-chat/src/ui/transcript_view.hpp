#pragma once

#include "../chat_line_item.hpp"
#include "../chat_transcript.hpp"
#include "../tvision_include.hpp"

#include "sc/scroll/scroll_viewport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

// Draws a ChatTranscript through a scroll viewport, one unit per terminal row.
// The owner calls tick() from its idle handler to advance scroll animations
// and flush scroll notifications.
class TranscriptView : public TView
{
public:
    using Clock = std::chrono::steady_clock;
    using Viewport = sc::scroll::ScrollViewport<sc::chat::MessageId>;

    // Rows moved by one wheel notch.
    static constexpr float kWheelStep = 3.0f;

    TranscriptView(const TRect &bounds,
                   TScrollBar *vScroll,
                   const sc::chat::ChatTranscript &transcript,
                   sc::scroll::ViewportRegistry &registry,
                   sc::scroll::ViewportId viewportId);

    const sc::scroll::ViewportId &viewportId() const noexcept { return viewportId_; }
    const Viewport &viewport() const noexcept { return viewport_; }

    void setNaturalScrolling(bool enabled) noexcept { viewport_.setNaturalScrolling(enabled); }
    void setAnimationRate(float rate) noexcept { viewport_.setAnimationRate(rate); }
    void setScrollCallback(sc::scroll::ViewportNotifier::Callback callback);

    // Picks up transcript changes, advances the animation and redraws if the
    // offset moved.
    void tick(Clock::time_point now);

    // Handles kbPgUp / kbPgDn. Returns true if a scroll started.
    bool scrollPage(ushort keyCode);

    virtual void draw() override;
    virtual void changeBounds(const TRect &bounds) override;
    virtual void handleEvent(TEvent &event) override;
    virtual TPalette &getPalette() const override;

private:
    void relayout();
    void syncScrollBar();
    sc::scroll::Rect viewBounds() const noexcept;

    const sc::chat::ChatTranscript &transcript_;
    TScrollBar *vScrollBar_ = nullptr;
    sc::scroll::ViewportId viewportId_;
    Viewport viewport_;
    std::unordered_map<sc::chat::MessageId, std::shared_ptr<const sc::chat::ChatLineItem>> items_;
    std::uint64_t revision_ = 0;
    bool laidOut_ = false;
    float drawnTranslation_ = -1.0f;
    bool syncingScrollBar_ = false;
};
