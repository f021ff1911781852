#include <gtest/gtest.h>

#include "sc/scroll/scroll_viewport.hpp"

#include <chrono>
#include <memory>
#include <vector>

using namespace std::chrono_literals;
using sc::scroll::InputEvent;
using sc::scroll::ItemState;
using sc::scroll::Limits;
using sc::scroll::Point;
using sc::scroll::Rect;
using sc::scroll::ScrollItem;
using sc::scroll::Size;
using sc::scroll::ViewportRegistry;
using sc::scroll::ViewportSnapshot;

namespace
{

struct CountingState : ItemState
{
    int layouts = 0;
};

class FixedItem : public ScrollItem
{
public:
    explicit FixedItem(float height) : height_(height) {}

    std::unique_ptr<ItemState> createState() const override { return std::make_unique<CountingState>(); }

    Size layout(ItemState &state, const Limits &limits) const override
    {
        ++static_cast<CountingState &>(state).layouts;
        return Size{limits.max.width, height_};
    }

private:
    float height_;
};

using Viewport = sc::scroll::ScrollViewport<int>;

std::vector<Viewport::Entry> items(const std::vector<int> &keys, float height)
{
    std::vector<Viewport::Entry> result;
    for (int key : keys)
        result.push_back({std::make_shared<FixedItem>(height), key});
    return result;
}

Rect viewportBounds(float height)
{
    return Rect{0.0f, 0.0f, 100.0f, height};
}

void runAnimation(Viewport &viewport, Viewport::Clock::time_point &now)
{
    for (int i = 0; i < 100 && viewport.animation(); ++i)
    {
        now += 10ms;
        viewport.tick(now);
    }
}

} // namespace

TEST(ScrollViewport, FollowsNewMessagesWhenAtBottom)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3}, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(20.0f);
    ASSERT_TRUE(viewport.isAtBottom());

    viewport.layout(items({1, 2, 3, 4}, 40.0f), viewportBounds(100.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 60.0f);
    EXPECT_TRUE(viewport.isAtBottom());
}

TEST(ScrollViewport, ShortTranscriptStartsFollowing)
{
    Viewport viewport;
    viewport.layout(items({1}, 40.0f), viewportBounds(100.0f));
    EXPECT_TRUE(viewport.isAtBottom());
    viewport.layout(items({1, 2}, 40.0f), viewportBounds(100.0f));
    viewport.layout(items({1, 2, 3}, 40.0f), viewportBounds(100.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 20.0f);
}

TEST(ScrollViewport, InsertBetweenItemsAtBottomKeepsBottom)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3}, 50.0f), viewportBounds(100.0f));
    viewport.scrollTo(50.0f);

    viewport.layout(items({1, 9, 2, 3}, 50.0f), viewportBounds(100.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);
}

TEST(ScrollViewport, InsertAboveAnchorKeepsVisibleContentStill)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3}, 50.0f), viewportBounds(40.0f));
    viewport.scrollTo(50.0f);
    ASSERT_FALSE(viewport.isAtBottom());

    viewport.layout(items({1, 9, 2, 3}, 50.0f), viewportBounds(40.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);
    EXPECT_EQ(viewport.layoutTable()[2].key, 2);
}

TEST(ScrollViewport, InsertAboveAnchorShiftsRunningAnimation)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 50.0f), viewportBounds(100.0f));
    viewport.scrollTo(50.0f);
    ASSERT_FALSE(viewport.isAtBottom());

    auto now = Viewport::Clock::time_point{} + 1s;
    ASSERT_TRUE(viewport.handleInput(InputEvent::wheelPixels(-40.0f), Point{10.0f, 10.0f}, now));
    ASSERT_FLOAT_EQ(viewport.animation()->start, 50.0f);
    ASSERT_FLOAT_EQ(viewport.animation()->target, 90.0f);

    viewport.layout(items({1, 9, 2, 3, 4, 5}, 50.0f), viewportBounds(100.0f));
    ASSERT_TRUE(viewport.animation().has_value());
    EXPECT_FLOAT_EQ(viewport.animation()->start, 100.0f);
    EXPECT_FLOAT_EQ(viewport.animation()->target, 140.0f);
    EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);

    runAnimation(viewport, now);
    EXPECT_FLOAT_EQ(viewport.translation(), 140.0f);
    EXPECT_FALSE(viewport.animation().has_value());
}

TEST(ScrollViewport, ScrollingUpStopsFollowing)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4}, 40.0f), viewportBounds(100.0f));
    viewport.snapTo(1.0f);
    ASSERT_FLOAT_EQ(viewport.translation(), 60.0f);

    viewport.scrollBy(-30.0f);
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 30.0f);
    EXPECT_FALSE(viewport.isAtBottom());
}

TEST(ScrollViewport, JumpToItemCancelsAnimation)
{
    Viewport viewport;
    std::vector<int> keys;
    for (int i = 0; i < 30; ++i)
        keys.push_back(i);
    viewport.layout(items(keys, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(0.0f);

    auto now = Viewport::Clock::time_point{} + 1s;
    ASSERT_TRUE(viewport.handleInput(InputEvent::wheelPixels(-500.0f), Point{10.0f, 10.0f}, now));
    now += 10ms;
    viewport.tick(now);
    ASSERT_GT(viewport.translation(), 0.0f);

    viewport.scrollToItem(0);
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
    EXPECT_FALSE(viewport.animation().has_value());

    now += 10ms;
    EXPECT_FALSE(viewport.tick(now));
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
}

TEST(ScrollViewport, OutOfRangeJumpIsIgnored)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(30.0f);

    viewport.scrollToItem(5);
    viewport.scrollToItem(-1);
    EXPECT_FLOAT_EQ(viewport.translation(), 30.0f);

    viewport.scrollToItem(2);
    EXPECT_FLOAT_EQ(viewport.translation(), 80.0f);
}

TEST(ScrollViewport, WheelAnimatesToClampedOffset)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(0.0f);
    auto now = Viewport::Clock::time_point{} + 1s;

    EXPECT_FALSE(viewport.handleInput(InputEvent::wheelLines(-1.0f), std::nullopt, now));
    ASSERT_TRUE(viewport.handleInput(InputEvent::wheelLines(-1.0f), Point{1.0f, 1.0f}, now));
    ASSERT_TRUE(viewport.handleInput(InputEvent::wheelLines(-1.0f), Point{1.0f, 1.0f}, now));
    EXPECT_FLOAT_EQ(viewport.animation()->target, 160.0f);

    runAnimation(viewport, now);
    EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);
    EXPECT_FALSE(viewport.animation().has_value());
}

TEST(ScrollViewport, PageKeysUseViewportHeight)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5, 6, 7, 8}, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(0.0f);
    auto now = Viewport::Clock::time_point{} + 1s;

    viewport.handleInput(InputEvent::pageDown(), std::nullopt, now);
    runAnimation(viewport, now);
    EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);

    viewport.setNaturalScrolling(true);
    viewport.handleInput(InputEvent::pageDown(), std::nullopt, now);
    runAnimation(viewport, now);
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
}

TEST(ScrollViewport, StateSurvivesReorder)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3}, 10.0f), viewportBounds(100.0f));
    ItemState *first = &viewport.stateAt(0);
    ItemState *third = &viewport.stateAt(2);

    viewport.layout(items({3, 1, 2}, 10.0f), viewportBounds(100.0f));
    EXPECT_EQ(&viewport.stateAt(0), third);
    EXPECT_EQ(&viewport.stateAt(1), first);
    EXPECT_EQ(static_cast<CountingState &>(viewport.stateAt(1)).layouts, 2);
}

TEST(ScrollViewport, TranslationStaysClampedWhenContentShrinks)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));
    viewport.scrollTo(50.0f);
    viewport.layout(items({1, 2}, 40.0f), viewportBounds(100.0f));
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);

    viewport.scrollTo(-10.0f);
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
    viewport.scrollTo(1e6f);
    EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
}

TEST(ScrollViewport, NotifiesOncePerFrame)
{
    Viewport viewport;
    std::vector<ViewportSnapshot> seen;
    viewport.setScrollCallback([&](const ViewportSnapshot &snapshot) { seen.push_back(snapshot); });
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));

    viewport.scrollTo(10.0f);
    viewport.scrollBy(10.0f);
    EXPECT_TRUE(viewport.finishFrame());
    EXPECT_FALSE(viewport.finishFrame());

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_FLOAT_EQ(seen[0].translation, 20.0f);
    EXPECT_FLOAT_EQ(seen[0].contentBounds.height, 200.0f);
}

TEST(ScrollViewport, RedrawOnlyWhileAnimatingAndVisible)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), Rect{0.0f, 10.0f, 100.0f, 100.0f});
    Rect screen{0.0f, 0.0f, 200.0f, 200.0f};
    EXPECT_FALSE(viewport.needsRedraw(screen));

    auto now = Viewport::Clock::time_point{} + 1s;
    viewport.handleInput(InputEvent::pageDown(), std::nullopt, now);
    EXPECT_TRUE(viewport.needsRedraw(screen));
    EXPECT_FALSE(viewport.needsRedraw(Rect{0.0f, 150.0f, 200.0f, 50.0f}));
}

TEST(ScrollViewport, VisibleItemsAreOffsetByTranslation)
{
    Viewport viewport;
    viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), Rect{5.0f, 10.0f, 100.0f, 50.0f});
    viewport.scrollTo(30.0f);

    std::vector<std::size_t> indices;
    std::vector<float> tops;
    viewport.forEachVisible([&](std::size_t index, const Rect &bounds, ItemState &) {
        indices.push_back(index);
        tops.push_back(bounds.y);
    });

    std::vector<std::size_t> expectedIndices{0, 1};
    EXPECT_EQ(indices, expectedIndices);
    EXPECT_FLOAT_EQ(tops[0], -20.0f);
    EXPECT_FLOAT_EQ(tops[1], 20.0f);
}

TEST(ScrollViewport, RegistryReachesViewportById)
{
    ViewportRegistry registry;
    {
        Viewport viewport(registry, "main");
        viewport.layout(items({1, 2, 3, 4, 5}, 40.0f), viewportBounds(100.0f));

        EXPECT_TRUE(registry.scrollToItem("main", 3));
        EXPECT_FLOAT_EQ(viewport.translation(), 100.0f);
        EXPECT_TRUE(registry.snapToStart("main"));
        EXPECT_FLOAT_EQ(viewport.translation(), 0.0f);
        EXPECT_TRUE(registry.snapTo("main", 0.25f));
        EXPECT_FLOAT_EQ(viewport.translation(), 50.0f);
    }
    EXPECT_FALSE(registry.contains("main"));
}
