#include <gtest/gtest.h>

#include "sc/scroll/viewport_notifier.hpp"
#include "sc/scroll/viewport_registry.hpp"

#include <optional>
#include <string>
#include <vector>

using sc::scroll::Rect;
using sc::scroll::ScrollTarget;
using sc::scroll::ViewportNotifier;
using sc::scroll::ViewportRegistration;
using sc::scroll::ViewportRegistry;
using sc::scroll::ViewportSnapshot;

namespace
{

class RecordingTarget : public ScrollTarget
{
public:
    void scrollToItem(std::ptrdiff_t index) override { calls.push_back("item:" + std::to_string(index)); }
    void snapTo(float fraction) override { calls.push_back("snap:" + std::to_string(static_cast<int>(fraction * 100))); }
    void scrollTo(float offset) override { calls.push_back("to:" + std::to_string(static_cast<int>(offset))); }
    void scrollBy(float delta) override { calls.push_back("by:" + std::to_string(static_cast<int>(delta))); }

    std::vector<std::string> calls;
};

} // namespace

TEST(ViewportRegistry, DispatchesToRegisteredTarget)
{
    ViewportRegistry registry;
    RecordingTarget target;
    ViewportRegistration registration(registry, "transcript", target);

    EXPECT_TRUE(registry.contains("transcript"));
    EXPECT_TRUE(registry.scrollToItem("transcript", 4));
    EXPECT_TRUE(registry.snapToEnd("transcript"));
    EXPECT_TRUE(registry.snapToStart("transcript"));
    EXPECT_TRUE(registry.scrollTo("transcript", 12.0f));
    EXPECT_TRUE(registry.scrollBy("transcript", -3.0f));

    std::vector<std::string> expected{"item:4", "snap:100", "snap:0", "to:12", "by:-3"};
    EXPECT_EQ(target.calls, expected);
}

TEST(ViewportRegistry, UnknownIdIsReportedNotApplied)
{
    ViewportRegistry registry;
    RecordingTarget target;
    ViewportRegistration registration(registry, "a", target);

    EXPECT_FALSE(registry.scrollToItem("b", 0));
    EXPECT_FALSE(registry.snapTo("b", 0.5f));
    EXPECT_TRUE(target.calls.empty());
}

TEST(ViewportRegistry, RegistrationDetachesOnDestruction)
{
    ViewportRegistry registry;
    RecordingTarget target;
    {
        ViewportRegistration registration(registry, "scoped", target);
        EXPECT_EQ(registry.size(), 1u);
        EXPECT_TRUE(registry.contains("scoped"));
    }
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.scrollBy("scoped", 1.0f));
}

TEST(ViewportRegistry, StaleRegistrationDoesNotRemoveReplacement)
{
    ViewportRegistry registry;
    RecordingTarget first;
    RecordingTarget second;
    std::optional<ViewportRegistration> old;
    old.emplace(registry, "shared", first);
    ViewportRegistration current(registry, "shared", second);
    old.reset();

    EXPECT_EQ(registry.find("shared"), &second);
    EXPECT_TRUE(registry.scrollToItem("shared", 1));
    EXPECT_TRUE(first.calls.empty());
    EXPECT_EQ(second.calls.size(), 1u);
}

TEST(ViewportNotifier, FiresOncePerFrameWhenOffsetMoved)
{
    ViewportNotifier notifier;
    std::vector<float> seen;
    notifier.setCallback([&](const ViewportSnapshot &snapshot) { seen.push_back(snapshot.translation); });

    Rect bounds{0.0f, 0.0f, 10.0f, 10.0f};
    Rect content{0.0f, 0.0f, 10.0f, 50.0f};

    EXPECT_FALSE(notifier.flush({0.0f, bounds, content}));

    notifier.markScrolled();
    notifier.markScrolled();
    EXPECT_TRUE(notifier.flush({20.0f, bounds, content}));
    EXPECT_FALSE(notifier.flush({20.0f, bounds, content}));

    // Moved away and back within one frame.
    notifier.markScrolled();
    EXPECT_FALSE(notifier.flush({20.0f, bounds, content}));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_FLOAT_EQ(seen[0], 20.0f);
}

TEST(ViewportNotifier, SnapshotReportsEdgesAndRelativeOffset)
{
    Rect bounds{0.0f, 0.0f, 10.0f, 10.0f};
    ViewportSnapshot middle{20.0f, bounds, Rect{0.0f, 0.0f, 10.0f, 50.0f}};
    EXPECT_FALSE(middle.isAtTop());
    EXPECT_FALSE(middle.isAtBottom());
    EXPECT_FLOAT_EQ(middle.relativeOffset(), 0.5f);

    ViewportSnapshot bottom{40.0f, bounds, Rect{0.0f, 0.0f, 10.0f, 50.0f}};
    EXPECT_TRUE(bottom.isAtBottom());
    EXPECT_FLOAT_EQ(bottom.relativeOffset(), 1.0f);

    ViewportSnapshot shortContent{0.0f, bounds, Rect{0.0f, 0.0f, 10.0f, 4.0f}};
    EXPECT_TRUE(shortContent.isAtTop());
    EXPECT_TRUE(shortContent.isAtBottom());
    EXPECT_FLOAT_EQ(shortContent.relativeOffset(), 0.0f);
}
