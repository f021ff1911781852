#include "sc/scroll/anchor_tracker.hpp"

#include <algorithm>
#include <cmath>

namespace sc::scroll
{

float maxTranslation(const Rect &bounds, const Rect &contentBounds) noexcept
{
    return std::max(0.0f, contentBounds.height - bounds.height);
}

float clampTranslation(float translation, const Rect &bounds, const Rect &contentBounds) noexcept
{
    return std::clamp(translation, 0.0f, maxTranslation(bounds, contentBounds));
}

bool isAtTop(float translation) noexcept
{
    return std::fabs(translation) < kEdgeTolerance;
}

// Content shorter than the viewport counts as being at the bottom.
bool isAtBottom(float translation, const Rect &bounds, const Rect &contentBounds) noexcept
{
    return std::fabs(translation - maxTranslation(bounds, contentBounds)) < kEdgeTolerance;
}

} // namespace sc::scroll
