#include "sc/scroll/layout_engine.hpp"

#include <limits>

namespace sc::scroll
{

Limits itemLimits(Size viewport) noexcept
{
    Limits limits;
    limits.min = Size{};
    limits.max = Size{viewport.width, std::numeric_limits<float>::infinity()};
    return limits.loose();
}

StackedLayout stackVertically(std::size_t count, const Limits &limits, const MeasureFn &measure)
{
    StackedLayout result;
    result.bounds.reserve(count);
    result.contentBounds = Rect::withSize(Size{});

    for (std::size_t i = 0; i < count; ++i)
    {
        Size size = limits.clamp(measure(i, limits));
        Rect placed = Rect::withSize(size).translated(0.0f, result.contentBounds.height);
        result.contentBounds = result.contentBounds.united(placed);
        result.bounds.push_back(placed);
    }

    return result;
}

} // namespace sc::scroll
