#pragma once

#include "sc/scroll/geometry.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace sc::scroll
{

template <typename Key>
struct LayoutRecord
{
    Rect bounds;
    Key key;
};

template <typename Key>
using LayoutTable = std::vector<LayoutRecord<Key>>;

struct StackedLayout
{
    std::vector<Rect> bounds;
    Rect contentBounds;
};

// Measures one item; receives the item index and the limits it is laid out against.
using MeasureFn = std::function<Size(std::size_t, const Limits &)>;

// Limits for items of a viewport: loose width, unbounded height.
Limits itemLimits(Size viewport) noexcept;

// Stacks `count` items top to bottom. Each item is placed at the running content
// height; the content bounds are the union of all item bounds. Every item is laid
// out, including those far outside the visible area.
StackedLayout stackVertically(std::size_t count, const Limits &limits, const MeasureFn &measure);

} // namespace sc::scroll
