#pragma once

#include <algorithm>
#include <limits>

namespace sc::scroll
{

struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

struct Size
{
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const Size &other) const noexcept = default;
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    static Rect withSize(Size size) noexcept { return Rect{0.0f, 0.0f, size.width, size.height}; }

    float right() const noexcept { return x + width; }
    float bottom() const noexcept { return y + height; }
    Size size() const noexcept { return Size{width, height}; }

    bool contains(Point point) const noexcept
    {
        return point.x >= x && point.x < right() && point.y >= y && point.y < bottom();
    }

    bool intersects(const Rect &other) const noexcept
    {
        return x < other.right() && other.x < right() && y < other.bottom() && other.y < bottom();
    }

    Rect translated(float dx, float dy) const noexcept { return Rect{x + dx, y + dy, width, height}; }

    // Smallest rectangle covering both; an empty rectangle still contributes its origin.
    Rect united(const Rect &other) const noexcept
    {
        float left = std::min(x, other.x);
        float top = std::min(y, other.y);
        float r = std::max(right(), other.right());
        float b = std::max(bottom(), other.bottom());
        return Rect{left, top, r - left, b - top};
    }

    bool operator==(const Rect &other) const noexcept = default;
};

// Size constraints an item is measured against.
struct Limits
{
    Size min;
    Size max{std::numeric_limits<float>::infinity(), std::numeric_limits<float>::infinity()};

    Limits loose() const noexcept { return Limits{Size{}, max}; }

    Size clamp(Size size) const noexcept
    {
        return Size{std::clamp(size.width, min.width, std::max(min.width, max.width)),
                    std::clamp(size.height, min.height, std::max(min.height, max.height))};
    }
};

} // namespace sc::scroll
