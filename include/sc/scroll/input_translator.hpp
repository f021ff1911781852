#pragma once

#include "sc/scroll/geometry.hpp"

#include <optional>

namespace sc::scroll
{

// Distance scrolled by one line-based wheel step.
inline constexpr float kLineScrollDistance = 80.0f;

enum class InputKind
{
    WheelLines,
    WheelPixels,
    PageUp,
    PageDown,
    Other
};

struct InputEvent
{
    InputKind kind = InputKind::Other;
    // Wheel magnitude; positive values scroll towards the top.
    float y = 0.0f;

    static InputEvent wheelLines(float y) noexcept { return InputEvent{InputKind::WheelLines, y}; }
    static InputEvent wheelPixels(float y) noexcept { return InputEvent{InputKind::WheelPixels, y}; }
    static InputEvent pageUp() noexcept { return InputEvent{InputKind::PageUp, 0.0f}; }
    static InputEvent pageDown() noexcept { return InputEvent{InputKind::PageDown, 0.0f}; }
};

struct InputContext
{
    Rect bounds;
    std::optional<Point> pointer;
    bool naturalScrolling = false;
};

// Maps one event to a scroll delta, or nothing if the viewport does not act on it.
// Wheel events only count while the pointer is over the viewport; page keys
// always do.
std::optional<float> translateInput(const InputEvent &event, const InputContext &context) noexcept;

} // namespace sc::scroll
