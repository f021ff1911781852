#include "sc/scroll/input_translator.hpp"

namespace sc::scroll
{

std::optional<float> translateInput(const InputEvent &event, const InputContext &context) noexcept
{
    bool pointerInside = context.pointer && context.bounds.contains(*context.pointer);

    std::optional<float> delta;
    switch (event.kind)
    {
    case InputKind::WheelLines:
        if (pointerInside)
            delta = -event.y * kLineScrollDistance;
        break;
    case InputKind::WheelPixels:
        if (pointerInside)
            delta = -event.y;
        break;
    case InputKind::PageDown:
        delta = context.bounds.height;
        break;
    case InputKind::PageUp:
        delta = -context.bounds.height;
        break;
    case InputKind::Other:
        break;
    }

    if (delta && context.naturalScrolling)
        *delta = -*delta;
    return delta;
}

} // namespace sc::scroll
