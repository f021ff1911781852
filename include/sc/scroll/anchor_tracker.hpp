#pragma once

#include "sc/scroll/geometry.hpp"
#include "sc/scroll/layout_engine.hpp"

#include <cstddef>
#include <optional>

namespace sc::scroll
{

// Tolerance for "at top" / "at bottom" comparisons.
inline constexpr float kEdgeTolerance = 0.01f;

float maxTranslation(const Rect &bounds, const Rect &contentBounds) noexcept;
float clampTranslation(float translation, const Rect &bounds, const Rect &contentBounds) noexcept;

bool isAtTop(float translation) noexcept;
bool isAtBottom(float translation, const Rect &bounds, const Rect &contentBounds) noexcept;

struct AnchorResult
{
    float translation = 0.0f;
    // Offset applied by anchor preservation; zero when sticking to the bottom.
    float shift = 0.0f;
    bool stuckToBottom = false;
};

// Index of the first record whose vertical span contains `translation`.
template <typename Key>
std::optional<std::size_t> anchorIndex(const LayoutTable<Key> &table, float translation)
{
    for (std::size_t i = 0; i < table.size(); ++i)
    {
        const Rect &bounds = table[i].bounds;
        if (bounds.y <= translation && translation < bounds.bottom())
            return i;
    }
    return std::nullopt;
}

// Re-derives the scroll offset after a layout pass.
//
// A viewport that was at the bottom of the previous content sticks to the new
// bottom. Otherwise the item under the previous offset is looked up by key in the
// new table (or by index if it is gone) and the offset moves with it, so the
// visible content stays put. The result is clamped to the new scrollable range.
template <typename Key>
AnchorResult trackAnchor(float translation, const Rect &previousBounds, const Rect &previousContent,
                         const LayoutTable<Key> &previousTable, const Rect &bounds, const Rect &contentBounds,
                         const LayoutTable<Key> &table)
{
    AnchorResult result;
    result.translation = translation;

    if (isAtBottom(translation, previousBounds, previousContent))
    {
        result.stuckToBottom = true;
        result.translation = contentBounds.height - bounds.height;
    }
    else if (auto index = anchorIndex(previousTable, translation))
    {
        const LayoutRecord<Key> &anchor = previousTable[*index];
        std::optional<std::size_t> moved;
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            if (table[i].key == anchor.key)
            {
                moved = i;
                break;
            }
        }
        if (!moved && *index < table.size())
            moved = *index;
        if (moved)
        {
            result.shift = table[*moved].bounds.y - anchor.bounds.y;
            result.translation = translation + result.shift;
        }
    }

    result.translation = clampTranslation(result.translation, bounds, contentBounds);
    return result;
}

} // namespace sc::scroll
