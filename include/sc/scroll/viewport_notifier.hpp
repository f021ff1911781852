#pragma once

#include "sc/scroll/geometry.hpp"

#include <functional>
#include <utility>

namespace sc::scroll
{

struct ViewportSnapshot
{
    float translation = 0.0f;
    Rect bounds;
    Rect contentBounds;

    bool isAtTop() const noexcept;
    bool isAtBottom() const noexcept;
    // Offset as a fraction of the scrollable range; 0 when nothing can scroll.
    float relativeOffset() const noexcept;
};

// Emits at most one snapshot per frame, and only when the offset moved.
class ViewportNotifier
{
public:
    using Callback = std::function<void(const ViewportSnapshot &)>;

    void setCallback(Callback callback) { callback_ = std::move(callback); }

    void markScrolled() noexcept { dirtyScrolled_ = true; }

    // Ends the frame. Returns true if a notification was due.
    bool flush(const ViewportSnapshot &snapshot);

private:
    Callback callback_;
    bool dirtyScrolled_ = false;
    float frameStartTranslation_ = 0.0f;
};

} // namespace sc::scroll
