#include "sc/scroll/viewport_notifier.hpp"

#include "sc/scroll/anchor_tracker.hpp"

namespace sc::scroll
{

bool ViewportSnapshot::isAtTop() const noexcept
{
    return scroll::isAtTop(translation);
}

bool ViewportSnapshot::isAtBottom() const noexcept
{
    return scroll::isAtBottom(translation, bounds, contentBounds);
}

float ViewportSnapshot::relativeOffset() const noexcept
{
    float range = maxTranslation(bounds, contentBounds);
    if (range <= 0.0f)
        return 0.0f;
    return translation / range;
}

bool ViewportNotifier::flush(const ViewportSnapshot &snapshot)
{
    bool changed = dirtyScrolled_ && snapshot.translation != frameStartTranslation_;
    dirtyScrolled_ = false;
    frameStartTranslation_ = snapshot.translation;
    if (!changed)
        return false;
    if (callback_)
        callback_(snapshot);
    return true;
}

} // namespace sc::scroll
