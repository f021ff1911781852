#include "sc/scroll/scroll_animator.hpp"

#include <algorithm>

namespace sc::scroll
{

ScrollAnimator::ScrollAnimator(float rate) noexcept
    : rate_(rate > 0.0f ? rate : kDefaultRate)
{
}

void ScrollAnimator::setRate(float rate) noexcept
{
    if (rate > 0.0f)
        rate_ = rate;
}

void ScrollAnimator::request(float delta, float translation, Clock::time_point now)
{
    float target = animation_ ? animation_->target : translation;
    animation_ = Animation{translation, target + delta, 0.0f};
    lastFrame_ = now;
}

std::optional<float> ScrollAnimator::advance(Clock::time_point now, float maxTranslation)
{
    std::optional<float> result;
    if (animation_)
    {
        std::chrono::duration<float> elapsed = now - lastFrame_;
        Animation &anim = *animation_;
        anim.progress = std::clamp(anim.progress + elapsed.count() * rate_, 0.0f, 1.0f);

        float translation = anim.progress >= 1.0f ? anim.target
                                                  : anim.start + anim.progress * (anim.target - anim.start);
        result = std::clamp(translation, 0.0f, std::max(0.0f, maxTranslation));

        if (anim.progress >= 1.0f)
            animation_.reset();
    }
    lastFrame_ = now;
    return result;
}

void ScrollAnimator::shift(float delta) noexcept
{
    if (!animation_)
        return;
    animation_->start += delta;
    animation_->target += delta;
}

void ScrollAnimator::clampTo(float maxTranslation) noexcept
{
    if (!animation_)
        return;
    float upper = std::max(0.0f, maxTranslation);
    animation_->start = std::clamp(animation_->start, 0.0f, upper);
    animation_->target = std::clamp(animation_->target, 0.0f, upper);
}

} // namespace sc::scroll
