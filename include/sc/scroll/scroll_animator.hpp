#pragma once

#include <chrono>
#include <optional>

namespace sc::scroll
{

struct Animation
{
    float start = 0.0f;
    float target = 0.0f;
    float progress = 0.0f;
};

// Turns scroll deltas into an offset interpolated over successive redraw ticks.
class ScrollAnimator
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr float kDefaultRate = 30.0f;

    explicit ScrollAnimator(float rate = kDefaultRate) noexcept;

    float rate() const noexcept { return rate_; }
    void setRate(float rate) noexcept;

    bool animating() const noexcept { return animation_.has_value(); }
    const std::optional<Animation> &animation() const noexcept { return animation_; }

    // Starts an animation from `translation`, or extends the running one so that
    // repeated wheel ticks add up instead of restarting.
    void request(float delta, float translation, Clock::time_point now);

    // Steps the running animation to `now`. Returns the new offset, clamped to
    // [0, maxTranslation], or nothing when idle.
    std::optional<float> advance(Clock::time_point now, float maxTranslation);

    void shift(float delta) noexcept;
    void clampTo(float maxTranslation) noexcept;
    void cancel() noexcept { animation_.reset(); }

private:
    float rate_;
    std::optional<Animation> animation_;
    Clock::time_point lastFrame_{};
};

} // namespace sc::scroll
