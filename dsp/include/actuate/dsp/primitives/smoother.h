// ==============================================================================
// Layer 1: DSP Primitive - Parameter Smoother
// ==============================================================================
// Real-time safe parameter interpolation.
// - OnePoleSmoother: exponential approach for gains, cutoff and mix levels
// - LinearRamp: constant rate, used for fades
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>

#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Default smoothing time in milliseconds
inline constexpr float kDefaultSmoothingTimeMs = 5.0f;

/// Threshold for detecting smoothing completion
inline constexpr float kCompletionThreshold = 0.0001f;

inline constexpr float kMinSmoothingTimeMs = 0.1f;
inline constexpr float kMaxSmoothingTimeMs = 1000.0f;

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief One-pole coefficient for a time to reach 99% of the target.
/// coeff = exp(-5000 / (smoothTimeMs * sampleRate))
[[nodiscard]] inline float calculateOnePoleCoefficient(float smoothTimeMs,
                                                       float sampleRate) noexcept {
    const float clampedTime = (smoothTimeMs < kMinSmoothingTimeMs) ? kMinSmoothingTimeMs
                            : (smoothTimeMs > kMaxSmoothingTimeMs) ? kMaxSmoothingTimeMs
                            : smoothTimeMs;
    if (sampleRate <= 0.0f) {
        return 0.0f;
    }
    return std::exp(-5000.0f / (clampedTime * sampleRate));
}

/// @brief Per-sample increment covering delta in rampTimeMs.
[[nodiscard]] constexpr float calculateLinearIncrement(float delta, float rampTimeMs,
                                                       float sampleRate) noexcept {
    if (rampTimeMs <= 0.0f) return delta;
    const float numSamples = rampTimeMs * 0.001f * sampleRate;
    return (numSamples > 0.0f) ? delta / numSamples : delta;
}

// =============================================================================
// OnePoleSmoother
// =============================================================================

/// @brief Exponential smoothing: output = target + coeff * (output - target)
class OnePoleSmoother {
public:
    OnePoleSmoother() noexcept {
        coefficient_ = calculateOnePoleCoefficient(timeMs_, sampleRate_);
    }

    explicit OnePoleSmoother(float initialValue) noexcept
        : current_(initialValue)
        , target_(initialValue) {
        coefficient_ = calculateOnePoleCoefficient(timeMs_, sampleRate_);
    }

    void configure(float smoothTimeMs, float sampleRate) noexcept {
        timeMs_ = smoothTimeMs;
        sampleRate_ = sampleRate;
        coefficient_ = calculateOnePoleCoefficient(timeMs_, sampleRate_);
    }

    /// @brief Set the target value. NaN snaps to 0, infinity is clamped.
    ACTUATE_NOINLINE void setTarget(float target) noexcept {
        if (detail::isNaN(target)) {
            target_ = 0.0f;
            current_ = 0.0f;
            return;
        }
        if (detail::isInf(target)) {
            target_ = (target > 0.0f) ? 1e10f : -1e10f;
            return;
        }
        target_ = target;
    }

    [[nodiscard]] float getTarget() const noexcept { return target_; }
    [[nodiscard]] float getCurrentValue() const noexcept { return current_; }

    [[nodiscard]] float process() noexcept {
        if (std::abs(current_ - target_) < kCompletionThreshold) {
            current_ = target_;
            return current_;
        }
        current_ = target_ + coefficient_ * (current_ - target_);
        current_ = detail::flushDenormal(current_);
        return current_;
    }

    /// @brief Advance numSamples steps, returning the final value.
    float advance(size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples && !isComplete(); ++i) {
            (void)process();
        }
        if (isComplete()) {
            current_ = target_;
        }
        return current_;
    }

    [[nodiscard]] bool isComplete() const noexcept {
        return std::abs(current_ - target_) < kCompletionThreshold;
    }

    void snapToTarget() noexcept { current_ = target_; }

    void snapTo(float value) noexcept {
        if (detail::isNaN(value)) {
            value = 0.0f;
        }
        if (detail::isInf(value)) {
            value = (value > 0.0f) ? 1e10f : -1e10f;
        }
        current_ = value;
        target_ = value;
    }

    void reset() noexcept {
        current_ = 0.0f;
        target_ = 0.0f;
    }

private:
    float coefficient_ = 0.0f;
    float current_ = 0.0f;
    float target_ = 0.0f;
    float timeMs_ = kDefaultSmoothingTimeMs;
    float sampleRate_ = 44100.0f;
};

// =============================================================================
// LinearRamp
// =============================================================================

/// @brief Constant-rate transitions with a predictable duration.
class LinearRamp {
public:
    LinearRamp() noexcept = default;

    explicit LinearRamp(float initialValue) noexcept
        : current_(initialValue)
        , target_(initialValue) {}

    void configure(float rampTimeMs, float sampleRate) noexcept {
        rampTimeMs_ = rampTimeMs;
        sampleRate_ = sampleRate;
        if (current_ != target_) {
            increment_ = calculateLinearIncrement(target_ - current_, rampTimeMs_, sampleRate_);
        }
    }

    ACTUATE_NOINLINE void setTarget(float target) noexcept {
        if (detail::isNaN(target)) {
            target_ = 0.0f;
            current_ = 0.0f;
            increment_ = 0.0f;
            return;
        }
        if (detail::isInf(target)) {
            target = (target > 0.0f) ? 1e10f : -1e10f;
        }
        target_ = target;
        increment_ = calculateLinearIncrement(target_ - current_, rampTimeMs_, sampleRate_);
    }

    [[nodiscard]] float getTarget() const noexcept { return target_; }
    [[nodiscard]] float getCurrentValue() const noexcept { return current_; }

    [[nodiscard]] float process() noexcept {
        if (current_ == target_) {
            return current_;
        }
        current_ += increment_;
        if ((increment_ > 0.0f && current_ > target_) ||
            (increment_ < 0.0f && current_ < target_)) {
            current_ = target_;
        }
        current_ = detail::flushDenormal(current_);
        return current_;
    }

    [[nodiscard]] bool isComplete() const noexcept { return current_ == target_; }

    void snapTo(float value) noexcept {
        current_ = detail::isNonFinite(value) ? 0.0f : value;
        target_ = current_;
        increment_ = 0.0f;
    }

    void reset() noexcept {
        current_ = 0.0f;
        target_ = 0.0f;
        increment_ = 0.0f;
    }

private:
    float increment_ = 0.0f;
    float current_ = 0.0f;
    float target_ = 0.0f;
    float rampTimeMs_ = kDefaultSmoothingTimeMs;
    float sampleRate_ = 44100.0f;
};

} // namespace DSP
} // namespace Actuate
