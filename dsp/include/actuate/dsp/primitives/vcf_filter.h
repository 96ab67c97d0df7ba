// ==============================================================================
// Layer 1: DSP Primitive - VCF (Ladder)
// ==============================================================================
// Moog-style 4-stage ladder in the musicdsp form:
//   y[i] = p * (x[i] + x[i]_prev) - k * y[i]
// with unit-delay resonance feedback and a cubic soft clip on the last stage.
// p and k come from a prewarped corner placed so the 4-pole -3 dB point lands
// on the cutoff. Input is scaled by (1 + r) to hold passband gain.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/primitives/one_pole.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Actuate {
namespace DSP {

/// sqrt(2^(1/4) - 1): -3 dB point of four identical poles, relative to the pole.
inline constexpr float kFourPoleCornerRatio = 0.43496553f;

/// @brief Cubic soft clip x - x^3/6, saturating at +/- 2*sqrt(2)/3 beyond sqrt(2).
[[nodiscard]] inline float cubicClip(float x) noexcept {
    constexpr float kKnee = 1.41421356f;
    constexpr float kCeiling = 0.94280904f;
    if (x > kKnee) return kCeiling;
    if (x < -kKnee) return -kCeiling;
    return x - (x * x * x) / 6.0f;
}

class VcfFilter {
public:
    static constexpr float kMaxFeedback = 3.6f;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = std::clamp(sampleRate, 8000.0, 384000.0);
        dirty_ = true;
        reset();
    }

    void reset() noexcept {
        y_.fill(0.0f);
        olds_.fill(0.0f);
    }

    void setCutoff(float hz) noexcept {
        const float clamped = clampCutoff(hz, sampleRate_);
        if (clamped != cutoff_) {
            cutoff_ = clamped;
            dirty_ = true;
        }
    }

    void setResonance(float amount) noexcept {
        const float clamped = detail::isNaN(amount) ? 0.0f : std::clamp(amount, 0.0f, 1.0f);
        if (clamped != resonance_) {
            resonance_ = clamped;
            dirty_ = true;
        }
    }

    [[nodiscard]] float getCutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float getResonance() const noexcept { return resonance_; }

    [[nodiscard]] FilterOutputs processSample(float input) noexcept {
        if (dirty_) {
            updateCoefficients();
        }
        if (detail::isNonFinite(input)) {
            reset();
            return {};
        }

        const float x = input * (1.0f + r_) - r_ * y_[3];

        y_[0] = x * p_ + olds_[0] * p_ - k_ * y_[0];
        y_[1] = y_[0] * p_ + olds_[1] * p_ - k_ * y_[1];
        y_[2] = y_[1] * p_ + olds_[2] * p_ - k_ * y_[2];
        y_[3] = y_[2] * p_ + olds_[3] * p_ - k_ * y_[3];
        y_[3] = cubicClip(y_[3]);

        olds_[0] = x;
        olds_[1] = y_[0];
        olds_[2] = y_[1];
        olds_[3] = y_[2];

        for (auto& stage : y_) {
            if (detail::isNonFinite(stage)) {
                reset();
                return {};
            }
            stage = std::clamp(detail::flushDenormal(stage), -kFilterStateLimit, kFilterStateLimit);
        }

        return {y_[3], y_[1] - y_[3], input - y_[3]};
    }

private:
    void updateCoefficients() noexcept {
        const float g = prewarpedGain(cutoff_, sampleRate_) / kFourPoleCornerRatio;
        k_ = (g - 1.0f) / (g + 1.0f);
        p_ = (k_ + 1.0f) * 0.5f;
        r_ = resonance_ * kMaxFeedback;
        dirty_ = false;
    }

    double sampleRate_ = 44100.0;
    float cutoff_ = 1000.0f;
    float resonance_ = 0.0f;
    bool dirty_ = true;

    float p_ = 0.0f;
    float k_ = 0.0f;
    float r_ = 0.0f;
    std::array<float, 4> y_{};
    std::array<float, 4> olds_{};
};

} // namespace DSP
} // namespace Actuate
