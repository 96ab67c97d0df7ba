// ==============================================================================
// Layer 4: User Feature - Soft-Knee Limiter
// ==============================================================================
// Static soft-knee limiter. Below threshold + knee/2 the signal passes
// unchanged; above it the excess is compressed by a hyperbolic gain so the
// output approaches threshold + knee without reaching it:
//
//   soft = threshold + knee / 2
//   g    = 1 / (1 + (|x| - soft) / (knee / 2))
//   |x| > soft:  y = sign(x) * (soft + (knee / 2) * (1 - g))
//
// The curve has unity slope at the knee point, so it is continuous in both
// value and first derivative.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kLimiterMinKnee = 0.001f;

struct LimiterParams {
    float threshold = 0.5f;   ///< Linear threshold [0, 1]
    float knee = 0.5f;        ///< Knee width [0.001, 1]
};

class Limiter {
public:
    void prepare(double /*sampleRate*/) noexcept {
        prepared_ = true;
        updateCoefficients();
    }

    void reset() noexcept {}

    void setParams(const LimiterParams& params) noexcept {
        params_.threshold = std::clamp(params.threshold, 0.0f, 1.0f);
        params_.knee = std::clamp(params.knee, kLimiterMinKnee, 1.0f);
        updateCoefficients();
    }

    /// @brief Level above which the curve bends.
    [[nodiscard]] float softThreshold() const noexcept { return softThreshold_; }

    /// @brief Asymptotic output ceiling, threshold + knee.
    [[nodiscard]] float ceiling() const noexcept { return softThreshold_ + halfKnee_; }

    [[nodiscard]] float processSample(float x) const noexcept {
        if (detail::isNonFinite(x)) return 0.0f;
        const float magnitude = std::abs(x);
        if (magnitude <= softThreshold_) return x;
        const float gain = 1.0f / (1.0f + (magnitude - softThreshold_) / halfKnee_);
        return std::copysign(softThreshold_ + halfKnee_ * (1.0f - gain), x);
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        left = processSample(left);
        right = processSample(right);
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    void updateCoefficients() noexcept {
        halfKnee_ = params_.knee * 0.5f;
        softThreshold_ = params_.threshold + halfKnee_;
    }

    LimiterParams params_;
    float halfKnee_ = 0.25f;
    float softThreshold_ = 0.75f;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
