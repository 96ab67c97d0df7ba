// ==============================================================================
// Layer 1: DSP Primitive - DC Blocker
// ==============================================================================
// First-order DC blocking highpass for feedback loops and asymmetric
// waveshapers (saturation, A-bass, reverb tank).
//
// Transfer function: H(z) = (1 - z^-1) / (1 - R*z^-1)
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

/// @brief Lightweight 1st-order DC blocking filter.
///
/// Difference equation: y[n] = x[n] - x[n-1] + R * y[n-1]
///
/// @par Usage Example
/// @code
/// DCBlocker blocker;
/// blocker.prepare(44100.0, 10.0f);
/// float output = blocker.process(input);
/// @endcode
class DCBlocker {
public:
    DCBlocker() noexcept = default;

    /// @brief Compute R = exp(-2*pi*cutoffHz/sampleRate) and clear state.
    /// @param sampleRate Sample rate in Hz (clamped to >= 1000)
    /// @param cutoffHz Cutoff in Hz (clamped to [1, sampleRate/4])
    void prepare(double sampleRate, float cutoffHz = 10.0f) noexcept {
        sampleRate_ = std::max(1000.0, sampleRate);
        cutoffHz_ = std::clamp(cutoffHz, 1.0f, static_cast<float>(sampleRate_ * 0.25));
        updateCoefficient();
        prepared_ = true;
        reset();
    }

    void reset() noexcept {
        x1_ = 0.0f;
        y1_ = 0.0f;
    }

    void setCutoff(float cutoffHz) noexcept {
        if (!prepared_) return;
        cutoffHz_ = std::clamp(cutoffHz, 1.0f, static_cast<float>(sampleRate_ * 0.25));
        updateCoefficient();
    }

    /// @brief Process a single sample. Returns input unchanged if unprepared.
    [[nodiscard]] float process(float x) noexcept {
        if (!prepared_) return x;
        if (detail::isNonFinite(x)) {
            reset();
            return 0.0f;
        }

        const float y = x - x1_ + R_ * y1_;
        x1_ = x;
        y1_ = detail::flushDenormal(y);
        return y;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

private:
    void updateCoefficient() noexcept {
        const double r = std::exp(-static_cast<double>(kTwoPi) *
                                  static_cast<double>(cutoffHz_) / sampleRate_);
        R_ = std::clamp(static_cast<float>(r), 0.9f, 0.9999f);
    }

    float R_ = 0.0f;
    float x1_ = 0.0f;
    float y1_ = 0.0f;
    bool prepared_ = false;
    double sampleRate_ = 0.0;
    float cutoffHz_ = 10.0f;
};

} // namespace DSP
} // namespace Actuate
