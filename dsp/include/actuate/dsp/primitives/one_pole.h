// ==============================================================================
// Layer 1: DSP Primitive - One-Pole Stages
// ==============================================================================
// Topology-preserving (trapezoidal) one-pole lowpass, the building block of
// the Tilt, VCF, V4 and A4I filters, plus the cutoff tuning helper those
// cascades use so their -3 dB point lands on the requested cutoff.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>

namespace Actuate {
namespace DSP {

/// @brief Clamp a cutoff to [20 Hz, min(20 kHz, 0.45 * sampleRate)].
[[nodiscard]] inline float clampCutoff(float hz, double sampleRate) noexcept {
    const float ceiling = std::min(kMaxFilterCutoffHz,
                                   static_cast<float>(sampleRate) * kMaxFilterCutoffRatio);
    if (detail::isNaN(hz)) {
        return ceiling;
    }
    return std::clamp(hz, kMinFilterCutoffHz, ceiling);
}

/// @brief Prewarped integrator gain g = tan(pi * f / fs).
[[nodiscard]] inline float prewarpedGain(float hz, double sampleRate) noexcept {
    const double nyquistGuard = 0.49 * sampleRate;
    const double f = std::clamp(static_cast<double>(hz), 1.0, nyquistGuard);
    return static_cast<float>(std::tan(3.14159265358979323846 * f / sampleRate));
}

/// @brief Trapezoidal one-pole lowpass. Highpass is input - lowpass.
struct TptOnePole {
    float g = 0.0f;      ///< Prewarped gain
    float G = 0.0f;      ///< g / (1 + g)
    float s = 0.0f;      ///< Integrator state

    void setGain(float prewarped) noexcept {
        g = prewarped;
        G = g / (1.0f + g);
    }

    [[nodiscard]] float process(float x) noexcept {
        const float v = (x - s) * G;
        const float y = v + s;
        s = std::clamp(detail::flushDenormal(y + v), -kFilterStateLimit, kFilterStateLimit);
        return y;
    }

    void reset() noexcept { s = 0.0f; }
};

namespace detail {

/// @brief Find the base frequency that puts a cascade's -3 dB point on cutoff.
///
/// gainAt(baseHz, warpedHz) must return the analog-prototype magnitude of
/// the cascade at the prewarped cutoff. Magnitude must increase with
/// baseHz. Bisection, 32 steps, no allocation.
template <typename GainFn>
[[nodiscard]] float solveBaseFrequency(float cutoffHz, double sampleRate, GainFn&& gainAt) noexcept {
    constexpr float kTarget = 0.70710678f;
    const float warped = prewarpedGain(cutoffHz, sampleRate);
    float lo = cutoffHz * 0.5f;
    float hi = static_cast<float>(sampleRate) * 0.49f;
    if (gainAt(hi, warped) <= kTarget) {
        return hi;
    }
    for (int i = 0; i < 32; ++i) {
        const float mid = 0.5f * (lo + hi);
        if (gainAt(mid, warped) < kTarget) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5f * (lo + hi);
}

/// Magnitude of an analog one-pole with warped corner g at warped frequency w.
[[nodiscard]] inline float onePoleMagnitude(float g, float w) noexcept {
    const float r = w / g;
    return 1.0f / std::sqrt(1.0f + r * r);
}

} // namespace detail

} // namespace DSP
} // namespace Actuate
