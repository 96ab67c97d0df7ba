// ==============================================================================
// Test Helper: Signal Metrics
// ==============================================================================
// Level, pitch and spectral measurements for verifying rendered audio.
//
// This is TEST INFRASTRUCTURE, not production DSP code.
//
// Location: tests/test_helpers/signal_metrics.h
// Namespace: Actuate::DSP::TestUtils::SignalMetrics
// ==============================================================================

#pragma once

#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Actuate {
namespace DSP {
namespace TestUtils {
namespace SignalMetrics {

// -----------------------------------------------------------------------------
// Level
// -----------------------------------------------------------------------------

[[nodiscard]] inline float peak(const float* signal, size_t n) noexcept {
    float p = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        p = std::max(p, std::abs(signal[i]));
    }
    return p;
}

[[nodiscard]] inline float rms(const float* signal, size_t n) noexcept {
    if (signal == nullptr || n == 0) return 0.0f;
    double sumSq = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sumSq += static_cast<double>(signal[i]) * static_cast<double>(signal[i]);
    }
    return static_cast<float>(std::sqrt(sumSq / static_cast<double>(n)));
}

[[nodiscard]] inline float rms(const std::vector<float>& signal) noexcept {
    return rms(signal.data(), signal.size());
}

[[nodiscard]] inline float peak(const std::vector<float>& signal) noexcept {
    return peak(signal.data(), signal.size());
}

[[nodiscard]] inline bool allFinite(const float* signal, size_t n) noexcept {
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(signal[i])) return false;
    }
    return true;
}

[[nodiscard]] inline bool isSilent(const float* signal, size_t n, float threshold = 1e-6f) noexcept {
    return peak(signal, n) <= threshold;
}

/// @brief Largest sample-to-sample step. Flags clicks and discontinuities.
[[nodiscard]] inline float maxStep(const float* signal, size_t n) noexcept {
    float step = 0.0f;
    for (size_t i = 1; i < n; ++i) {
        step = std::max(step, std::abs(signal[i] - signal[i - 1]));
    }
    return step;
}

// -----------------------------------------------------------------------------
// Pitch
// -----------------------------------------------------------------------------

/// @brief Fundamental estimate from rising zero crossings, interpolated to
/// sub-sample accuracy. Suited to signals with one crossing per cycle.
/// @return Frequency in Hz, or 0 with fewer than two crossings
[[nodiscard]] inline double zeroCrossingFrequency(const float* signal, size_t n,
                                                  double sampleRate) noexcept {
    double first = -1.0;
    double last = -1.0;
    size_t crossings = 0;
    for (size_t i = 1; i < n; ++i) {
        if (signal[i - 1] < 0.0f && signal[i] >= 0.0f) {
            const double frac = static_cast<double>(signal[i - 1]) /
                                static_cast<double>(signal[i - 1] - signal[i]);
            const double position = static_cast<double>(i - 1) + frac;
            if (first < 0.0) first = position;
            last = position;
            ++crossings;
        }
    }
    if (crossings < 2) return 0.0;
    return sampleRate * static_cast<double>(crossings - 1) / (last - first);
}

/// @brief Magnitude of a single frequency bin (Goertzel), normalized so a
/// full-scale sine at that frequency reads close to 1.
[[nodiscard]] inline double goertzelMagnitude(const float* signal, size_t n,
                                              double frequencyHz, double sampleRate) noexcept {
    if (signal == nullptr || n == 0) return 0.0;
    const double omega = 2.0 * static_cast<double>(kPi) * frequencyHz / sampleRate;
    const double coeff = 2.0 * std::cos(omega);
    double s1 = 0.0;
    double s2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double s0 = static_cast<double>(signal[i]) + coeff * s1 - s2;
        s2 = s1;
        s1 = s0;
    }
    const double power = s1 * s1 + s2 * s2 - coeff * s1 * s2;
    return 2.0 * std::sqrt(std::max(0.0, power)) / static_cast<double>(n);
}

/// @brief Frequency with the largest Goertzel magnitude in [lowHz, highHz],
/// scanned in stepHz increments.
[[nodiscard]] inline double dominantFrequency(const float* signal, size_t n, double sampleRate,
                                              double lowHz, double highHz, double stepHz) noexcept {
    double best = lowHz;
    double bestMag = -1.0;
    for (double f = lowHz; f <= highHz; f += stepHz) {
        const double mag = goertzelMagnitude(signal, n, f, sampleRate);
        if (mag > bestMag) {
            bestMag = mag;
            best = f;
        }
    }
    return best;
}

} // namespace SignalMetrics
} // namespace TestUtils
} // namespace DSP
} // namespace Actuate
