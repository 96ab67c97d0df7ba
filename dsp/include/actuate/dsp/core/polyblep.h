// ==============================================================================
// Layer 0: Core Utility - PolyBLEP Correction
// ==============================================================================
// Polynomial band-limited step corrections for sharp-edged oscillators.
// t is the normalized phase [0, 1), dt the phase increment per sample.
// ==============================================================================

#pragma once

namespace Actuate {
namespace DSP {

/// @brief 2-point PolyBLEP residual for a unit step at phase 0.
[[nodiscard]] constexpr float polyBlep(float t, float dt) noexcept {
    if (t < dt) {
        float x = t / dt;
        return -(x * x - 2.0f * x + 1.0f);
    }
    if (t > 1.0f - dt) {
        float x = (t - 1.0f) / dt;
        return x * x + 2.0f * x + 1.0f;
    }
    return 0.0f;
}

/// @brief 4-point (cubic B-spline) PolyBLEP residual for a unit step.
/// Wider kernel than polyBlep(), roughly 40 dB alias suppression.
[[nodiscard]] constexpr float polyBlep4(float t, float dt) noexcept {
    const float dt2 = 2.0f * dt;
    if (t < dt2) {
        float u = t / dt;
        if (u < 1.0f) {
            float u2 = u * u;
            float u3 = u2 * u;
            float u4 = u3 * u;
            return -0.5f + (3.0f * u4 - 8.0f * u3 + 16.0f * u) / 24.0f;
        }
        float v = 2.0f - u;
        float v2 = v * v;
        float v4 = v2 * v2;
        return -(v4 / 24.0f);
    }
    if (t > 1.0f - dt2) {
        float u = (1.0f - t) / dt;
        if (u < 1.0f) {
            float u2 = u * u;
            float u3 = u2 * u;
            float u4 = u3 * u;
            return 0.5f - (3.0f * u4 - 8.0f * u3 + 16.0f * u) / 24.0f;
        }
        float v = 2.0f - u;
        float v2 = v * v;
        float v4 = v2 * v2;
        return v4 / 24.0f;
    }
    return 0.0f;
}

} // namespace DSP
} // namespace Actuate
