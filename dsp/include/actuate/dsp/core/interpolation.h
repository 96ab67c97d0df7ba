// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Sample-domain interpolation used by sample playback and delay lines.
// ==============================================================================

#pragma once

namespace Actuate {
namespace DSP {
namespace Interpolation {

/// @brief Linear interpolation between two samples.
/// @formula y = y0 + t * (y1 - y0)
[[nodiscard]] constexpr float linearInterpolate(
    float y0,
    float y1,
    float t
) noexcept {
    return y0 + t * (y1 - y0);
}

/// @brief Cubic Hermite (Catmull-Rom) interpolation using 4 samples.
///
/// @param ym1 Sample at position -1
/// @param y0 Sample at position 0
/// @param y1 Sample at position 1
/// @param y2 Sample at position 2
/// @param t Fractional position in [0, 1] between y0 and y1
///
/// @note Returns y0 when t=0, y1 when t=1
[[nodiscard]] constexpr float cubicHermiteInterpolate(
    float ym1,
    float y0,
    float y1,
    float y2,
    float t
) noexcept {
    const float c0 = y0;
    const float c1 = 0.5f * (y1 - ym1);
    const float c2 = ym1 - 2.5f * y0 + 2.0f * y1 - 0.5f * y2;
    const float c3 = 0.5f * (y2 - ym1) + 1.5f * (y0 - y1);
    return ((c3 * t + c2) * t + c1) * t + c0;
}

} // namespace Interpolation
} // namespace DSP
} // namespace Actuate
