// Layer 0: Core Utilities - Stereo Utilities
//
// Pan laws, unison spread curves and mid/side width shared by the voice and
// mixer stages.
#pragma once

#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Actuate {
namespace DSP {

/// @brief How unison voices are distributed across the stereo field.
enum class StereoAlgorithm : uint8_t {
    Original = 0,   ///< Linear spread
    CubeSpread,     ///< Pushes inner voices outward (1 - (1 - x)^3)
    ExpSpread       ///< Exponential spread, inner voices stay near centre
};

inline constexpr uint8_t kStereoAlgorithmCount = 3;

/// @brief Equal-power gains for a pan position.
struct PanGains {
    float left = kInvSqrt2;
    float right = kInvSqrt2;
};

/// @brief Equal-power (cos/sin) pan law.
/// @param pan Position [-1 (left), +1 (right)], clamped
[[nodiscard]] inline PanGains equalPowerPan(float pan) noexcept {
    const float p = std::clamp(pan, -1.0f, 1.0f);
    const float angle = (p + 1.0f) * 0.25f * kPi;
    return {std::cos(angle), std::sin(angle)};
}

/// @brief Pan position for one voice of a unison group.
///
/// Voices are laid out evenly from left to right, then shaped by the
/// spread algorithm and scaled by width. A single voice sits in the centre.
///
/// @param unisonIndex Index of the voice within the group
/// @param unisonCount Number of voices in the group
/// @param width Stereo width [0, 1]
/// @return Pan position in [-1, 1]
[[nodiscard]] inline float unisonPanPosition(
    int unisonIndex, int unisonCount, float width, StereoAlgorithm algorithm) noexcept {
    if (unisonCount <= 1) {
        return 0.0f;
    }
    const float base = 2.0f * static_cast<float>(unisonIndex)
                     / static_cast<float>(unisonCount - 1) - 1.0f;
    const float magnitude = std::abs(base);
    float shaped = magnitude;
    switch (algorithm) {
        case StereoAlgorithm::Original:
            shaped = magnitude;
            break;
        case StereoAlgorithm::CubeSpread: {
            const float inv = 1.0f - magnitude;
            shaped = 1.0f - inv * inv * inv;
            break;
        }
        case StereoAlgorithm::ExpSpread:
            shaped = (std::exp(magnitude) - 1.0f) / (std::exp(1.0f) - 1.0f);
            break;
    }
    const float sign = (base < 0.0f) ? -1.0f : 1.0f;
    return std::clamp(sign * shaped * std::clamp(width, 0.0f, 1.0f), -1.0f, 1.0f);
}

/// @brief Mid/side stereo width. 0 = mono, 1 = unchanged, 2 = doubled side.
constexpr void applyStereoWidth(float& left, float& right, float width) noexcept {
    const float mid = (left + right) * 0.5f;
    const float side = (right - left) * 0.5f * width;
    left = mid - side;
    right = mid + side;
}

} // namespace DSP
} // namespace Actuate
