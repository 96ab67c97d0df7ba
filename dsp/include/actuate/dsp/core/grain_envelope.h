// Layer 0: Core Utility - Grain Envelope
#pragma once

#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Actuate::DSP {

namespace GrainEnvelope {

/// Gain of a grain window at an integer position: flat top with
/// raised-cosine edges.
///
/// The fade-out of one grain and the fade-in of the next sum to exactly 1
/// when they overlap by fadeLength samples.
///
/// @param position Sample index inside the grain [0, length)
/// @param length Grain length in samples
/// @param fadeLength Edge fade length in samples (clamped to length / 2)
[[nodiscard]] inline float gainAt(size_t position, size_t length, size_t fadeLength) noexcept {
    if (length == 0 || position >= length) {
        return 0.0f;
    }

    const size_t fade = std::min(fadeLength, length / 2);
    if (fade == 0) {
        return 1.0f;
    }

    // Fade positions are sampled at half-sample offsets so that an overlap of
    // exactly `fade` samples yields complementary gains.
    float x = 1.0f;
    if (position < fade) {
        x = (static_cast<float>(position) + 0.5f) / static_cast<float>(fade);
    } else if (position >= length - fade) {
        x = (static_cast<float>(length - position) - 0.5f) / static_cast<float>(fade);
    } else {
        return 1.0f;
    }
    return 0.5f - 0.5f * std::cos(kPi * x);
}

}  // namespace GrainEnvelope

}  // namespace Actuate::DSP
