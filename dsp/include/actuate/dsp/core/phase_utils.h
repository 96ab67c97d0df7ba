// ==============================================================================
// Layer 0: Core Utility - Phase Accumulator Utilities
// ==============================================================================
// Phase accumulator and helpers shared by oscillators and LFOs.
//
// - PhaseAccumulator is a value type for lightweight composition.
// - Phase and increment use double precision so rounding error does not
//   accumulate over long notes.
// - Wrapping uses subtraction, not std::fmod.
// ==============================================================================

#pragma once

namespace Actuate {
namespace DSP {

/// @brief Calculate normalized phase increment from frequency and sample rate.
/// @return frequency / sampleRate, or 0.0 when sampleRate is 0
[[nodiscard]] constexpr double calculatePhaseIncrement(
    float frequency,
    float sampleRate
) noexcept {
    if (sampleRate == 0.0f) {
        return 0.0;
    }
    return static_cast<double>(frequency) / static_cast<double>(sampleRate);
}

/// @brief Wrap phase to [0, 1) range using subtraction.
///
/// @example
/// @code
/// double a = wrapPhase(1.3);   // returns 0.3
/// double b = wrapPhase(-0.2);  // returns 0.8
/// @endcode
[[nodiscard]] constexpr double wrapPhase(double phase) noexcept {
    while (phase >= 1.0) {
        phase -= 1.0;
    }
    while (phase < 0.0) {
        phase += 1.0;
    }
    return phase;
}

/// @brief Normalized phase accumulator.
struct PhaseAccumulator {
    double phase = 0.0;      ///< Current phase [0, 1)
    double increment = 0.0;  ///< Phase advance per sample

    /// @brief Advance by one sample.
    /// @return true if the phase wrapped
    [[nodiscard]] constexpr bool advance() noexcept {
        phase += increment;
        if (phase >= 1.0) {
            phase -= 1.0;
            if (phase >= 1.0) {
                phase = wrapPhase(phase);
            }
            return true;
        }
        return false;
    }

    constexpr void reset() noexcept {
        phase = 0.0;
    }

    constexpr void setFrequency(float frequency, float sampleRate) noexcept {
        increment = calculatePhaseIncrement(frequency, sampleRate);
    }
};

} // namespace DSP
} // namespace Actuate
