// Layer 0: Core Utility - Pitch Conversion
#pragma once

#include <actuate/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Actuate::DSP {

/// Convert semitones to playback rate ratio
/// +12 semitones = 2.0 (octave up), -12 = 0.5 (octave down), 0 = 1.0
[[nodiscard]] inline float semitonesToRatio(float semitones) noexcept {
    return std::pow(2.0f, semitones / 12.0f);
}

/// Convert playback rate ratio to semitones
/// @return Pitch offset in semitones, 0 for non-positive ratios
[[nodiscard]] inline float ratioToSemitones(float ratio) noexcept {
    if (ratio <= 0.0f) {
        return 0.0f;
    }
    return 12.0f * std::log2(ratio);
}

/// Convert a (fractional) MIDI note to frequency in Hz.
/// @param note MIDI note number, 69 = A4
/// @param tuningReference Frequency of A4 in Hz
[[nodiscard]] inline float midiNoteToFrequency(
    float note, float tuningReference = kDefaultTuningReference) noexcept {
    return tuningReference * std::pow(2.0f, (note - 69.0f) / 12.0f);
}

/// Convert frequency in Hz to a fractional MIDI note number.
/// @return MIDI note, or 0 for non-positive frequencies
[[nodiscard]] inline float frequencyToMidiNote(
    float hz, float tuningReference = kDefaultTuningReference) noexcept {
    if (hz <= 0.0f || tuningReference <= 0.0f) {
        return 0.0f;
    }
    return 69.0f + 12.0f * std::log2(hz / tuningReference);
}

} // namespace Actuate::DSP
