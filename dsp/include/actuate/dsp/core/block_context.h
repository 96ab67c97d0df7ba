// ==============================================================================
// Layer 0: Core Utility - BlockContext
// ==============================================================================
// Per-block processing context for DSP components.
// ==============================================================================

#pragma once

#include "note_value.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

/// @brief Minimum tempo in BPM (prevents division issues).
inline constexpr double kMinTempoBPM = 20.0;

/// @brief Maximum tempo in BPM.
inline constexpr double kMaxTempoBPM = 300.0;

/// @brief Host-provided information about the current processing block.
///
/// Used by tempo-synced components (delay, LFOs).
///
/// @note All member access is noexcept. No dynamic allocation.
struct BlockContext {
    double sampleRate = 44100.0;      ///< Sample rate in Hz
    size_t blockSize = 512;           ///< Block size in samples
    double tempoBPM = 120.0;          ///< Tempo in beats per minute
    bool isPlaying = false;           ///< Transport playing state
    int64_t transportPositionSamples = 0;  ///< Position from song start

    /// @brief Samples per beat, tempo clamped to [kMinTempoBPM, kMaxTempoBPM].
    [[nodiscard]] constexpr double samplesPerBeat() const noexcept {
        const double clampedTempo = std::clamp(tempoBPM, kMinTempoBPM, kMaxTempoBPM);
        return sampleRate * 60.0 / clampedTempo;
    }

    /// @brief Convert a note value to a duration in samples.
    [[nodiscard]] constexpr size_t tempoToSamples(
        NoteValue note, NoteModifier modifier = NoteModifier::None) const noexcept {
        const double beats = static_cast<double>(getBeatsForNote(note, modifier));
        return static_cast<size_t>(samplesPerBeat() * beats);
    }
};

} // namespace DSP
} // namespace Actuate
