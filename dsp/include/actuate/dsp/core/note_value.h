// ==============================================================================
// Layer 0: Core Utility - Note Value Enums
// ==============================================================================
// Musical note values for tempo-synced LFOs and delay times.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Musical note divisions for tempo sync, longest first.
enum class NoteValue : uint8_t {
    Quad = 0,        ///< 4 bars (16 beats at 4/4)
    Double,          ///< 2 bars
    Whole,           ///< 1/1 note (4 beats)
    Half,            ///< 1/2 note
    Quarter,         ///< 1/4 note (1 beat)
    Eighth,          ///< 1/8 note
    Sixteenth,       ///< 1/16 note
    ThirtySecond     ///< 1/32 note
};

inline constexpr size_t kNoteValueCount = 8;

/// @brief Timing modifiers applied as multipliers to the base duration.
enum class NoteModifier : uint8_t {
    None = 0,        ///< 1.0x
    Dotted,          ///< 1.5x
    Triplet          ///< 2/3x
};

inline constexpr size_t kNoteModifierCount = 3;

// =============================================================================
// Constants
// =============================================================================

/// Beats per note value at 4/4, indexed by NoteValue.
inline constexpr float kBeatsPerNote[] = {
    16.0f,   // Quad
    8.0f,    // Double
    4.0f,    // Whole
    2.0f,    // Half
    1.0f,    // Quarter
    0.5f,    // Eighth
    0.25f,   // Sixteenth
    0.125f   // ThirtySecond
};

/// Modifier multipliers, indexed by NoteModifier.
inline constexpr float kModifierMultiplier[] = {
    1.0f,              // None
    1.5f,              // Dotted
    0.6666666666667f   // Triplet
};

// =============================================================================
// Helper Functions
// =============================================================================

/// @brief Duration in beats for a note value with modifier.
[[nodiscard]] inline constexpr float getBeatsForNote(
    NoteValue note,
    NoteModifier modifier = NoteModifier::None
) noexcept {
    return kBeatsPerNote[static_cast<size_t>(note)] *
           kModifierMultiplier[static_cast<size_t>(modifier)];
}

/// @brief Frequency in Hz of one cycle per note duration at the given tempo.
[[nodiscard]] inline constexpr float noteValueToFrequency(
    NoteValue note, NoteModifier modifier, double tempoBPM) noexcept {
    const double beats = static_cast<double>(getBeatsForNote(note, modifier));
    if (tempoBPM <= 0.0 || beats <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(tempoBPM / (60.0 * beats));
}

/// @brief Flattened snap index (value * 3 + modifier), as stored in presets.
struct NoteValueMapping {
    NoteValue note = NoteValue::Quarter;
    NoteModifier modifier = NoteModifier::None;
};

inline constexpr size_t kNoteSnapCount = kNoteValueCount * kNoteModifierCount;

[[nodiscard]] inline constexpr NoteValueMapping getNoteValueFromSnapIndex(int index) noexcept {
    if (index < 0) index = 0;
    if (index >= static_cast<int>(kNoteSnapCount)) index = static_cast<int>(kNoteSnapCount) - 1;
    return {static_cast<NoteValue>(index / 3), static_cast<NoteModifier>(index % 3)};
}

} // namespace DSP
} // namespace Actuate
