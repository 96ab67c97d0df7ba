// ==============================================================================
// Actuate Plugin - Type Definitions
// ==============================================================================
// Enumerations specific to the Actuate instrument: audio module types,
// oscillator retrigger styles, pitch envelope routing and effect slots.
//
// These types have no DSP-layer consumers and belong at the plugin level.
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Actuate::DSP {

// =============================================================================
// AudioModuleType Enumeration
// =============================================================================

/// @brief What an audio module renders.
enum class AudioModuleType : uint8_t {
    Off = 0,       ///< Module silent
    Oscillator,    ///< One of the twelve oscillator shapes
    Additive,      ///< 16-partial additive oscillator
    Sampler,       ///< Varispeed or pitch-shifted sample playback
    Granulizer,    ///< Windowed grain stream over the sample
    SingleCycle    ///< Whole sample looped as one wavetable cycle
};

inline constexpr uint8_t kAudioModuleTypeCount = 6;

/// @brief True for module types that read a sample bank.
[[nodiscard]] constexpr bool usesSampleBank(AudioModuleType type) noexcept {
    return type == AudioModuleType::Sampler || type == AudioModuleType::Granulizer ||
           type == AudioModuleType::SingleCycle;
}

// =============================================================================
// OscRetrigger Enumeration
// =============================================================================

/// @brief Oscillator phase behaviour on note-on.
enum class OscRetrigger : uint8_t {
    Free = 0,     ///< Phase continues from wherever it was
    Retrigger,    ///< Phase resets to 0
    Random        ///< Phase starts at a random position
};

inline constexpr uint8_t kOscRetriggerCount = 3;

// =============================================================================
// PitchEnvRouting Enumeration
// =============================================================================

/// @brief Which audio modules a pitch envelope bends.
enum class PitchEnvRouting : uint8_t {
    All = 0,
    Osc1,
    Osc2,
    Osc3,
    Osc12,
    Osc13,
    Osc23
};

inline constexpr uint8_t kPitchEnvRoutingCount = 7;

/// @brief True when the routing includes module index 0..2.
[[nodiscard]] constexpr bool pitchEnvTargets(PitchEnvRouting routing, size_t module) noexcept {
    switch (routing) {
        case PitchEnvRouting::All:   return true;
        case PitchEnvRouting::Osc1:  return module == 0;
        case PitchEnvRouting::Osc2:  return module == 1;
        case PitchEnvRouting::Osc3:  return module == 2;
        case PitchEnvRouting::Osc12: return module == 0 || module == 1;
        case PitchEnvRouting::Osc13: return module == 0 || module == 2;
        case PitchEnvRouting::Osc23: return module == 1 || module == 2;
    }
    return false;
}

// =============================================================================
// FxSlot Enumeration
// =============================================================================

/// @brief Effect units of the master chain.
enum class FxSlot : uint8_t {
    Eq = 0,
    Compressor,
    ABass,
    Saturation,
    Delay,
    Reverb,
    Phaser,
    Chorus,
    BufferModulator,
    Flanger,
    Limiter
};

inline constexpr size_t kFxSlotCount = 11;

using FxOrder = std::array<FxSlot, kFxSlotCount>;

/// @brief Default chain order: the enum order.
[[nodiscard]] constexpr FxOrder defaultFxOrder() noexcept {
    FxOrder order{};
    for (size_t i = 0; i < kFxSlotCount; ++i) {
        order[i] = static_cast<FxSlot>(i);
    }
    return order;
}

/// @brief True when every slot appears exactly once.
[[nodiscard]] constexpr bool isPermutation(const FxOrder& order) noexcept {
    std::array<bool, kFxSlotCount> seen{};
    for (const FxSlot slot : order) {
        const auto index = static_cast<size_t>(slot);
        if (index >= kFxSlotCount || seen[index]) return false;
        seen[index] = true;
    }
    return true;
}

} // namespace Actuate::DSP
