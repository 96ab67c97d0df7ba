// ==============================================================================
// Layer 0: Core Utility - Filter Types
// ==============================================================================
// Shared enums, limits and the three-way output used by every voice filter
// topology (SVF, Tilt, VCF, V4, A4I).
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

/// @brief Voice filter families. Closed set, dispatched by switch in FilterBank.
enum class FilterTopology : uint8_t {
    SVF = 0,   ///< Chamberlin state variable, 4x iterated
    Tilt,      ///< One-pole low/high pair
    VCF,       ///< 4-stage ladder with cubic clip
    V4,        ///< Staggered one-pole cascade with tanh feedback
    A4I        ///< Averaged one-poles with fixed cutoff offsets
};

inline constexpr size_t kFilterTopologyCount = 5;

/// @brief Resonance response curves for the SVF.
enum class ResonanceCurve : uint8_t {
    Default = 0,
    Moog,
    TB,
    Arp,
    Res,
    Bump,
    Powf
};

inline constexpr size_t kResonanceCurveCount = 7;

/// @brief Lowpass, bandpass and highpass taps of one filter step.
struct FilterOutputs {
    float low = 0.0f;
    float band = 0.0f;
    float high = 0.0f;
};

inline constexpr float kMinFilterCutoffHz = 20.0f;
inline constexpr float kMaxFilterCutoffHz = 20000.0f;

/// Cutoff ceiling as a fraction of the sample rate.
inline constexpr float kMaxFilterCutoffRatio = 0.45f;

/// Integrator states are clamped to +/- this value.
inline constexpr float kFilterStateLimit = 16.0f;

} // namespace DSP
} // namespace Actuate
