// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
//
// Constants are inline constexpr so there is a single definition across all
// translation units.
// ==============================================================================

#pragma once

namespace Actuate {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// 1 / (2 Pi), converts radians to cycles
inline constexpr float kInvTwoPi = 1.0f / kTwoPi;

/// Half Pi (quarter circle in radians)
inline constexpr float kHalfPi = kPi / 2.0f;

/// 2 / Pi, scales asin(sin(x)) to a unit triangle
inline constexpr float kTwoOverPi = 2.0f / kPi;

/// 1 / sqrt(2), equal-power pan centre gain
inline constexpr float kInvSqrt2 = 0.70710678118654752f;

// =============================================================================
// Tuning
// =============================================================================

/// Default concert pitch reference (A4) in Hz
inline constexpr float kDefaultTuningReference = 440.0f;

/// MIDI note number of the root used by varispeed sample playback
inline constexpr int kSampleRootNote = 60;

} // namespace DSP
} // namespace Actuate
