// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion and Float Sanitizing
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Actuate {
namespace DSP {

// =============================================================================
// Compiler Compatibility Macros
// =============================================================================

/// @brief Cross-platform noinline attribute.
/// Keeps NaN checks from being folded away when fast-math is enabled globally.
#ifndef ACTUATE_NOINLINE
#if defined(_MSC_VER)
#define ACTUATE_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define ACTUATE_NOINLINE __attribute__((noinline))
#else
#define ACTUATE_NOINLINE
#endif
#endif

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels (~24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Threshold below which values are flushed to zero (denormal prevention)
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// Constexpr-safe NaN check using the IEEE 754 bit pattern.
///
/// The VST3 SDK enables -ffast-math globally, which lets the compiler drop
/// std::isnan(). Inspecting the bits keeps the check alive.
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Infinity check using the IEEE 754 bit pattern.
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// True for NaN or +/-Inf.
[[nodiscard]] constexpr bool isNonFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) == 0x7F800000u;
}

/// Flush values below kDenormalThreshold to zero.
[[nodiscard]] inline float flushDenormal(float x) noexcept {
    return (std::abs(x) < kDenormalThreshold) ? 0.0f : x;
}

/// Replace NaN/Inf with zero, then flush denormals.
[[nodiscard]] inline float sanitize(float x) noexcept {
    return isNonFinite(x) ? 0.0f : flushDenormal(x);
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear gain.
///
/// @param dB  Decibel value
/// @return    Linear gain multiplier (>= 0). NaN input returns 0.
///
/// @example   dbToGain(-6.02f)  -> ~0.5f
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert linear gain to decibels.
///
/// @param gain  Linear gain value
/// @return      Decibel value, kSilenceFloorDb for zero/negative/NaN input
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Actuate
