// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Actuate {
namespace DSP {

/// Seed of the deterministic noise oscillator. Every note that plays the
/// Noise shape produces the same sequence.
inline constexpr uint32_t kNoiseSeed = 371722539u;

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5. Period 2^32-1.
///
/// @note NOT cryptographically secure - for audio/DSP use only
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     float noise = rng.nextFloat();  // Returns [-1.0, 1.0]
class Xorshift32 {
public:
    /// Construct with seed value (0 is replaced with a default seed).
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer in [1, 2^32-1].
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next float in [-1.0, 1.0].
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// Generate next float in [0.0, 1.0].
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// Reseed the generator (0 is replaced with a default seed).
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

/// Derive a per-voice seed from a base seed and a voice/unison index.
/// Keeps unison voices decorrelated while staying reproducible.
[[nodiscard]] constexpr uint32_t deriveSeed(uint32_t base, uint32_t index) noexcept {
    uint32_t h = base ^ (index * 0x9E3779B9u);
    h ^= h >> 16;
    h *= 0x85EBCA6Bu;
    h ^= h >> 13;
    return h != 0 ? h : 1u;
}

} // namespace DSP
} // namespace Actuate
