// ==============================================================================
// Layer 1: DSP Primitive - DelayLine
// ==============================================================================
// Circular buffer delay line with integer, linear and allpass reads.
// Power-of-2 buffer with bitwise wraparound. Allocation happens in prepare()
// only; all processing methods are real-time safe.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Actuate {
namespace DSP {

/// @brief Smallest power of 2 >= n (1 for n == 0).
inline constexpr size_t nextPowerOf2(size_t n) noexcept {
    if (n == 0) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

class DelayLine {
public:
    DelayLine() noexcept = default;
    ~DelayLine() = default;

    // Non-copyable, movable
    DelayLine(const DelayLine&) = delete;
    DelayLine& operator=(const DelayLine&) = delete;
    DelayLine(DelayLine&&) noexcept = default;
    DelayLine& operator=(DelayLine&&) noexcept = default;

    /// @brief Allocate for maxDelaySeconds at sampleRate and clear.
    void prepare(double sampleRate, float maxDelaySeconds) noexcept;

    /// @brief Clear the buffer without reallocating.
    void reset() noexcept;

    void write(float sample) noexcept;

    /// @brief Integer delay read, clamped to [0, maxDelaySamples].
    [[nodiscard]] float read(size_t delaySamples) const noexcept;

    /// @brief Fractional read with linear interpolation. Use for modulated delays.
    [[nodiscard]] float readLinear(float delaySamples) const noexcept;

    /// @brief Fractional read with first-order allpass interpolation.
    /// @warning Stateful. Use only for fixed delays inside feedback loops.
    [[nodiscard]] float readAllpass(float delaySamples) noexcept;

    [[nodiscard]] size_t maxDelaySamples() const noexcept { return maxDelaySamples_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

private:
    std::vector<float> buffer_;
    size_t mask_ = 0;
    size_t writeIndex_ = 0;
    float allpassState_ = 0.0f;
    double sampleRate_ = 0.0;
    size_t maxDelaySamples_ = 0;
};

inline void DelayLine::prepare(double sampleRate, float maxDelaySeconds) noexcept {
    sampleRate_ = sampleRate;
    maxDelaySamples_ = static_cast<size_t>(sampleRate * static_cast<double>(maxDelaySeconds));

    // +1 so a read at maxDelaySamples is always valid
    const size_t bufferSize = nextPowerOf2(maxDelaySamples_ + 1);
    buffer_.resize(bufferSize);
    mask_ = bufferSize - 1;

    reset();
}

inline void DelayLine::reset() noexcept {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    writeIndex_ = 0;
    allpassState_ = 0.0f;
}

inline void DelayLine::write(float sample) noexcept {
    if (buffer_.empty()) return;
    buffer_[writeIndex_] = sample;
    writeIndex_ = (writeIndex_ + 1) & mask_;
}

inline float DelayLine::read(size_t delaySamples) const noexcept {
    if (buffer_.empty()) return 0.0f;
    const size_t clampedDelay = std::min(delaySamples, maxDelaySamples_);
    // writeIndex_ is the next write slot; the newest sample is one behind it
    const size_t readIndex = (writeIndex_ - 1 - clampedDelay) & mask_;
    return buffer_[readIndex];
}

inline float DelayLine::readLinear(float delaySamples) const noexcept {
    const float clampedDelay = std::clamp(delaySamples, 0.0f, static_cast<float>(maxDelaySamples_));
    const float intPart = std::floor(clampedDelay);
    const float frac = clampedDelay - intPart;

    const size_t index0 = static_cast<size_t>(intPart);
    const size_t index1 = std::min(index0 + 1, maxDelaySamples_);

    const float y0 = read(index0);
    const float y1 = read(index1);
    return y0 + frac * (y1 - y0);
}

inline float DelayLine::readAllpass(float delaySamples) noexcept {
    const float clampedDelay = std::clamp(delaySamples, 0.0f, static_cast<float>(maxDelaySamples_));
    const float intPart = std::floor(clampedDelay);
    const float frac = clampedDelay - intPart;

    const size_t index0 = static_cast<size_t>(intPart);
    const size_t index1 = std::min(index0 + 1, maxDelaySamples_);

    const float x0 = read(index0);
    const float x1 = read(index1);

    // a = (1 - frac) / (1 + frac); a = 1 at integer delays
    const float a = (1.0f - frac) / (1.0f + frac);
    const float y = x0 + a * (allpassState_ - x1);
    allpassState_ = y;
    return y;
}

} // namespace DSP
} // namespace Actuate
