// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Transposed Direct Form II biquad with RBJ cookbook coefficients.
// Used by the EQ (shelves and peak) and the A-bass crossover.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

inline constexpr float kMinFilterFrequency = 1.0f;
inline constexpr float kMinQ = 0.1f;
inline constexpr float kMaxQ = 30.0f;
inline constexpr float kButterworthQ = 0.7071067811865476f;

enum class FilterType : uint8_t {
    Lowpass,      ///< 12 dB/oct lowpass, -3dB at cutoff
    Highpass,     ///< 12 dB/oct highpass, -3dB at cutoff
    Bandpass,     ///< Constant 0 dB peak gain
    Notch,
    Allpass,      ///< Flat magnitude, phase shift
    LowShelf,     ///< Boost/cut below cutoff (uses gainDb)
    HighShelf,    ///< Boost/cut above cutoff (uses gainDb)
    Peak          ///< Parametric bell (uses gainDb)
};

namespace detail {

/// Maximum cutoff as a fraction of the sample rate (just below Nyquist)
inline constexpr float kMaxFrequencyRatio = 0.495f;

inline constexpr float clampFrequency(float freq, float sampleRate) noexcept {
    if (sampleRate <= 0.0f) {
        return kMinFilterFrequency;
    }
    const float maxFreq = sampleRate * kMaxFrequencyRatio;
    if (maxFreq < kMinFilterFrequency) {
        return maxFreq;
    }
    return std::clamp(freq, kMinFilterFrequency, maxFreq);
}

} // namespace detail

struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;  ///< a0 = 1 implied
    float a2 = 0.0f;

    [[nodiscard]] static BiquadCoefficients calculate(FilterType type, float frequency,
                                                      float Q, float gainDb,
                                                      float sampleRate) noexcept;

    [[nodiscard]] bool isStable() const noexcept {
        constexpr float epsilon = 1e-6f;
        return std::abs(a2) < 1.0f + epsilon &&
               std::abs(a1) < 1.0f + a2 + epsilon;
    }
};

class Biquad {
public:
    Biquad() noexcept = default;

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept { coeffs_ = coeffs; }

    void configure(FilterType type, float frequency, float Q, float gainDb,
                   float sampleRate) noexcept {
        coeffs_ = BiquadCoefficients::calculate(type, frequency, Q, gainDb, sampleRate);
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept { return coeffs_; }

    /// @brief Process one sample. Non-finite input resets state and returns 0.
    [[nodiscard]] float process(float input) noexcept {
        if (detail::isNonFinite(input)) {
            reset();
            return 0.0f;
        }

        const float output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        z1_ = detail::flushDenormal(z1_);
        z2_ = detail::flushDenormal(z2_);

        return output;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    void reset() noexcept {
        z1_ = 0.0f;
        z2_ = 0.0f;
    }

private:
    BiquadCoefficients coeffs_;
    float z1_ = 0.0f;
    float z2_ = 0.0f;
};

inline BiquadCoefficients BiquadCoefficients::calculate(FilterType type, float frequency,
                                                        float Q, float gainDb,
                                                        float sampleRate) noexcept {
    if (sampleRate <= 0.0f) {
        return BiquadCoefficients{};
    }

    frequency = detail::clampFrequency(frequency, sampleRate);
    Q = std::clamp(Q, kMinQ, kMaxQ);

    const float omega = kTwoPi * frequency / sampleRate;
    const float sinOmega = std::sin(omega);
    const float cosOmega = std::cos(omega);
    const float alpha = sinOmega / (2.0f * Q);

    float b0 = 0.0f, b1 = 0.0f, b2 = 0.0f;
    float a0 = 1.0f, a1 = 0.0f, a2 = 0.0f;

    switch (type) {
        case FilterType::Lowpass:
            b0 = (1.0f - cosOmega) / 2.0f;
            b1 = 1.0f - cosOmega;
            b2 = (1.0f - cosOmega) / 2.0f;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha;
            break;
        case FilterType::Highpass:
            b0 = (1.0f + cosOmega) / 2.0f;
            b1 = -(1.0f + cosOmega);
            b2 = (1.0f + cosOmega) / 2.0f;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha;
            break;
        case FilterType::Bandpass:
            b0 = alpha;
            b1 = 0.0f;
            b2 = -alpha;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha;
            break;
        case FilterType::Notch:
            b0 = 1.0f;
            b1 = -2.0f * cosOmega;
            b2 = 1.0f;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha;
            break;
        case FilterType::Allpass:
            b0 = 1.0f - alpha;
            b1 = -2.0f * cosOmega;
            b2 = 1.0f + alpha;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha;
            break;
        case FilterType::LowShelf: {
            const float A = std::sqrt(std::pow(10.0f, gainDb / 20.0f));
            const float beta = std::sqrt(A) / Q;
            b0 = A * ((A + 1.0f) - (A - 1.0f) * cosOmega + beta * sinOmega);
            b1 = 2.0f * A * ((A - 1.0f) - (A + 1.0f) * cosOmega);
            b2 = A * ((A + 1.0f) - (A - 1.0f) * cosOmega - beta * sinOmega);
            a0 = (A + 1.0f) + (A - 1.0f) * cosOmega + beta * sinOmega;
            a1 = -2.0f * ((A - 1.0f) + (A + 1.0f) * cosOmega);
            a2 = (A + 1.0f) + (A - 1.0f) * cosOmega - beta * sinOmega;
            break;
        }
        case FilterType::HighShelf: {
            const float A = std::sqrt(std::pow(10.0f, gainDb / 20.0f));
            const float beta = std::sqrt(A) / Q;
            b0 = A * ((A + 1.0f) + (A - 1.0f) * cosOmega + beta * sinOmega);
            b1 = -2.0f * A * ((A - 1.0f) + (A + 1.0f) * cosOmega);
            b2 = A * ((A + 1.0f) + (A - 1.0f) * cosOmega - beta * sinOmega);
            a0 = (A + 1.0f) - (A - 1.0f) * cosOmega + beta * sinOmega;
            a1 = 2.0f * ((A - 1.0f) - (A + 1.0f) * cosOmega);
            a2 = (A + 1.0f) - (A - 1.0f) * cosOmega - beta * sinOmega;
            break;
        }
        case FilterType::Peak: {
            const float A = std::sqrt(std::pow(10.0f, gainDb / 20.0f));
            b0 = 1.0f + alpha * A;
            b1 = -2.0f * cosOmega;
            b2 = 1.0f - alpha * A;
            a0 = 1.0f + alpha / A;
            a1 = -2.0f * cosOmega;
            a2 = 1.0f - alpha / A;
            break;
        }
    }

    const float invA0 = 1.0f / a0;
    BiquadCoefficients coeffs;
    coeffs.b0 = b0 * invA0;
    coeffs.b1 = b1 * invA0;
    coeffs.b2 = b2 * invA0;
    coeffs.a1 = a1 * invA0;
    coeffs.a2 = a2 * invA0;
    return coeffs;
}

} // namespace DSP
} // namespace Actuate
