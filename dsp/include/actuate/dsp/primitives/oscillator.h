// ==============================================================================
// Layer 1: DSP Primitive - Oscillator
// ==============================================================================
// Audio-rate oscillator covering the twelve module shapes. Sharp-edged shapes
// use PolyBLEP correction at their discontinuities; the rounded shapes are
// continuous and need none.
//
// WSaw, SSaw and RASaw draw one perturbation per cycle from a per-voice
// Xorshift32. The perturbation bends amplitude or slope inside the cycle and
// never moves the wrap point, so the period is exact.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/phase_utils.h>
#include <actuate/dsp/core/polyblep.h>
#include <actuate/dsp/core/random.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

// =============================================================================
// OscShape Enumeration
// =============================================================================

enum class OscShape : uint8_t {
    Sine = 0,
    Tri,        ///< Leaky-integrated PolyBLEP square
    Saw,        ///< PolyBLEP sawtooth
    RSaw,       ///< Rounded saw x(1 - x^16)
    WSaw,       ///< Saw with per-cycle amplitude wobble
    SSaw,       ///< Saw with per-cycle slope jitter
    RASaw,      ///< Rounded saw with per-cycle amplitude variance
    Ramp,       ///< Inverted PolyBLEP saw
    Square,     ///< PolyBLEP square
    RSquare,    ///< Rounded square
    Pulse,      ///< 25% PolyBLEP pulse
    Noise       ///< Deterministic white noise
};

inline constexpr size_t kOscShapeCount = 12;

/// @brief Shapes whose output repeats at the oscillator frequency.
[[nodiscard]] constexpr bool isPeriodic(OscShape shape) noexcept {
    return shape != OscShape::Noise;
}

// =============================================================================
// Oscillator Class
// =============================================================================

class Oscillator {
public:
    static constexpr float kPulseWidth = 0.25f;
    static constexpr int kRoundedSawExponent = 16;     ///< 2n with n = 8
    static constexpr int kRoundedSquareExponent = 8;
    static constexpr float kWobbleDepth = 0.25f;
    static constexpr float kSlopeJitterDepth = 0.35f;
    static constexpr float kAmplitudeVarianceDepth = 0.4f;

    Oscillator() noexcept = default;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        updatePhaseIncrement();
        reset();
    }

    /// @brief Phase to 0, integrator cleared, generators reseeded.
    void reset() noexcept {
        phaseAcc_.reset();
        integrator_ = 0.0f;
        pmOffset_ = 0.0f;
        phaseWrapped_ = false;
        noise_.seed(kNoiseSeed);
        variance_.seed(varianceSeed_);
        prevCycle_ = 1.0f;
        cycle_ = 1.0f;
        nextCycle_ = 1.0f;
        if (isVarianceShape(shape_)) {
            cycle_ = drawCycle();
            prevCycle_ = cycle_;
            nextCycle_ = drawCycle();
        }
    }

    void setShape(OscShape shape) noexcept {
        if (shape_ == OscShape::Tri || shape == OscShape::Tri) {
            integrator_ = 0.0f;
        }
        const bool reseedCycle = shape != shape_ && isVarianceShape(shape);
        shape_ = shape;
        if (reseedCycle) {
            cycle_ = drawCycle();
            prevCycle_ = cycle_;
            nextCycle_ = drawCycle();
        }
    }

    /// @brief Frequency in Hz, clamped to [0, sampleRate/2).
    void setFrequency(float hz) noexcept {
        if (detail::isNonFinite(hz)) {
            hz = 0.0f;
        }
        const float nyquist = sampleRate_ * 0.5f;
        frequency_ = (hz < 0.0f) ? 0.0f : ((hz >= nyquist) ? (nyquist - 0.001f) : hz);
        updatePhaseIncrement();
    }

    /// @brief Seed for the per-cycle perturbations. Takes effect on reset().
    void setVarianceSeed(uint32_t seed) noexcept { varianceSeed_ = seed; }

    /// @brief Phase offset for the next sample only, in radians.
    void setPhaseModulation(float radians) noexcept { pmOffset_ = radians; }

    void resetPhase(double newPhase = 0.0) noexcept { phaseAcc_.phase = wrapPhase(newPhase); }

    [[nodiscard]] OscShape shape() const noexcept { return shape_; }
    [[nodiscard]] float frequency() const noexcept { return frequency_; }
    [[nodiscard]] double phase() const noexcept { return phaseAcc_.phase; }
    [[nodiscard]] bool phaseWrapped() const noexcept { return phaseWrapped_; }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] float process() noexcept {
        const float dt = static_cast<float>(phaseAcc_.increment);
        const double effectivePhase = (pmOffset_ != 0.0f)
            ? wrapPhase(phaseAcc_.phase + static_cast<double>(pmOffset_ / kTwoPi))
            : phaseAcc_.phase;
        const float t = static_cast<float>(effectivePhase);

        float output = 0.0f;

        switch (shape_) {
            case OscShape::Sine:
                output = std::sin(kTwoPi * t);
                break;

            case OscShape::Tri: {
                const float square = blepSquare(t, effectivePhase, dt);
                float leak = 1.0f - 4.0f * dt;
                leak = (leak < 0.0f) ? 0.0f : leak;
                constexpr float kAntiDenormal = 1e-18f;
                integrator_ = leak * integrator_ + 4.0f * dt * square + kAntiDenormal;
                output = integrator_;
                break;
            }

            case OscShape::Saw:
                output = 2.0f * t - 1.0f;
                output -= 2.0f * polyBlep4(t, dt);
                break;

            case OscShape::RSaw:
                output = roundedSaw(t);
                break;

            case OscShape::WSaw: {
                // Step at the wrap goes from +current to -next amplitude
                const float step = (t < 0.5f) ? (prevCycle_ + cycle_) : (cycle_ + nextCycle_);
                output = cycle_ * (2.0f * t - 1.0f);
                output -= step * polyBlep4(t, dt);
                break;
            }

            case OscShape::SSaw:
                // cycle_ is the curvature exponent; endpoints stay at -1 and +1
                output = 2.0f * std::pow(t, cycle_) - 1.0f;
                output -= 2.0f * polyBlep4(t, dt);
                break;

            case OscShape::RASaw:
                output = cycle_ * roundedSaw(t);
                break;

            case OscShape::Ramp:
                output = 1.0f - 2.0f * t;
                output += 2.0f * polyBlep4(t, dt);
                break;

            case OscShape::Square:
                output = blepSquare(t, effectivePhase, dt);
                break;

            case OscShape::RSquare: {
                const float x = 2.0f * t - 1.0f;
                if (x < 0.0f) {
                    output = std::pow(2.0f * x + 1.0f, static_cast<float>(kRoundedSquareExponent)) - 1.0f;
                } else {
                    output = 1.0f - std::pow(2.0f * x - 1.0f, static_cast<float>(kRoundedSquareExponent));
                }
                break;
            }

            case OscShape::Pulse:
                output = (t < kPulseWidth) ? 1.0f : -1.0f;
                output += 2.0f * polyBlep4(t, dt);
                output -= 2.0f * polyBlep4(
                    static_cast<float>(wrapPhase(effectivePhase + 1.0 - static_cast<double>(kPulseWidth))),
                    dt);
                break;

            case OscShape::Noise:
                output = noise_.nextFloat();
                break;
        }

        phaseWrapped_ = phaseAcc_.advance();
        if (phaseWrapped_ && isVarianceShape(shape_)) {
            prevCycle_ = cycle_;
            cycle_ = nextCycle_;
            nextCycle_ = drawCycle();
        }

        pmOffset_ = 0.0f;
        return sanitize(output);
    }

    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

private:
    [[nodiscard]] static constexpr bool isVarianceShape(OscShape shape) noexcept {
        return shape == OscShape::WSaw || shape == OscShape::SSaw || shape == OscShape::RASaw;
    }

    /// Per-cycle perturbation for the active variance shape.
    [[nodiscard]] float drawCycle() noexcept {
        switch (shape_) {
            case OscShape::WSaw:
                return 1.0f - kWobbleDepth * variance_.nextUnipolar();
            case OscShape::SSaw:
                return 1.0f + kSlopeJitterDepth * variance_.nextFloat();
            case OscShape::RASaw:
                return 1.0f - kAmplitudeVarianceDepth * variance_.nextUnipolar();
            default:
                return 1.0f;
        }
    }

    [[nodiscard]] static float roundedSaw(float t) noexcept {
        const float x = 2.0f * t - 1.0f;
        float xn = x * x;  // x^2
        xn *= xn;          // x^4
        xn *= xn;          // x^8
        xn *= xn;          // x^16
        return x * (1.0f - xn);
    }

    [[nodiscard]] static float blepSquare(float t, double phase, float dt) noexcept {
        float square = (t < 0.5f) ? 1.0f : -1.0f;
        square += 2.0f * polyBlep4(t, dt);
        square -= 2.0f * polyBlep4(static_cast<float>(wrapPhase(phase + 0.5)), dt);
        return square;
    }

    void updatePhaseIncrement() noexcept {
        phaseAcc_.setFrequency(frequency_, sampleRate_);
    }

    /// NaN to zero, clamp to [-2, 2].
    [[nodiscard]] static float sanitize(float x) noexcept {
        x = detail::isNaN(x) ? 0.0f : x;
        x = (x < -2.0f) ? -2.0f : x;
        x = (x > 2.0f) ? 2.0f : x;
        return x;
    }

    PhaseAccumulator phaseAcc_;
    float sampleRate_ = 44100.0f;
    float frequency_ = 440.0f;
    float integrator_ = 0.0f;
    float pmOffset_ = 0.0f;
    OscShape shape_ = OscShape::Sine;
    bool phaseWrapped_ = false;

    Xorshift32 noise_{kNoiseSeed};
    Xorshift32 variance_{kNoiseSeed};
    uint32_t varianceSeed_ = kNoiseSeed;
    float prevCycle_ = 1.0f;
    float cycle_ = 1.0f;
    float nextCycle_ = 1.0f;
};

} // namespace DSP
} // namespace Actuate
