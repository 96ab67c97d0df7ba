// ==============================================================================
// Layer 1: DSP Primitive - State Variable Filter
// ==============================================================================
// Chamberlin 2-pole state variable filter iterated 4x per sample, with seven
// resonance response curves. Simultaneous lowpass, bandpass and highpass.
//
// At zero resonance the damping is sqrt(2) for every curve, so the lowpass
// -3 dB point sits on the cutoff. Each curve maps resonance [0, 1] to a
// damping that falls monotonically toward kMinDamping.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/one_pole.h>

#include <algorithm>
#include <cmath>

namespace Actuate {
namespace DSP {

class SvfFilter {
public:
    static constexpr int kIterations = 4;
    static constexpr float kMaxDamping = 1.41421356f;
    static constexpr float kMinDamping = 0.05f;

    SvfFilter() noexcept = default;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = std::clamp(sampleRate, 8000.0, 384000.0);
        dirty_ = true;
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        low_ = 0.0f;
        band_ = 0.0f;
    }

    void setCutoff(float hz) noexcept {
        const float clamped = clampCutoff(hz, sampleRate_);
        if (clamped != cutoff_) {
            cutoff_ = clamped;
            dirty_ = true;
        }
    }

    void setResonance(float amount) noexcept {
        const float clamped = detail::isNaN(amount) ? 0.0f : std::clamp(amount, 0.0f, 1.0f);
        if (clamped != resonance_) {
            resonance_ = clamped;
            dirty_ = true;
        }
    }

    void setResonanceCurve(ResonanceCurve curve) noexcept {
        if (curve != curve_) {
            curve_ = curve;
            dirty_ = true;
        }
    }

    [[nodiscard]] float getCutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float getResonance() const noexcept { return resonance_; }
    [[nodiscard]] float getDamping() const noexcept { return damping_; }

    /// @brief Damping for a curve at resonance [0, 1].
    [[nodiscard]] static float dampingFor(ResonanceCurve curve, float resonance) noexcept {
        const float r = std::clamp(resonance, 0.0f, 1.0f);
        float shaped = 0.0f;  // 0 = no resonance, 1 = maximum
        switch (curve) {
            case ResonanceCurve::Default:
                shaped = std::sin(r * kHalfPi);
                break;
            case ResonanceCurve::Moog:
                shaped = 1.0f - (1.0f - r) * (1.0f - r);
                break;
            case ResonanceCurve::TB:
                shaped = std::tan(r * kPi * 0.25f);
                break;
            case ResonanceCurve::Arp:
                shaped = r;
                break;
            case ResonanceCurve::Res:
                shaped = std::pow(r, 0.9f);
                break;
            case ResonanceCurve::Bump:
                shaped = std::asinh(r * std::sinh(1.0f));
                break;
            case ResonanceCurve::Powf:
                shaped = std::tanh(2.0f * std::pow(r, 0.4f)) / std::tanh(2.0f);
                break;
        }
        shaped = std::clamp(shaped, 0.0f, 1.0f);
        return kMaxDamping - (kMaxDamping - kMinDamping) * shaped;
    }

    [[nodiscard]] FilterOutputs processSample(float input) noexcept {
        if (dirty_) {
            updateCoefficients();
        }
        if (detail::isNonFinite(input)) {
            reset();
            return {};
        }

        float high = 0.0f;
        for (int i = 0; i < kIterations; ++i) {
            low_ += f_ * band_;
            high = input - low_ - damping_ * band_;
            band_ += f_ * high;
        }

        if (detail::isNonFinite(low_) || detail::isNonFinite(band_)) {
            reset();
            return {};
        }
        low_ = std::clamp(detail::flushDenormal(low_), -kFilterStateLimit, kFilterStateLimit);
        band_ = std::clamp(detail::flushDenormal(band_), -kFilterStateLimit, kFilterStateLimit);

        // Band scaled by damping for a unity-gain peak at zero resonance
        return {low_, band_ * damping_, high};
    }

private:
    void updateCoefficients() noexcept {
        const double iteratedRate = sampleRate_ * static_cast<double>(kIterations);
        f_ = 2.0f * static_cast<float>(std::sin(kPi * static_cast<double>(cutoff_) / iteratedRate));
        damping_ = dampingFor(curve_, resonance_);
        dirty_ = false;
    }

    double sampleRate_ = 44100.0;
    float cutoff_ = 1000.0f;
    float resonance_ = 0.0f;
    ResonanceCurve curve_ = ResonanceCurve::Default;

    float f_ = 0.0f;
    float damping_ = kMaxDamping;
    bool dirty_ = true;

    float low_ = 0.0f;
    float band_ = 0.0f;
};

} // namespace DSP
} // namespace Actuate
