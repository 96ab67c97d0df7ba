// ==============================================================================
// Layer 1: DSP Primitive - A4I Filter
// ==============================================================================
// Four one-pole lowpass stages with corners offset by 0, -80, -130 and
// -200 Hz from the base. The output averages the 2-pole and 4-pole taps.
// Resonance feeds the 4-pole tap back to the input. The base is solved so
// the averaged response is -3 dB at the cutoff.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/primitives/one_pole.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>

namespace Actuate {
namespace DSP {

class A4iFilter {
public:
    static constexpr std::array<float, 4> kStageOffsetsHz{0.0f, -80.0f, -130.0f, -200.0f};
    static constexpr float kMinStageHz = 5.0f;
    static constexpr float kMaxFeedback = 3.6f;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = std::clamp(sampleRate, 8000.0, 384000.0);
        dirty_ = true;
        reset();
    }

    void reset() noexcept {
        for (auto& stage : stages_) {
            stage.reset();
        }
        lastFourPole_ = 0.0f;
    }

    void setCutoff(float hz) noexcept {
        const float clamped = clampCutoff(hz, sampleRate_);
        if (clamped != cutoff_) {
            cutoff_ = clamped;
            dirty_ = true;
        }
    }

    void setResonance(float amount) noexcept {
        resonance_ = detail::isNaN(amount) ? 0.0f : std::clamp(amount, 0.0f, 1.0f);
    }

    [[nodiscard]] float getCutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float getResonance() const noexcept { return resonance_; }

    [[nodiscard]] FilterOutputs processSample(float input) noexcept {
        if (dirty_) {
            updateCoefficients();
        }
        if (detail::isNonFinite(input)) {
            reset();
            return {};
        }

        const float r = resonance_ * kMaxFeedback;
        const float x = input * (1.0f + r) - r * lastFourPole_;

        const float s1 = stages_[0].process(x);
        const float s2 = stages_[1].process(s1);
        const float s3 = stages_[2].process(s2);
        const float s4 = stages_[3].process(s3);

        if (detail::isNonFinite(s4)) {
            reset();
            return {};
        }
        lastFourPole_ = std::clamp(s4, -kFilterStateLimit, kFilterStateLimit);

        const float low = 0.5f * (s2 + lastFourPole_);
        return {low, s1 - s2, input - low};
    }

private:
    [[nodiscard]] static float stageHz(float baseHz, size_t index) noexcept {
        return std::max(baseHz + kStageOffsetsHz[index], kMinStageHz);
    }

    void updateCoefficients() noexcept {
        const double sr = sampleRate_;
        const float base = detail::solveBaseFrequency(cutoff_, sr, [sr](float baseHz, float w) {
            std::complex<float> h{1.0f, 0.0f};
            std::complex<float> twoPole{};
            for (size_t i = 0; i < 4; ++i) {
                const float g = prewarpedGain(stageHz(baseHz, i), sr);
                h /= std::complex<float>{1.0f, w / g};
                if (i == 1) {
                    twoPole = h;
                }
            }
            return std::abs(0.5f * (twoPole + h));
        });
        for (size_t i = 0; i < stages_.size(); ++i) {
            stages_[i].setGain(prewarpedGain(stageHz(base, i), sampleRate_));
        }
        dirty_ = false;
    }

    double sampleRate_ = 44100.0;
    float cutoff_ = 1000.0f;
    float resonance_ = 0.0f;
    bool dirty_ = true;

    std::array<TptOnePole, 4> stages_{};
    float lastFourPole_ = 0.0f;
};

} // namespace DSP
} // namespace Actuate
