// ==============================================================================
// Layer 1: DSP Primitive - V4 Filter
// ==============================================================================
// Four cascaded one-pole lowpass stages with staggered corners
// (x1.0, x1.2, x1.3, x1.4 of the base) and a tanh-saturated resonance
// feedback path from the last stage. The base corner is solved so the
// cascade's -3 dB point lands on the cutoff.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/primitives/one_pole.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Actuate {
namespace DSP {

class V4Filter {
public:
    static constexpr std::array<float, 4> kStageStagger{1.0f, 1.2f, 1.3f, 1.4f};
    static constexpr float kMaxFeedback = 3.5f;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = std::clamp(sampleRate, 8000.0, 384000.0);
        dirty_ = true;
        reset();
    }

    void reset() noexcept {
        for (auto& stage : stages_) {
            stage.reset();
        }
        lastOutput_ = 0.0f;
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
        const float x = input * (1.0f + r) - r * std::tanh(lastOutput_);

        const float s1 = stages_[0].process(x);
        const float s2 = stages_[1].process(s1);
        const float s3 = stages_[2].process(s2);
        const float s4 = stages_[3].process(s3);

        if (detail::isNonFinite(s4)) {
            reset();
            return {};
        }
        lastOutput_ = std::clamp(s4, -kFilterStateLimit, kFilterStateLimit);

        return {lastOutput_, s2 - lastOutput_, input - lastOutput_};
    }

private:
    void updateCoefficients() noexcept {
        const double sr = sampleRate_;
        const float base = detail::solveBaseFrequency(cutoff_, sr, [sr](float baseHz, float w) {
            float mag = 1.0f;
            for (float stagger : kStageStagger) {
                mag *= detail::onePoleMagnitude(prewarpedGain(baseHz * stagger, sr), w);
            }
            return mag;
        });
        for (size_t i = 0; i < stages_.size(); ++i) {
            stages_[i].setGain(prewarpedGain(base * kStageStagger[i], sampleRate_));
        }
        dirty_ = false;
    }

    double sampleRate_ = 44100.0;
    float cutoff_ = 1000.0f;
    float resonance_ = 0.0f;
    bool dirty_ = true;

    std::array<TptOnePole, 4> stages_{};
    float lastOutput_ = 0.0f;
};

} // namespace DSP
} // namespace Actuate
