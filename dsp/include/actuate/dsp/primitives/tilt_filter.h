// ==============================================================================
// Layer 1: DSP Primitive - Tilt Filter
// ==============================================================================
// One-pole low/high pair sharing a corner. A second one-pole on the low tap
// yields a band tap; resonance adds that band back around the corner.
// The response type is chosen through the LP/BP/HP mix in FilterBank.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/primitives/one_pole.h>

#include <algorithm>

namespace Actuate {
namespace DSP {

class TiltFilter {
public:
    /// Band emphasis at full resonance
    static constexpr float kMaxEmphasis = 2.0f;

    void prepare(double sampleRate) noexcept {
        sampleRate_ = std::clamp(sampleRate, 8000.0, 384000.0);
        dirty_ = true;
        reset();
    }

    void reset() noexcept {
        lowStage_.reset();
        bandStage_.reset();
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
            const float g = prewarpedGain(cutoff_, sampleRate_);
            lowStage_.setGain(g);
            bandStage_.setGain(g);
            dirty_ = false;
        }
        if (detail::isNonFinite(input)) {
            reset();
            return {};
        }

        const float low = lowStage_.process(input);
        const float band = low - bandStage_.process(low);
        const float emphasis = kMaxEmphasis * resonance_ * band;

        return {low + emphasis, 2.0f * band, (input - low) + emphasis};
    }

private:
    double sampleRate_ = 44100.0;
    float cutoff_ = 1000.0f;
    float resonance_ = 0.0f;
    bool dirty_ = true;

    TptOnePole lowStage_;
    TptOnePole bandStage_;
};

} // namespace DSP
} // namespace Actuate
