// ==============================================================================
// Layer 4: User Feature - Flanger
// ==============================================================================
// Short modulated comb. The read distance sweeps between 0 and
// depth * kFlangerMaxDelayMs following 0.5 * sin(phase) + 0.5; the delayed
// signal is added to the input scaled by the feedback amount.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/delay_line.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kFlangerMaxDelayMs = 10.0f;
inline constexpr float kFlangerMinRateHz = 0.01f;
inline constexpr float kFlangerMaxRateHz = 10.0f;

struct FlangerParams {
    float amount = 0.0f;     ///< Dry/wet [0, 1]
    float depth = 0.5f;      ///< Sweep width [0, 1]
    float rateHz = 0.3f;     ///< LFO rate [0.01, 10]
    float feedback = 0.5f;   ///< Comb gain [0, 1]
};

class Flanger {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        rangeSamples_ = kFlangerMaxDelayMs * 0.001f * sampleRate_;
        for (auto& line : lines_) line.prepare(sampleRate, kFlangerMaxDelayMs * 0.001f + 0.001f);
        amountSmoother_.configure(20.0f, sampleRate_);
        amountSmoother_.snapTo(params_.amount);
        depthSmoother_.configure(20.0f, sampleRate_);
        depthSmoother_.snapTo(params_.depth);
        prepared_ = true;
        updateRate();
        reset();
    }

    void reset() noexcept {
        for (auto& line : lines_) line.reset();
        lfoPhase_ = 0.0f;
    }

    void setParams(const FlangerParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.depth = std::clamp(params.depth, 0.0f, 1.0f);
        params_.rateHz = std::clamp(params.rateHz, kFlangerMinRateHz, kFlangerMaxRateHz);
        params_.feedback = std::clamp(params.feedback, 0.0f, 1.0f);
        amountSmoother_.setTarget(params_.amount);
        depthSmoother_.setTarget(params_.depth);
        updateRate();
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        lfoPhase_ += lfoIncrement_;
        if (lfoPhase_ >= kTwoPi) lfoPhase_ -= kTwoPi;

        const float modulator = depthSmoother_.process() * (0.5f * std::sin(lfoPhase_) + 0.5f);
        const float delay = rangeSamples_ * modulator;

        lines_[0].write(left);
        lines_[1].write(right);
        const float wetL = left + params_.feedback * lines_[0].readLinear(delay);
        const float wetR = right + params_.feedback * lines_[1].readLinear(delay);

        const float amount = amountSmoother_.process();
        left = left * (1.0f - amount) + wetL * amount;
        right = right * (1.0f - amount) + wetR * amount;
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    void updateRate() noexcept {
        lfoIncrement_ = kTwoPi * params_.rateHz / sampleRate_;
    }

    FlangerParams params_;
    std::array<DelayLine, 2> lines_{};
    OnePoleSmoother amountSmoother_;
    OnePoleSmoother depthSmoother_;
    float sampleRate_ = 44100.0f;
    float rangeSamples_ = 0.0f;
    float lfoPhase_ = 0.0f;
    float lfoIncrement_ = 0.0f;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
