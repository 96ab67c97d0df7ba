// ==============================================================================
// Layer 4: User Feature - Phaser
// ==============================================================================
// Six first-order allpass stages per channel swept between kPhaserMinHz and
// kPhaserMaxHz by a sine LFO, with output feedback into the chain input.
//
//   d  = lerp(dmin, dmax, (sin(phase) + 1) / 2),  dmin,max = f / (fs / 2)
//   a1 = (1 - d) / (1 + d)
//   y  = chain(x + fb * y[n-1]) + depth * x
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr size_t kPhaserStages = 6;
inline constexpr float kPhaserMinHz = 440.0f;
inline constexpr float kPhaserMaxHz = 1600.0f;
inline constexpr float kPhaserMinRateHz = 0.01f;
inline constexpr float kPhaserMaxRateHz = 10.0f;
inline constexpr float kPhaserMaxFeedback = 0.95f;

struct PhaserParams {
    float amount = 0.0f;     ///< Dry/wet [0, 1]
    float depth = 0.5f;      ///< Dry reinjection into the wet path [0, 1]
    float rateHz = 0.5f;     ///< LFO rate [0.01, 10]
    float feedback = 0.5f;   ///< [0, 0.95]
};

class Phaser {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        const float nyquist = sampleRate_ * 0.5f;
        dMin_ = kPhaserMinHz / nyquist;
        dMax_ = std::min(kPhaserMaxHz / nyquist, 0.99f);
        amountSmoother_.configure(20.0f, sampleRate_);
        amountSmoother_.snapTo(params_.amount);
        prepared_ = true;
        updateRate();
        reset();
    }

    void reset() noexcept {
        for (auto& channel : stages_) channel.fill(0.0f);
        lastOut_ = {};
        lfoPhase_ = 0.0f;
    }

    void setParams(const PhaserParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.depth = std::clamp(params.depth, 0.0f, 1.0f);
        params_.rateHz = std::clamp(params.rateHz, kPhaserMinRateHz, kPhaserMaxRateHz);
        params_.feedback = std::clamp(params.feedback, 0.0f, kPhaserMaxFeedback);
        amountSmoother_.setTarget(params_.amount);
        updateRate();
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        const float sweep = (std::sin(lfoPhase_) + 1.0f) * 0.5f;
        const float d = dMin_ + (dMax_ - dMin_) * sweep;
        const float a1 = (1.0f - d) / (1.0f + d);
        lfoPhase_ += lfoIncrement_;
        if (lfoPhase_ >= kTwoPi) lfoPhase_ -= kTwoPi;

        const float wetL = runChain(0, left, a1) + left * params_.depth;
        const float wetR = runChain(1, right, a1) + right * params_.depth;

        const float amount = amountSmoother_.process();
        left = wetL * amount + left * (1.0f - amount);
        right = wetR * amount + right * (1.0f - amount);
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    [[nodiscard]] float runChain(size_t ch, float x, float a1) noexcept {
        float acc = x + lastOut_[ch] * params_.feedback;
        for (auto& zm1 : stages_[ch]) {
            const float y = acc * -a1 + zm1;
            zm1 = detail::flushDenormal(y * a1 + acc);
            acc = y;
        }
        lastOut_[ch] = acc;
        return acc;
    }

    void updateRate() noexcept {
        lfoIncrement_ = kTwoPi * params_.rateHz / sampleRate_;
    }

    PhaserParams params_;
    std::array<std::array<float, kPhaserStages>, 2> stages_{};
    std::array<float, 2> lastOut_{};
    OnePoleSmoother amountSmoother_;
    float sampleRate_ = 44100.0f;
    float dMin_ = 0.0f;
    float dMax_ = 0.0f;
    float lfoPhase_ = 0.0f;
    float lfoIncrement_ = 0.0f;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
