// ==============================================================================
// Layer 4: User Feature - Buffer Modulator
// ==============================================================================
// Ring-modulated feedback buffer. Each channel reads a delay of timing / 3
// samples, multiplies it by a sine LFO and by depth, and writes input plus
// that product back into the buffer. Spread offsets the right channel's LFO
// phase by up to half a cycle.
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

inline constexpr float kBufferModMinTiming = 6.0f;
inline constexpr float kBufferModMaxTiming = 30000.0f;
inline constexpr float kBufferModMaxRateHz = 20.0f;
inline constexpr float kBufferModMaxDepth = 0.99f;

struct BufferModulatorParams {
    float amount = 0.0f;        ///< Dry/wet [0, 1]
    float depth = 0.5f;         ///< Modulated feedback [0, 0.99]
    float rateHz = 1.0f;        ///< LFO rate [0, 20]
    float spread = 0.0f;        ///< Right LFO phase offset [0, 1]
    float timing = 3000.0f;     ///< Buffer span in samples [6, 30000]
};

class BufferModulator {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        const float maxSec = (kBufferModMaxTiming / 3.0f + 4.0f) / sampleRate_;
        for (auto& line : lines_) line.prepare(sampleRate, maxSec);
        amountSmoother_.configure(20.0f, sampleRate_);
        amountSmoother_.snapTo(params_.amount);
        prepared_ = true;
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        for (auto& line : lines_) line.reset();
        phase_ = 0.0f;
    }

    void setParams(const BufferModulatorParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.depth = std::clamp(params.depth, 0.0f, kBufferModMaxDepth);
        params_.rateHz = std::clamp(params.rateHz, 0.0f, kBufferModMaxRateHz);
        params_.spread = std::clamp(params.spread, 0.0f, 1.0f);
        params_.timing = std::clamp(params.timing, kBufferModMinTiming, kBufferModMaxTiming);
        amountSmoother_.setTarget(params_.amount);
        updateCoefficients();
    }

    [[nodiscard]] size_t bufferSamples() const noexcept { return delay_; }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        const float modL = std::sin(phase_);
        const float modR = std::sin(phase_ + params_.spread * kPi);
        phase_ += increment_;
        if (phase_ >= kTwoPi) phase_ -= kTwoPi;

        const float wetL = params_.depth * lines_[0].read(delay_ - 1) * modL;
        const float wetR = params_.depth * lines_[1].read(delay_ - 1) * modR;
        lines_[0].write(detail::flushDenormal(left + wetL));
        lines_[1].write(detail::flushDenormal(right + wetR));

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
    void updateCoefficients() noexcept {
        delay_ = static_cast<size_t>(std::max(2.0f, params_.timing / 3.0f));
        increment_ = kTwoPi * params_.rateHz / sampleRate_;
    }

    BufferModulatorParams params_;
    std::array<DelayLine, 2> lines_{};
    OnePoleSmoother amountSmoother_;
    float sampleRate_ = 44100.0f;
    float phase_ = 0.0f;
    float increment_ = 0.0f;
    size_t delay_ = 1000;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
