// ==============================================================================
// Layer 4: User Feature - Tempo-Synced Delay
// ==============================================================================
// Feedback delay whose length snaps to a note value at the host tempo.
//
//   Stereo    : both channels feed back every pass.
//   PingPongL : feedback alternates between channels on each pass through the
//               delay, starting on the left.
//   PingPongR : same, starting on the right.
//
// The delay buffer is sized once in prepare() for the longest snap at the
// slowest tempo; length changes only move the read distance.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/block_context.h>
#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/note_value.h>
#include <actuate/dsp/primitives/delay_line.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

enum class DelayMode : uint8_t {
    Stereo = 0,
    PingPongL,
    PingPongR
};

inline constexpr size_t kDelayModeCount = 3;
inline constexpr float kMaxTempoDelaySeconds = 8.0f;
inline constexpr float kMaxDelayDecay = 0.99f;

struct TempoDelayParams {
    NoteValue time = NoteValue::Quarter;         ///< Whole .. ThirtySecond
    NoteModifier modifier = NoteModifier::None;  ///< Straight, dotted, triplet
    float decay = 0.5f;                          ///< Feedback [0, 0.99]
    float amount = 0.0f;                         ///< Dry/wet [0, 1]
    DelayMode mode = DelayMode::Stereo;
};

class TempoDelay {
public:
    void prepare(double sampleRate) noexcept {
        context_.sampleRate = sampleRate;
        for (auto& line : lines_) line.prepare(sampleRate, kMaxTempoDelaySeconds);
        amountSmoother_.configure(20.0f, static_cast<float>(sampleRate));
        amountSmoother_.snapTo(params_.amount);
        prepared_ = true;
        updateLength();
        reset();
    }

    void reset() noexcept {
        for (auto& line : lines_) line.reset();
        position_ = 0;
        leftTurn_ = true;
    }

    void setTempo(double bpm) noexcept {
        if (bpm == context_.tempoBPM) return;
        context_.tempoBPM = std::clamp(bpm, kMinTempoBPM, kMaxTempoBPM);
        updateLength();
    }

    void setParams(const TempoDelayParams& params) noexcept {
        // Quad and Double exceed the buffer at typical tempos
        params_.time = std::clamp(params.time, NoteValue::Whole, NoteValue::ThirtySecond);
        params_.modifier = params.modifier;
        params_.decay = std::clamp(params.decay, 0.0f, kMaxDelayDecay);
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        if (params.mode != params_.mode) {
            leftTurn_ = params.mode != DelayMode::PingPongR;
        }
        params_.mode = params.mode;
        amountSmoother_.setTarget(params_.amount);
        updateLength();
    }

    /// @brief Current delay length in samples.
    [[nodiscard]] size_t delaySamples() const noexcept { return length_; }

    void process(float& left, float& right) noexcept {
        if (!prepared_ || length_ == 0) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        // read(length - 1) returns what was written length samples ago
        const float delayedL = lines_[0].read(length_ - 1);
        const float delayedR = lines_[1].read(length_ - 1);
        const float fb = params_.decay;

        float wetL = left;
        float wetR = right;
        switch (params_.mode) {
            case DelayMode::Stereo:
                wetL += fb * delayedL;
                wetR += fb * delayedR;
                break;
            case DelayMode::PingPongL:
            case DelayMode::PingPongR:
                if (leftTurn_) {
                    wetL += fb * delayedL;
                } else {
                    wetR += fb * delayedR;
                }
                break;
        }

        lines_[0].write(detail::flushDenormal(wetL));
        lines_[1].write(detail::flushDenormal(wetR));

        if (++position_ >= length_) {
            position_ = 0;
            leftTurn_ = !leftTurn_;
        }

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
    void updateLength() noexcept {
        if (!prepared_) return;
        const size_t target = context_.tempoToSamples(params_.time, params_.modifier);
        length_ = std::clamp<size_t>(target, 1, lines_[0].maxDelaySamples());
        if (position_ >= length_) position_ = 0;
    }

    TempoDelayParams params_;
    BlockContext context_;
    std::array<DelayLine, 2> lines_{};
    OnePoleSmoother amountSmoother_;
    size_t length_ = 0;
    size_t position_ = 0;
    bool leftTurn_ = true;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
