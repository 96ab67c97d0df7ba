// ==============================================================================
// Layer 4: User Feature - Program-Dependent Compressor
// ==============================================================================
// Bus compressor whose attack and release speeds adapt to the programme:
// every sample over threshold slows the release, every sample under it speeds
// the recovery. Each channel tracks its own gain coefficient.
//
// Parameter mapping (all controls normalized 0..1 except drive):
//   threshold = 1 - (1 - (1 - amount)^2) * 0.9
//   attack    = (attack^4 * 100000 + 10) * sampleRate / 44100
//   release   = (release^5 * 2000000 + 20) * sampleRate / 44100
//   pre-gain  = 1 / threshold, makeup = sqrt(1 / threshold) * drive
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kCompressorMaxDrive = 2.0f;
inline constexpr float kCompressorInitialSpeed = 1000.0f;
inline constexpr float kCompressorReferenceRate = 44100.0f;

struct CompressorParams {
    float amount = 0.0f;    ///< Compression depth [0, 1]
    float attack = 0.5f;    ///< Attack speed control [0, 1]
    float release = 0.5f;   ///< Release speed control [0, 1]
    float drive = 1.0f;     ///< Output drive [0, 2]
};

class Compressor {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        prepared_ = true;
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        for (auto& ch : channels_) {
            ch.speed = kCompressorInitialSpeed;
            ch.coefficient = 1.0f;
        }
    }

    void setParams(const CompressorParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.attack = std::clamp(params.attack, 0.0f, 1.0f);
        params_.release = std::clamp(params.release, 0.0f, 1.0f);
        params_.drive = std::clamp(params.drive, 0.0f, kCompressorMaxDrive);
        updateCoefficients();
    }

    /// @brief Current gain reduction of a channel as a linear factor (0, 1].
    [[nodiscard]] float gainReduction(size_t channel) const noexcept {
        return channels_[std::min<size_t>(channel, 1)].coefficient;
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        left = processChannel(channels_[0], left * preGain_) * makeupGain_;
        right = processChannel(channels_[1], right * preGain_) * makeupGain_;
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    struct ChannelState {
        float speed = kCompressorInitialSpeed;
        float coefficient = 1.0f;
    };

    void updateCoefficients() noexcept {
        const float scale = sampleRate_ / kCompressorReferenceRate;
        const float inv = 1.0f - params_.amount;
        threshold_ = 1.0f - (1.0f - inv * inv) * 0.9f;
        attackSpeed_ = (std::pow(params_.attack, 4.0f) * 100000.0f + 10.0f) * scale;
        releaseSpeed_ = (std::pow(params_.release, 5.0f) * 2000000.0f + 20.0f) * scale;
        maxRelease_ = releaseSpeed_ * 4.0f;
        preGain_ = 1.0f / threshold_;
        makeupGain_ = std::sqrt(1.0f / threshold_) * params_.drive;
    }

    [[nodiscard]] float processChannel(ChannelState& ch, float x) noexcept {
        const float magnitude = std::abs(x);
        if (magnitude > threshold_) {
            // Pull toward the gain that would land the sample on threshold
            const float variance = std::max(threshold_ / magnitude, threshold_);
            const float attack = std::sqrt(std::abs(ch.speed));
            ch.coefficient = (ch.coefficient * (attack - 1.0f) + variance) / attack;
            ch.speed = (ch.speed * (ch.speed - 1.0f) + releaseSpeed_) / ch.speed;
            ch.speed = std::min(ch.speed, maxRelease_);
        } else {
            const float speedSq = ch.speed * ch.speed;
            ch.coefficient = (ch.coefficient * (speedSq - 1.0f) + 1.0f) / speedSq;
            ch.speed = (ch.speed * (ch.speed - 1.0f) + attackSpeed_) / ch.speed;
        }

        ch.speed = std::max(ch.speed, 1.0f);
        ch.coefficient = std::clamp(detail::flushDenormal(ch.coefficient), 0.0f, 1.0f);
        return x * ch.coefficient;
    }

    CompressorParams params_;
    std::array<ChannelState, 2> channels_{};
    float sampleRate_ = 44100.0f;
    float threshold_ = 1.0f;
    float attackSpeed_ = 10.0f;
    float releaseSpeed_ = 20.0f;
    float maxRelease_ = 80.0f;
    float preGain_ = 1.0f;
    float makeupGain_ = 1.0f;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
