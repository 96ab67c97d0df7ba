// ==============================================================================
// Layer 4: User Feature - Chorus Ensemble
// ==============================================================================
// Four-voice ensemble chorus. An "air" stage first lifts the top octave with
// an alternating even/odd sample differencer; the result feeds a delay read
// at four taps whose base distances are range * {1, 2, 3, 4}, each swept by a
// sine LFO one radian apart from the previous one.
//
//   range = r^3 * kChorusRangeSamples   (at 44.1 kHz, scaled with the rate)
//   speed = s^3 * 0.001 rad/sample      (at 44.1 kHz)
//   sweep depth = range * amount
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/delay_line.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kChorusRangeSamples = 981.19368f;
inline constexpr size_t kChorusVoices = 4;
inline constexpr float kChorusReferenceRate = 44100.0f;

struct ChorusParams {
    float amount = 0.0f;   ///< Dry/wet and sweep depth [0, 1]
    float range = 0.5f;    ///< Base delay [0, 1]
    float speed = 0.5f;    ///< Sweep speed [0, 1]
};

class Chorus {
public:
    void prepare(double sampleRate) noexcept {
        rateScale_ = static_cast<float>(sampleRate) / kChorusReferenceRate;
        // Deepest tap: 4 * range plus a sweep of one more range
        const double maxSamples = (kChorusVoices + 1) * kChorusRangeSamples * rateScale_ + 4.0;
        for (auto& line : lines_) line.prepare(sampleRate, static_cast<float>(maxSamples / sampleRate));
        prepared_ = true;
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        for (auto& line : lines_) line.reset();
        air_ = {};
        sweep_ = kHalfPi;
        flip_ = false;
    }

    void setParams(const ChorusParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.range = std::clamp(params.range, 0.0f, 1.0f);
        params_.speed = std::clamp(params.speed, 0.0f, 1.0f);
        updateCoefficients();
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        lines_[0].write(air_[0].process(left, params_.amount, flip_));
        lines_[1].write(air_[1].process(right, params_.amount, flip_));
        flip_ = !flip_;

        const float modulation = range_ * params_.amount;
        float wetL = 0.0f;
        float wetR = 0.0f;
        for (size_t v = 0; v < kChorusVoices; ++v) {
            const float base = range_ * static_cast<float>(v + 1);
            const float offset = base + modulation * std::sin(sweep_ + static_cast<float>(v));
            wetL += lines_[0].readLinear(offset);
            wetR += lines_[1].readLinear(offset);
        }
        wetL *= 1.0f / static_cast<float>(kChorusVoices);
        wetR *= 1.0f / static_cast<float>(kChorusVoices);

        sweep_ += speed_;
        if (sweep_ > kTwoPi) sweep_ -= kTwoPi;

        const float amount = params_.amount;
        left = left * (1.0f - amount) + wetL * amount;
        right = right * (1.0f - amount) + wetR * amount;
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    /// Alternating-sample high-frequency lift.
    struct AirStage {
        float prev = 0.0f;
        float even = 0.0f;
        float odd = 0.0f;

        [[nodiscard]] float process(float x, float amount, bool flip) noexcept {
            float factor = prev - x;
            if (flip) {
                even += factor;
                odd -= factor;
                factor = even;
            } else {
                odd += factor;
                even -= factor;
                factor = odd;
            }
            odd = detail::flushDenormal((odd - (odd - even) / 256.0f) / 1.0001f);
            even = detail::flushDenormal((even - (even - odd) / 256.0f) / 1.0001f);
            prev = x;
            return x + factor * amount;
        }
    };

    void updateCoefficients() noexcept {
        const float r = params_.range;
        const float s = params_.speed;
        range_ = r * r * r * kChorusRangeSamples * rateScale_;
        speed_ = s * s * s * 0.001f / std::max(rateScale_, 0.01f);
    }

    ChorusParams params_;
    std::array<DelayLine, 2> lines_{};
    std::array<AirStage, 2> air_{};
    float rateScale_ = 1.0f;
    float range_ = 0.0f;
    float speed_ = 0.0f;
    float sweep_ = kHalfPi;
    bool flip_ = false;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
