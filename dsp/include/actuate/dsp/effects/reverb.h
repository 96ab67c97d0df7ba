// ==============================================================================
// Layer 4: User Feature - Reverb
// ==============================================================================
// Three reverb models behind one effect:
//
//   Default  : four parallel feedback combs per channel. The longest comb is
//              size * sampleRate / 2 samples, the others are fixed ratios of it.
//   Galactic : Dattorro figure-eight plate. Input diffusion, two cross-coupled
//              tank halves with modulated allpasses and damping, multi-tap
//              stereo output. Size scales every tank length.
//   ASpace   : small-room feedback delay network. A drifting pre-delay feeds
//              four delay lines per channel whose outputs are mixed through a
//              4x4 Householder matrix into the opposite channel.
//
// Only the selected model runs. Switching model clears the incoming model's
// state so it starts silent.
//
// Composes:
// - DelayLine (Layer 1): every comb, allpass and tank delay
// - TptOnePole (Layer 1): plate input bandwidth and tank damping
// - DCBlocker (Layer 1): plate tank DC blockers
// - OnePoleSmoother (Layer 1): wet amount
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/dc_blocker.h>
#include <actuate/dsp/primitives/delay_line.h>
#include <actuate/dsp/primitives/one_pole.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

enum class ReverbModel : uint8_t {
    Default = 0,
    Galactic,
    ASpace
};

inline constexpr size_t kReverbModelCount = 3;
inline constexpr float kMaxReverbFeedback = 0.98f;

struct ReverbParams {
    ReverbModel model = ReverbModel::Default;
    float amount = 0.0f;     ///< Dry/wet [0, 1]
    float size = 0.5f;       ///< Room size [0, 1]
    float feedback = 0.5f;   ///< Tail length [0, 1]
};

namespace reverb_detail {

/// Default model comb lengths relative to the longest comb
inline constexpr std::array<float, 4> kCombRatios = {1.0f, 0.8513f, 0.7331f, 0.6187f};
/// Right channel comb offset in samples for decorrelation
inline constexpr size_t kCombStereoSpread = 23;
/// Longest Default comb at size 1, in seconds
inline constexpr float kMaxCombSeconds = 0.5f;

/// Plate lengths are specified at this rate (Dattorro 1997)
inline constexpr double kPlateReferenceRate = 29761.0;
inline constexpr std::array<size_t, 4> kPlateInputDiffusion = {142, 107, 379, 277};
inline constexpr std::array<float, 4> kPlateInputCoeffs = {0.75f, 0.75f, 0.625f, 0.625f};
inline constexpr size_t kPlateADD1 = 672;
inline constexpr size_t kPlateAPreDamp = 4453;
inline constexpr size_t kPlateADD2 = 1800;
inline constexpr size_t kPlateAPostDamp = 3720;
inline constexpr size_t kPlateBDD1 = 908;
inline constexpr size_t kPlateBPreDamp = 4217;
inline constexpr size_t kPlateBDD2 = 2656;
inline constexpr size_t kPlateBPostDamp = 3163;
inline constexpr std::array<size_t, 7> kPlateLeftTaps = {266, 2974, 1913, 1996, 1990, 187, 1066};
inline constexpr std::array<size_t, 7> kPlateRightTaps = {353, 3627, 1228, 2673, 2111, 335, 121};
inline constexpr float kPlateDecayDiffusion1 = 0.70f;
inline constexpr float kPlateDecayDiffusion2 = 0.50f;
inline constexpr float kPlateBandwidthHz = 9000.0f;
inline constexpr float kPlateDampingHz = 5500.0f;
inline constexpr float kPlateModRateHz = 0.5f;
inline constexpr float kPlateMaxExcursion = 8.0f;
inline constexpr float kPlateOutputGain = 0.6f;
/// Plate tank lengths scale from kPlateMinScale (size 0) to 1 (size 1)
inline constexpr float kPlateMinScale = 0.35f;

inline constexpr std::array<size_t, 4> kSpaceDelays = {3450, 2248, 1000, 320};
inline constexpr double kSpaceReferenceRate = 44100.0;
inline constexpr float kSpaceMaxSizeScale = 1.87f;
inline constexpr float kSpaceVibratoDepth = 127.0f;
inline constexpr float kSpaceVibratoRateHz = 0.05f;
inline constexpr float kSpaceLowpass = 0.76f;

[[nodiscard]] inline float secondsFor(double samples, double sampleRate) noexcept {
    return static_cast<float>((samples + 16.0) / sampleRate);
}

/// @brief Schroeder allpass over a DelayLine: y = -g x + d, write x + g y.
struct DiffusionAllpass {
    DelayLine line;
    float delay = 1.0f;
    float g = 0.5f;

    [[nodiscard]] float process(float x) noexcept {
        const float delayed = line.readLinear(std::max(0.0f, delay - 1.0f));
        const float y = -g * x + delayed;
        line.write(detail::flushDenormal(x + g * y));
        return y;
    }

    void reset() noexcept { line.reset(); }
};

// -----------------------------------------------------------------------------
// Default: parallel feedback combs
// -----------------------------------------------------------------------------

class CombTank {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = sampleRate;
        const float maxSec = secondsFor(kMaxCombSeconds * sampleRate + kCombStereoSpread, sampleRate);
        for (auto& channel : combs_) {
            for (auto& line : channel) line.prepare(sampleRate, maxSec);
        }
    }

    void reset() noexcept {
        for (auto& channel : combs_) {
            for (auto& line : channel) line.reset();
        }
    }

    void setSize(float size, float feedback) noexcept {
        const double longest = std::max(1.0, std::round(size * sampleRate_ / 2.0));
        for (size_t i = 0; i < kCombRatios.size(); ++i) {
            lengths_[0][i] = std::max<size_t>(1, static_cast<size_t>(longest * kCombRatios[i]));
            lengths_[1][i] = lengths_[0][i] + kCombStereoSpread;
        }
        feedback_ = feedback;
    }

    void process(float inL, float inR, float& outL, float& outR) noexcept {
        outL = processChannel(0, inL);
        outR = processChannel(1, inR);
    }

private:
    [[nodiscard]] float processChannel(size_t ch, float x) noexcept {
        float sum = 0.0f;
        for (size_t i = 0; i < kCombRatios.size(); ++i) {
            const float delayed = combs_[ch][i].read(lengths_[ch][i] - 1);
            const float y = x + feedback_ * delayed;
            combs_[ch][i].write(detail::flushDenormal(y));
            sum += y;
        }
        return sum * 0.25f;
    }

    std::array<std::array<DelayLine, 4>, 2> combs_{};
    std::array<std::array<size_t, 4>, 2> lengths_{};
    double sampleRate_ = 44100.0;
    float feedback_ = 0.5f;
};

// -----------------------------------------------------------------------------
// Galactic: figure-eight plate
// -----------------------------------------------------------------------------

class PlateTank {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = sampleRate;
        rateScale_ = static_cast<float>(sampleRate / kPlateReferenceRate);
        maxExcursion_ = kPlateMaxExcursion * rateScale_;

        for (size_t i = 0; i < inputDiffusion_.size(); ++i) {
            inputDiffusion_[i].line.prepare(sampleRate, seconds(kPlateInputDiffusion[i]));
            inputDiffusion_[i].delay = scaled(kPlateInputDiffusion[i], 1.0f);
            inputDiffusion_[i].g = kPlateInputCoeffs[i];
        }

        const float excursion = maxExcursion_ + 2.0f;
        halves_[0].dd1.line.prepare(sampleRate, seconds(kPlateADD1) + excursion / static_cast<float>(sampleRate));
        halves_[0].preDamp.prepare(sampleRate, seconds(kPlateAPreDamp));
        halves_[0].dd2.line.prepare(sampleRate, seconds(kPlateADD2));
        halves_[0].postDamp.prepare(sampleRate, seconds(kPlateAPostDamp));
        halves_[1].dd1.line.prepare(sampleRate, seconds(kPlateBDD1) + excursion / static_cast<float>(sampleRate));
        halves_[1].preDamp.prepare(sampleRate, seconds(kPlateBPreDamp));
        halves_[1].dd2.line.prepare(sampleRate, seconds(kPlateBDD2));
        halves_[1].postDamp.prepare(sampleRate, seconds(kPlateBPostDamp));

        for (auto& half : halves_) {
            half.damping.setGain(prewarpedGain(kPlateDampingHz, sampleRate));
            half.dcBlocker.prepare(sampleRate, 5.0f);
            half.dd1.g = kPlateDecayDiffusion1;
            half.dd2.g = kPlateDecayDiffusion2;
        }
        bandwidth_.setGain(prewarpedGain(kPlateBandwidthHz, sampleRate));
        lfoIncrement_ = kTwoPi * kPlateModRateHz / static_cast<float>(sampleRate);
        setSize(0.5f, 0.5f);
    }

    void reset() noexcept {
        for (auto& ap : inputDiffusion_) ap.reset();
        for (auto& half : halves_) {
            half.dd1.reset();
            half.preDamp.reset();
            half.dd2.reset();
            half.postDamp.reset();
            half.damping.reset();
            half.dcBlocker.reset();
            half.out = 0.0f;
        }
        bandwidth_.reset();
        lfoPhase_ = 0.0f;
    }

    void setSize(float size, float feedback) noexcept {
        const float scale = kPlateMinScale + (1.0f - kPlateMinScale) * size;
        halves_[0].dd1Center = scaled(kPlateADD1, scale);
        halves_[0].preDampLen = scaledIndex(kPlateAPreDamp, scale);
        halves_[0].dd2.delay = scaled(kPlateADD2, scale);
        halves_[0].postDampLen = scaledIndex(kPlateAPostDamp, scale);
        halves_[1].dd1Center = scaled(kPlateBDD1, scale);
        halves_[1].preDampLen = scaledIndex(kPlateBPreDamp, scale);
        halves_[1].dd2.delay = scaled(kPlateBDD2, scale);
        halves_[1].postDampLen = scaledIndex(kPlateBPostDamp, scale);
        for (size_t i = 0; i < kPlateLeftTaps.size(); ++i) {
            leftTaps_[i] = scaledIndex(kPlateLeftTaps[i], scale);
            rightTaps_[i] = scaledIndex(kPlateRightTaps[i], scale);
        }
        decay_ = 0.5f + feedback * 0.4995f;
    }

    void process(float inL, float inR, float& outL, float& outR) noexcept {
        float mono = bandwidth_.process((inL + inR) * 0.5f);
        for (auto& ap : inputDiffusion_) mono = ap.process(mono);

        const float lfoA = std::sin(lfoPhase_) * maxExcursion_;
        const float lfoB = std::cos(lfoPhase_) * maxExcursion_;
        lfoPhase_ += lfoIncrement_;
        if (lfoPhase_ >= kTwoPi) lfoPhase_ -= kTwoPi;

        const float feedA = halves_[1].out;
        const float feedB = halves_[0].out;
        runHalf(halves_[0], mono + decay_ * feedA, lfoA);
        runHalf(halves_[1], mono + decay_ * feedB, lfoB);

        auto& a = halves_[0];
        auto& b = halves_[1];
        float left = b.preDamp.read(leftTaps_[0]) + b.preDamp.read(leftTaps_[1]) -
                     b.dd2.line.read(leftTaps_[2]) + b.postDamp.read(leftTaps_[3]) -
                     a.preDamp.read(leftTaps_[4]) - a.dd2.line.read(leftTaps_[5]) -
                     a.postDamp.read(leftTaps_[6]);
        float right = a.preDamp.read(rightTaps_[0]) + a.preDamp.read(rightTaps_[1]) -
                      a.dd2.line.read(rightTaps_[2]) + a.postDamp.read(rightTaps_[3]) -
                      b.preDamp.read(rightTaps_[4]) - b.dd2.line.read(rightTaps_[5]) -
                      b.postDamp.read(rightTaps_[6]);

        outL = left * kPlateOutputGain;
        outR = right * kPlateOutputGain;
    }

private:
    struct TankHalf {
        DiffusionAllpass dd1;
        DelayLine preDamp;
        TptOnePole damping;
        DiffusionAllpass dd2;
        DelayLine postDamp;
        DCBlocker dcBlocker;
        float dd1Center = 1.0f;
        size_t preDampLen = 1;
        size_t postDampLen = 1;
        float out = 0.0f;
    };

    void runHalf(TankHalf& half, float input, float lfo) noexcept {
        half.dd1.delay = std::max(2.0f, half.dd1Center + lfo);
        float x = half.dd1.process(input);

        half.preDamp.write(x);
        x = half.preDamp.read(half.preDampLen - 1);
        x = half.damping.process(x) * decay_;
        x = half.dd2.process(x);

        half.postDamp.write(x);
        x = half.postDamp.read(half.postDampLen - 1);
        half.out = half.dcBlocker.process(x);
    }

    [[nodiscard]] float seconds(size_t refLength) const noexcept {
        return secondsFor(static_cast<double>(refLength) * rateScale_, sampleRate_);
    }

    [[nodiscard]] float scaled(size_t refLength, float scale) const noexcept {
        return std::max(2.0f, std::round(static_cast<float>(refLength) * rateScale_ * scale));
    }

    [[nodiscard]] size_t scaledIndex(size_t refLength, float scale) const noexcept {
        return static_cast<size_t>(scaled(refLength, scale));
    }

    std::array<DiffusionAllpass, 4> inputDiffusion_{};
    std::array<TankHalf, 2> halves_{};
    std::array<size_t, 7> leftTaps_{};
    std::array<size_t, 7> rightTaps_{};
    TptOnePole bandwidth_;
    double sampleRate_ = 44100.0;
    float rateScale_ = 1.0f;
    float maxExcursion_ = 0.0f;
    float lfoPhase_ = 0.0f;
    float lfoIncrement_ = 0.0f;
    float decay_ = 0.75f;
};

// -----------------------------------------------------------------------------
// ASpace: drifting pre-delay into a cross-coupled 4-line network
// -----------------------------------------------------------------------------

class SpaceTank {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = sampleRate;
        rateScale_ = static_cast<float>(sampleRate / kSpaceReferenceRate);
        const float longest = static_cast<float>(kSpaceDelays[0]) * kSpaceMaxSizeScale * rateScale_;
        for (auto& channel : lines_) {
            for (auto& line : channel) line.prepare(sampleRate, secondsFor(longest, sampleRate));
        }
        for (auto& line : vibrato_) {
            line.prepare(sampleRate, secondsFor(2.0 * kSpaceVibratoDepth + 2.0, sampleRate));
        }
        lowpass_ = (kSpaceLowpass * kSpaceLowpass) / std::sqrt(std::max(rateScale_, 0.1f));
        lowpass_ = std::clamp(lowpass_, 0.01f, 1.0f);
        vibratoIncrement_ = kTwoPi * kSpaceVibratoRateHz / static_cast<float>(sampleRate);
        setSize(0.5f, 0.5f);
    }

    void reset() noexcept {
        for (auto& channel : lines_) {
            for (auto& line : channel) line.reset();
        }
        for (auto& line : vibrato_) line.reset();
        feedback_ = {};
        iirA_ = {};
        iirB_ = {};
        vibratoPhase_ = 0.0f;
    }

    void setSize(float size, float feedback) noexcept {
        const float scale = size * 1.77f + 0.1f;
        for (size_t i = 0; i < kSpaceDelays.size(); ++i) {
            lengths_[i] = std::max<size_t>(
                1, static_cast<size_t>(static_cast<float>(kSpaceDelays[i]) * scale * rateScale_));
        }
        // 0.5 * (x_i - sum of others) is orthogonal, so regen is the loop gain
        regen_ = 0.5f * (0.2f + feedback * (kMaxReverbFeedback - 0.2f));
    }

    void process(float inL, float inR, float& outL, float& outR) noexcept {
        vibratoPhase_ += vibratoIncrement_;
        if (vibratoPhase_ >= kTwoPi) vibratoPhase_ -= kTwoPi;
        const float offsetL = (std::sin(vibratoPhase_) + 1.0f) * kSpaceVibratoDepth;
        const float offsetR = (std::cos(vibratoPhase_) + 1.0f) * kSpaceVibratoDepth;

        vibrato_[0].write(inL * 0.5f);
        vibrato_[1].write(inR * 0.5f);
        const std::array<float, 2> pre = {vibrato_[0].readLinear(offsetL),
                                          vibrato_[1].readLinear(offsetR)};

        std::array<std::array<float, 4>, 2> taps{};
        for (size_t ch = 0; ch < 2; ++ch) {
            iirA_[ch] = iirA_[ch] * (1.0f - lowpass_) + pre[ch] * lowpass_;
            const size_t other = 1 - ch;
            for (size_t i = 0; i < 4; ++i) {
                lines_[ch][i].write(detail::flushDenormal(iirA_[ch] + feedback_[other][i] * regen_));
                taps[ch][i] = lines_[ch][i].read(lengths_[i] - 1);
            }
        }

        std::array<float, 2> out{};
        for (size_t ch = 0; ch < 2; ++ch) {
            const auto& t = taps[ch];
            const float sum = t[0] + t[1] + t[2] + t[3];
            for (size_t i = 0; i < 4; ++i) {
                feedback_[ch][i] = t[i] - (sum - t[i]);
            }
            iirB_[ch] = iirB_[ch] * (1.0f - lowpass_) + (sum * 0.5f) * lowpass_;
            out[ch] = iirB_[ch];
        }
        outL = out[0];
        outR = out[1];
    }

private:
    std::array<std::array<DelayLine, 4>, 2> lines_{};
    std::array<DelayLine, 2> vibrato_{};
    std::array<size_t, 4> lengths_{};
    std::array<std::array<float, 4>, 2> feedback_{};
    std::array<float, 2> iirA_{};
    std::array<float, 2> iirB_{};
    double sampleRate_ = 44100.0;
    float rateScale_ = 1.0f;
    float lowpass_ = 0.5f;
    float regen_ = 0.25f;
    float vibratoPhase_ = 0.0f;
    float vibratoIncrement_ = 0.0f;
};

} // namespace reverb_detail

/// @brief Stereo reverb with selectable model.
///
/// @par Usage
/// @code
/// Reverb reverb;
/// reverb.prepare(44100.0);
/// reverb.setParams({ReverbModel::Galactic, 0.3f, 0.7f, 0.6f});
/// reverb.processBlock(left, right, numSamples);
/// @endcode
class Reverb {
public:
    void prepare(double sampleRate) noexcept {
        comb_.prepare(sampleRate);
        plate_.prepare(sampleRate);
        space_.prepare(sampleRate);
        amountSmoother_.configure(20.0f, static_cast<float>(sampleRate));
        amountSmoother_.snapTo(params_.amount);
        prepared_ = true;
        applySize();
        reset();
    }

    void reset() noexcept {
        comb_.reset();
        plate_.reset();
        space_.reset();
    }

    void setParams(const ReverbParams& params) noexcept {
        const bool modelChanged = params.model != params_.model;
        const bool sizeChanged = params.size != params_.size || params.feedback != params_.feedback;
        params_.model = params.model;
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        params_.size = std::clamp(params.size, 0.0f, 1.0f);
        params_.feedback = std::clamp(params.feedback, 0.0f, 1.0f);
        amountSmoother_.setTarget(params_.amount);

        if (!prepared_) return;
        if (modelChanged) resetModel(params_.model);
        if (modelChanged || sizeChanged) applySize();
    }

    [[nodiscard]] const ReverbParams& params() const noexcept { return params_; }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        float wetL = 0.0f;
        float wetR = 0.0f;
        switch (params_.model) {
            case ReverbModel::Default:
                comb_.process(left, right, wetL, wetR);
                break;
            case ReverbModel::Galactic:
                plate_.process(left, right, wetL, wetR);
                break;
            case ReverbModel::ASpace:
                space_.process(left, right, wetL, wetR);
                break;
        }

        const float amount = amountSmoother_.process();
        left = left * (1.0f - amount) + detail::sanitize(wetL) * amount;
        right = right * (1.0f - amount) + detail::sanitize(wetR) * amount;
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    void applySize() noexcept {
        const float combFeedback = params_.feedback * kMaxReverbFeedback;
        comb_.setSize(params_.size, combFeedback);
        plate_.setSize(params_.size, params_.feedback);
        space_.setSize(params_.size, params_.feedback);
    }

    void resetModel(ReverbModel model) noexcept {
        switch (model) {
            case ReverbModel::Default: comb_.reset(); break;
            case ReverbModel::Galactic: plate_.reset(); break;
            case ReverbModel::ASpace: space_.reset(); break;
        }
    }

    ReverbParams params_;
    reverb_detail::CombTank comb_;
    reverb_detail::PlateTank plate_;
    reverb_detail::SpaceTank space_;
    OnePoleSmoother amountSmoother_;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
