// ==============================================================================
// Layer 2: DSP Processor - FM Operator
// ==============================================================================
// Phase modulation between the three audio modules of a voice, over three
// fixed routes: 1->2, 1->3 and 2->3.
//
// Each source module drives a sine modulator at ratio x its frequency. The
// carrier phase offset for a route is
//   amount * fmEnvelope * kMaxFmIndex * modulator
// so a sine carrier renders cos(2*pi*phase + index * modulator).
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/phase_utils.h>
#include <actuate/dsp/primitives/adsr_envelope.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Actuate {
namespace DSP {

inline constexpr float kMaxFmIndex = 8.0f;
inline constexpr int kMinFmRatio = 1;
inline constexpr int kMaxFmRatio = 8;

/// @brief Route amounts [0, 1] and modulator ratio.
struct FmSettings {
    float oneToTwo = 0.0f;
    float oneToThree = 0.0f;
    float twoToThree = 0.0f;
    int ratio = 1;            ///< Modulator cycles per carrier cycle
    EnvelopeShape envelope{};
};

/// @brief Phase offsets for the carriers, radians.
struct FmOffsets {
    float module2 = 0.0f;
    float module3 = 0.0f;
};

class FmOperator {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        envelope_.prepare(sampleRate_);
        reset();
    }

    void reset() noexcept {
        for (auto& modulator : modulators_) {
            modulator.reset();
        }
        envelope_.reset();
    }

    void setSettings(const FmSettings& settings) noexcept {
        settings_.oneToTwo = std::clamp(detail::sanitize(settings.oneToTwo), 0.0f, 1.0f);
        settings_.oneToThree = std::clamp(detail::sanitize(settings.oneToThree), 0.0f, 1.0f);
        settings_.twoToThree = std::clamp(detail::sanitize(settings.twoToThree), 0.0f, 1.0f);
        settings_.ratio = std::clamp(settings.ratio, kMinFmRatio, kMaxFmRatio);
        settings_.envelope = settings.envelope;
        envelope_.setShape(settings_.envelope);
    }

    /// @brief True when any route has a non-zero amount.
    [[nodiscard]] bool isActive() const noexcept {
        return settings_.oneToTwo > 0.0f || settings_.oneToThree > 0.0f ||
               settings_.twoToThree > 0.0f;
    }

    void gate(bool on) noexcept { envelope_.gate(on); }

    /// @brief Source module frequencies in Hz (modules 1 and 2).
    void setSourceFrequencies(float module1Hz, float module2Hz) noexcept {
        const auto ratio = static_cast<float>(settings_.ratio);
        modulators_[0].setFrequency(std::max(0.0f, module1Hz) * ratio, sampleRate_);
        modulators_[1].setFrequency(std::max(0.0f, module2Hz) * ratio, sampleRate_);
    }

    [[nodiscard]] FmOffsets process() noexcept {
        const float env = envelope_.process();
        const float m1 = std::sin(kTwoPi * static_cast<float>(modulators_[0].phase));
        const float m2 = std::sin(kTwoPi * static_cast<float>(modulators_[1].phase));
        (void)modulators_[0].advance();
        (void)modulators_[1].advance();

        const float depth = env * kMaxFmIndex;
        return {depth * settings_.oneToTwo * m1,
                depth * (settings_.oneToThree * m1 + settings_.twoToThree * m2)};
    }

    [[nodiscard]] float envelopeLevel() const noexcept { return envelope_.getOutput(); }

private:
    FmSettings settings_{};
    ADSREnvelope envelope_;
    std::array<PhaseAccumulator, 2> modulators_{};
    float sampleRate_ = 44100.0f;
};

} // namespace DSP
} // namespace Actuate
