// ==============================================================================
// Layer 1: DSP Primitive - ADSR Envelope Generator
// ==============================================================================
// Five-state ADSR envelope built from three shaped segments (attack, decay,
// release). Each segment walks a phase from 0 to 1 and maps it through the
// segment's curve:
//
//   Linear       y = p
//   Logarithmic  y = p^2                              (slow start)
//   Exponential  y = (1 - e^(-k p)) / (1 - e^(-k))    (fast start)
//
// Segment times are full-scale: a segment covering only part of the 0..1
// range finishes proportionally sooner. Every segment starts from the
// current output, so the envelope never jumps on a stage change or retrigger.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include <actuate/dsp/core/db_utils.h>

namespace Actuate {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kMinEnvelopeTimeMs = 0.1f;
inline constexpr float kMaxEnvelopeTimeMs = 10000.0f;
inline constexpr float kSustainSmoothTimeMs = 5.0f;
inline constexpr float kEnvExpCurvature = 5.0f;

// =============================================================================
// Enumerations
// =============================================================================

enum class ADSRStage : uint8_t {
    Idle = 0,
    Attack,
    Decay,
    Sustain,
    Release
};

enum class EnvCurve : uint8_t {
    Linear = 0,
    Logarithmic,
    Exponential
};

inline constexpr uint8_t kEnvCurveCount = 3;

/// @brief Full envelope shape, as carried in a patch snapshot.
struct EnvelopeShape {
    float attackMs = 2.0f;
    float decayMs = 300.0f;
    float sustain = 1.0f;
    float releaseMs = 50.0f;
    EnvCurve attackCurve = EnvCurve::Linear;
    EnvCurve decayCurve = EnvCurve::Linear;
    EnvCurve releaseCurve = EnvCurve::Linear;
};

// =============================================================================
// ADSREnvelope Class
// =============================================================================

class ADSREnvelope {
public:
    ADSREnvelope() noexcept = default;

    // =========================================================================
    // Initialization
    // =========================================================================

    void prepare(float sampleRate) noexcept {
        if (!(sampleRate > 0.0f)) return;
        sampleRate_ = sampleRate;
        sustainSmoothCoef_ = std::exp(-1000.0f / (kSustainSmoothTimeMs * sampleRate_));
    }

    void reset() noexcept {
        output_ = 0.0f;
        stage_ = ADSRStage::Idle;
        gateOn_ = false;
        run_ = {};
    }

    // =========================================================================
    // Gate Control
    // =========================================================================

    /// @brief Gate on always restarts the attack from the current level.
    void gate(bool on) noexcept {
        gateOn_ = on;
        if (on) {
            enterAttack();
        } else if (stage_ != ADSRStage::Idle && stage_ != ADSRStage::Release) {
            enterRelease();
        }
    }

    // =========================================================================
    // Parameter Setters
    // =========================================================================

    ACTUATE_NOINLINE void setAttack(float ms) noexcept { setTime(kAttack, ms); }
    ACTUATE_NOINLINE void setDecay(float ms) noexcept { setTime(kDecay, ms); }
    ACTUATE_NOINLINE void setRelease(float ms) noexcept { setTime(kRelease, ms); }

    ACTUATE_NOINLINE void setSustain(float level) noexcept {
        if (detail::isNaN(level)) return;
        sustainLevel_ = std::clamp(level, 0.0f, 1.0f);
    }

    void setAttackCurve(EnvCurve curve) noexcept { segments_[kAttack].curve = curve; }
    void setDecayCurve(EnvCurve curve) noexcept { segments_[kDecay].curve = curve; }
    void setReleaseCurve(EnvCurve curve) noexcept { segments_[kRelease].curve = curve; }

    /// @brief Apply a whole shape. Takes effect from the next segment start.
    void setShape(const EnvelopeShape& shape) noexcept {
        setAttack(shape.attackMs);
        setDecay(shape.decayMs);
        setRelease(shape.releaseMs);
        setSustain(shape.sustain);
        setAttackCurve(shape.attackCurve);
        setDecayCurve(shape.decayCurve);
        setReleaseCurve(shape.releaseCurve);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] float process() noexcept {
        switch (stage_) {
            case ADSRStage::Idle:
                return 0.0f;

            case ADSRStage::Attack:
                if (advance()) {
                    output_ = 1.0f;
                    enterDecay();
                }
                return output_;

            case ADSRStage::Decay:
                if (advance()) {
                    output_ = sustainLevel_;
                    stage_ = ADSRStage::Sustain;
                }
                return output_;

            case ADSRStage::Sustain:
                output_ = sustainLevel_ + sustainSmoothCoef_ * (output_ - sustainLevel_);
                return output_;

            case ADSRStage::Release:
                if (advance()) {
                    output_ = 0.0f;
                    stage_ = ADSRStage::Idle;
                }
                return output_;
        }
        return 0.0f;
    }

    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] ADSRStage getStage() const noexcept { return stage_; }
    [[nodiscard]] bool isActive() const noexcept { return stage_ != ADSRStage::Idle; }
    [[nodiscard]] bool isReleasing() const noexcept { return stage_ == ADSRStage::Release; }
    [[nodiscard]] bool isGateOn() const noexcept { return gateOn_; }
    [[nodiscard]] float getOutput() const noexcept { return output_; }

private:
    static constexpr size_t kAttack = 0;
    static constexpr size_t kDecay = 1;
    static constexpr size_t kRelease = 2;

    struct Segment {
        float timeMs = 0.0f;
        EnvCurve curve = EnvCurve::Linear;
    };

    /// Running segment: output = from + (to - from) * curve(phase)
    struct Run {
        float from = 0.0f;
        float to = 0.0f;
        float phase = 0.0f;
        float phaseInc = 1.0f;
        float expDecay = 1.0f;   // e^(-k phase), Exponential only
        float expStep = 1.0f;    // e^(-k phaseInc)
        EnvCurve curve = EnvCurve::Linear;
    };

    void setTime(size_t segment, float ms) noexcept {
        if (detail::isNaN(ms)) return;
        segments_[segment].timeMs = std::clamp(ms, kMinEnvelopeTimeMs, kMaxEnvelopeTimeMs);
    }

    /// Start a run over `range` of full scale. A zero range finishes at once.
    void startRun(size_t segment, float to) noexcept {
        const Segment& s = segments_[segment];
        const float range = std::abs(to - output_);
        const float samples = range * s.timeMs * 0.001f * sampleRate_;

        run_.from = output_;
        run_.to = to;
        run_.phase = 0.0f;
        run_.phaseInc = samples > 1.0f ? 1.0f / samples : 1.0f;
        run_.curve = s.curve;
        run_.expDecay = 1.0f;
        run_.expStep = std::exp(-kEnvExpCurvature * run_.phaseInc);
    }

    /// Step the running segment. Returns true when it has finished.
    bool advance() noexcept {
        run_.phase += run_.phaseInc;
        if (run_.phase >= 1.0f) {
            return true;
        }

        float shaped = run_.phase;
        switch (run_.curve) {
            case EnvCurve::Linear:
                break;
            case EnvCurve::Logarithmic:
                shaped = run_.phase * run_.phase;
                break;
            case EnvCurve::Exponential:
                run_.expDecay *= run_.expStep;
                shaped = (1.0f - run_.expDecay) / kExpNorm;
                break;
        }
        output_ = std::clamp(run_.from + (run_.to - run_.from) * shaped, 0.0f, 1.0f);
        return false;
    }

    void enterAttack() noexcept {
        stage_ = ADSRStage::Attack;
        startRun(kAttack, 1.0f);
    }

    void enterDecay() noexcept {
        stage_ = ADSRStage::Decay;
        startRun(kDecay, sustainLevel_);
    }

    void enterRelease() noexcept {
        stage_ = ADSRStage::Release;
        startRun(kRelease, 0.0f);
    }

    static inline const float kExpNorm = 1.0f - std::exp(-kEnvExpCurvature);

    // =========================================================================
    // Member Fields
    // =========================================================================

    float sampleRate_ = 44100.0f;
    float output_ = 0.0f;
    ADSRStage stage_ = ADSRStage::Idle;
    bool gateOn_ = false;

    std::array<Segment, 3> segments_{{
        {2.0f, EnvCurve::Linear},
        {300.0f, EnvCurve::Linear},
        {50.0f, EnvCurve::Linear}
    }};
    float sustainLevel_ = 1.0f;
    float sustainSmoothCoef_ = 0.0f;

    Run run_{};
};

} // namespace DSP
} // namespace Actuate
