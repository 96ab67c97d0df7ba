// ==============================================================================
// Layer 2: DSP Processor - Additive Oscillator
// ==============================================================================
// Sums 16 sine partials at integer multiples of the fundamental. Partial k
// runs at (k + 1) * f with its own amplitude and phase offset. Partials at
// or above Nyquist are skipped.
//
// The partial level scales partials 2..16 (the fundamental is untouched) and
// is the target of the OscN PartialLevel modulation destinations.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/phase_utils.h>
#include <actuate/dsp/core/sine_table.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr size_t kNumPartials = 16;

/// @brief Amplitude and phase of one harmonic.
struct Partial {
    float amplitude = 0.0f;  ///< [0, 1]
    float phase = 0.0f;      ///< Radians
};

using PartialTable = std::array<Partial, kNumPartials>;

/// @brief Default table: fundamental only.
[[nodiscard]] inline PartialTable makeFundamentalTable() noexcept {
    PartialTable table{};
    table[0].amplitude = 1.0f;
    return table;
}

class AdditiveOscillator {
public:
    AdditiveOscillator() noexcept { partials_ = makeFundamentalTable(); }

    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        phaseAcc_.setFrequency(frequency_, sampleRate_);
        updateNormalization();
        reset();
    }

    void reset() noexcept { phaseAcc_.reset(); }

    /// @brief Shared lookup table; std::sin is used while none is set.
    void setSineTable(const SineTable* table) noexcept { sineTable_ = table; }

    void resetPhase(double newPhase = 0.0) noexcept { phaseAcc_.phase = wrapPhase(newPhase); }

    void setFrequency(float hz) noexcept {
        if (detail::isNonFinite(hz) || hz < 0.0f) {
            hz = 0.0f;
        }
        if (hz != frequency_) {
            frequency_ = hz;
            phaseAcc_.setFrequency(frequency_, sampleRate_);
            updateNormalization();
        }
    }

    void setPartials(const PartialTable& partials) noexcept {
        for (size_t k = 0; k < kNumPartials; ++k) {
            partials_[k].amplitude = std::clamp(detail::sanitize(partials[k].amplitude), 0.0f, 1.0f);
            partials_[k].phase = detail::sanitize(partials[k].phase);
        }
        updateNormalization();
    }

    /// @brief Scale applied to partials 2..16, [0, 1].
    void setPartialLevel(float level) noexcept {
        const float clamped = std::clamp(detail::sanitize(level), 0.0f, 1.0f);
        if (clamped != partialLevel_) {
            partialLevel_ = clamped;
            updateNormalization();
        }
    }

    [[nodiscard]] const PartialTable& partials() const noexcept { return partials_; }
    [[nodiscard]] double phase() const noexcept { return phaseAcc_.phase; }

    /// @brief Number of partials below Nyquist at the current frequency.
    [[nodiscard]] size_t audiblePartialCount() const noexcept { return audible_; }

    /// @param phaseModulation Phase offset in radians for this sample
    [[nodiscard]] float process(float phaseModulation = 0.0f) noexcept {
        // Phases in cycles here; partial phase offsets are stored in radians
        const float base = static_cast<float>(phaseAcc_.phase) + phaseModulation * kInvTwoPi;
        float sum = 0.0f;
        for (size_t k = 0; k < audible_; ++k) {
            const float amp = (k == 0) ? partials_[k].amplitude
                                       : partials_[k].amplitude * partialLevel_;
            if (amp == 0.0f) continue;
            const float cycles = static_cast<float>(k + 1) * base + partials_[k].phase * kInvTwoPi;
            sum += amp * (sineTable_ != nullptr ? sineTable_->lookup(cycles)
                                                : std::sin(kTwoPi * cycles));
        }
        (void)phaseAcc_.advance();
        return detail::sanitize(sum * normalization_);
    }

private:
    void updateNormalization() noexcept {
        const float nyquist = sampleRate_ * 0.5f;
        audible_ = 0;
        for (size_t k = 0; k < kNumPartials; ++k) {
            if (frequency_ * static_cast<float>(k + 1) >= nyquist) break;
            audible_ = k + 1;
        }

        float total = 0.0f;
        for (size_t k = 0; k < audible_; ++k) {
            total += (k == 0) ? partials_[k].amplitude : partials_[k].amplitude * partialLevel_;
        }
        normalization_ = (total > 1.0f) ? 1.0f / total : 1.0f;
    }

    PartialTable partials_{};
    const SineTable* sineTable_ = nullptr;
    PhaseAccumulator phaseAcc_;
    float sampleRate_ = 44100.0f;
    float frequency_ = 440.0f;
    float partialLevel_ = 1.0f;
    float normalization_ = 1.0f;
    size_t audible_ = kNumPartials;
};

} // namespace DSP
} // namespace Actuate
