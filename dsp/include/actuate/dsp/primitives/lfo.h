// ==============================================================================
// Layer 1: DSP Primitive - LFO (Low Frequency Oscillator)
// ==============================================================================
// Wavetable-based low frequency oscillator for modulation. Free-running or
// tempo-synced, with optional phase reset on note-on.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/note_value.h>
#include <actuate/dsp/core/phase_utils.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <vector>

namespace Actuate {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kMinLfoFrequency = 0.01f;   // Hz
inline constexpr float kMaxLfoFrequency = 20.0f;   // Hz
inline constexpr float kMinBPM = 1.0f;
inline constexpr float kMaxBPM = 999.0f;
inline constexpr size_t kLfoTableSize = 2048;      // Power of 2
inline constexpr size_t kLfoTableMask = kLfoTableSize - 1;
inline constexpr float kLfoCrossfadeTimeMs = 10.0f;  // Waveform transition time

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Available LFO waveform shapes. All outputs are bipolar [-1, +1].
enum class LfoWaveform : uint8_t {
    Sine = 0,       ///< Sinusoid
    Square,         ///< +1 first half, -1 second half
    Triangle,       ///< 0 -> 1 -> -1 -> 0
    Sawtooth,       ///< Rising -1 to +1
    Ramp,           ///< Falling +1 to -1
    PulseQuarter,   ///< +1 for the first quarter of the cycle
    PulseEighth     ///< +1 for the first eighth of the cycle
};

inline constexpr size_t kLfoWaveformCount = 7;

/// @brief When the LFO phase is reset.
enum class LfoRetrigger : uint8_t {
    None = 0,   ///< Free-running
    NoteOn      ///< Reset to the start phase on every note-on
};

// =============================================================================
// LFO Class
// =============================================================================

/// @brief Wavetable-based low frequency oscillator for modulation.
class LFO {
public:
    LFO() noexcept = default;
    ~LFO() = default;

    // Non-copyable, movable
    LFO(const LFO&) = delete;
    LFO& operator=(const LFO&) = delete;
    LFO(LFO&&) noexcept = default;
    LFO& operator=(LFO&&) noexcept = default;

    /// @brief Prepare the LFO for processing. Allocates the wavetables.
    void prepare(double sampleRate) noexcept {
        sampleRate_ = sampleRate;
        generateWavetables();
        updatePhaseIncrement();
        updateCrossfadeIncrement();
        reset();
    }

    /// @brief Reset the LFO to its start phase.
    void reset() noexcept {
        phaseAcc_.phase = startPhase_;
        crossfadeProgress_ = 1.0f;
        hasProcessed_ = false;
        lastOutput_ = 0.0f;
    }

    // =========================================================================
    // Processing (real-time safe)
    // =========================================================================

    /// @brief Generate one sample of LFO output.
    [[nodiscard]] float process() noexcept {
        hasProcessed_ = true;

        const float newValue = readWavetable(static_cast<size_t>(waveform_), phaseAcc_.phase);

        float output = newValue;
        if (crossfadeProgress_ < 1.0f) {
            output = crossfadeFromValue_ + crossfadeProgress_ * (newValue - crossfadeFromValue_);
            crossfadeProgress_ = std::min(1.0f, crossfadeProgress_ + crossfadeIncrement_);
        }

        (void)phaseAcc_.advance();
        lastOutput_ = output;
        return output;
    }

    /// @brief Advance the LFO by numSamples, returning the value at the
    /// start of the span. Used for block-rate modulation.
    [[nodiscard]] float processBlockRate(size_t numSamples) noexcept {
        const float value = process();
        if (numSamples > 1) {
            phaseAcc_.phase = wrapPhase(
                phaseAcc_.phase + phaseAcc_.increment * static_cast<double>(numSamples - 1));
            if (crossfadeProgress_ < 1.0f) {
                crossfadeProgress_ = std::min(
                    1.0f, crossfadeProgress_ + crossfadeIncrement_ * static_cast<float>(numSamples - 1));
            }
        }
        return value;
    }

    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

    // =========================================================================
    // Parameter Setters
    // =========================================================================

    /// @brief Set the waveform. Crossfades from the current value once
    /// processing has started.
    void setWaveform(LfoWaveform waveform) noexcept {
        if (waveform == waveform_) {
            return;
        }
        if (hasProcessed_) {
            crossfadeFromValue_ = lastOutput_;
            crossfadeProgress_ = 0.0f;
        }
        waveform_ = waveform;
    }

    void setFrequency(float hz) noexcept {
        frequency_ = std::clamp(hz, kMinLfoFrequency, kMaxLfoFrequency);
        if (!tempoSync_) {
            updatePhaseIncrement();
        }
    }

    /// @brief Start phase used by reset() and retrigger(), normalized [0, 1).
    void setStartPhase(float phase) noexcept {
        startPhase_ = wrapPhase(static_cast<double>(phase));
    }

    void setTempoSync(bool enabled) noexcept {
        tempoSync_ = enabled;
        if (tempoSync_) {
            updateTempoSyncFrequency();
        }
        updatePhaseIncrement();
    }

    void setTempo(float bpm) noexcept {
        bpm_ = std::clamp(bpm, kMinBPM, kMaxBPM);
        if (tempoSync_) {
            updateTempoSyncFrequency();
            updatePhaseIncrement();
        }
    }

    void setNoteValue(NoteValue value, NoteModifier modifier = NoteModifier::None) noexcept {
        noteValue_ = value;
        noteModifier_ = modifier;
        if (tempoSync_) {
            updateTempoSyncFrequency();
            updatePhaseIncrement();
        }
    }

    void setRetrigger(LfoRetrigger mode) noexcept { retrigger_ = mode; }

    /// @brief Called on every note-on. Resets phase in NoteOn mode.
    void noteOn() noexcept {
        if (retrigger_ == LfoRetrigger::NoteOn) {
            phaseAcc_.phase = startPhase_;
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] LfoWaveform waveform() const noexcept { return waveform_; }
    [[nodiscard]] double phase() const noexcept { return phaseAcc_.phase; }
    [[nodiscard]] float currentValue() const noexcept { return lastOutput_; }
    [[nodiscard]] bool tempoSyncEnabled() const noexcept { return tempoSync_; }

    /// @brief Frequency actually driving the phase (free or synced).
    [[nodiscard]] float effectiveFrequency() const noexcept {
        return tempoSync_ ? tempoSyncFrequency_ : frequency_;
    }

private:
    void generateWavetables() noexcept {
        for (auto& table : wavetables_) {
            table.resize(kLfoTableSize);
        }

        constexpr double twoPi = 2.0 * std::numbers::pi;

        for (size_t i = 0; i < kLfoTableSize; ++i) {
            const double phase = static_cast<double>(i) / static_cast<double>(kLfoTableSize);

            wavetables_[static_cast<size_t>(LfoWaveform::Sine)][i] =
                static_cast<float>(std::sin(twoPi * phase));

            wavetables_[static_cast<size_t>(LfoWaveform::Square)][i] =
                (phase < 0.5) ? 1.0f : -1.0f;

            float tri;
            if (phase < 0.25) {
                tri = static_cast<float>(phase * 4.0);
            } else if (phase < 0.75) {
                tri = static_cast<float>(2.0 - phase * 4.0);
            } else {
                tri = static_cast<float>(phase * 4.0 - 4.0);
            }
            wavetables_[static_cast<size_t>(LfoWaveform::Triangle)][i] = tri;

            wavetables_[static_cast<size_t>(LfoWaveform::Sawtooth)][i] =
                static_cast<float>(2.0 * phase - 1.0);

            wavetables_[static_cast<size_t>(LfoWaveform::Ramp)][i] =
                static_cast<float>(1.0 - 2.0 * phase);

            wavetables_[static_cast<size_t>(LfoWaveform::PulseQuarter)][i] =
                (phase < 0.25) ? 1.0f : -1.0f;

            wavetables_[static_cast<size_t>(LfoWaveform::PulseEighth)][i] =
                (phase < 0.125) ? 1.0f : -1.0f;
        }
    }

    /// Linear interpolation for the smooth shapes, direct lookup for the
    /// stepped ones so edges stay sharp.
    [[nodiscard]] float readWavetable(size_t tableIndex, double phase) const noexcept {
        const auto& table = wavetables_[tableIndex];
        if (table.empty()) {
            return 0.0f;
        }

        const double scaledPhase = phase * static_cast<double>(kLfoTableSize);
        const size_t index0 = static_cast<size_t>(scaledPhase) & kLfoTableMask;

        const auto wf = static_cast<LfoWaveform>(tableIndex);
        if (wf == LfoWaveform::Square || wf == LfoWaveform::PulseQuarter ||
            wf == LfoWaveform::PulseEighth) {
            return table[index0];
        }

        const size_t index1 = (index0 + 1) & kLfoTableMask;
        const float frac = static_cast<float>(scaledPhase - std::floor(scaledPhase));
        return table[index0] + frac * (table[index1] - table[index0]);
    }

    void updateTempoSyncFrequency() noexcept {
        const float beatsPerNote = getBeatsForNote(noteValue_, noteModifier_);
        const float beatsPerSecond = bpm_ / 60.0f;
        tempoSyncFrequency_ = std::clamp(beatsPerSecond / beatsPerNote, 0.001f, kMaxLfoFrequency);
    }

    void updatePhaseIncrement() noexcept {
        phaseAcc_.increment = calculatePhaseIncrement(effectiveFrequency(),
                                                      static_cast<float>(sampleRate_));
    }

    void updateCrossfadeIncrement() noexcept {
        const float crossfadeSamples = static_cast<float>(sampleRate_) * kLfoCrossfadeTimeMs * 0.001f;
        crossfadeIncrement_ = (crossfadeSamples > 1.0f) ? 1.0f / crossfadeSamples : 1.0f;
    }

    double sampleRate_ = 44100.0;
    PhaseAccumulator phaseAcc_;
    double startPhase_ = 0.0;

    std::array<std::vector<float>, kLfoWaveformCount> wavetables_;

    LfoWaveform waveform_ = LfoWaveform::Sine;
    LfoRetrigger retrigger_ = LfoRetrigger::None;
    float frequency_ = 2.0f;

    bool tempoSync_ = false;
    float bpm_ = 120.0f;
    NoteValue noteValue_ = NoteValue::Quarter;
    NoteModifier noteModifier_ = NoteModifier::None;
    float tempoSyncFrequency_ = 2.0f;

    float crossfadeFromValue_ = 0.0f;
    float crossfadeProgress_ = 1.0f;
    float crossfadeIncrement_ = 0.0f;
    bool hasProcessed_ = false;
    float lastOutput_ = 0.0f;
};

} // namespace DSP
} // namespace Actuate
