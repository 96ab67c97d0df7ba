// ==============================================================================
// Actuate Plugin - Voice Processing Unit
// ==============================================================================
// One polyphonic voice: three audio modules, FM between them, two pitch
// envelopes, the dual filter bank and a per-voice modulation matrix. All
// sub-components are sized at prepare(); note handling and rendering never
// allocate.
//
// Signal flow:
//   Module 1..3 (osc / additive / sampler / granulizer / single cycle)
//     -> amp envelope -> gain -> pan -> FilterBank routing -> Output
//
// Controls (tuning, gains, filter targets, sample selection) are recomputed
// once per processBlock() call; the engine calls it in chunks of at most
// kVoiceControlInterval samples.
// ==============================================================================

#pragma once

#include "actuate_types.h"
#include "synth_patch.h"

// Layer 0
#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/pitch_utils.h>
#include <actuate/dsp/core/random.h>
#include <actuate/dsp/core/stereo_utils.h>

// Layer 1
#include <actuate/dsp/primitives/adsr_envelope.h>
#include <actuate/dsp/primitives/oscillator.h>
#include <actuate/dsp/primitives/sample_buffer.h>

// Layer 2
#include <actuate/dsp/processors/additive_oscillator.h>
#include <actuate/dsp/processors/filter_bank.h>
#include <actuate/dsp/processors/fm_operator.h>
#include <actuate/dsp/processors/granulizer.h>
#include <actuate/dsp/processors/modulation_matrix.h>
#include <actuate/dsp/processors/sample_player.h>

// Layer 3
#include <actuate/dsp/systems/sample_bank.h>
#include <actuate/dsp/systems/synth_context.h>
#include <actuate/dsp/systems/voice_allocator.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate::DSP {

/// Samples per control-rate update inside a voice.
inline constexpr size_t kVoiceControlInterval = 32;

/// Consecutive silent samples, after every amp envelope has finished its
/// release, before a voice is retired.
inline constexpr size_t kVoiceRetireSilenceSamples = 64;

/// Output magnitude treated as silence when counting the release tail.
inline constexpr float kVoiceSilenceThreshold = 1.0e-5f;

/// Sample bank per audio module for one block, nullptr where none is loaded.
using ModuleBanks = std::array<const SampleBank*, kNumAudioModules>;

/// @brief Engine-level modulation source values for one control chunk.
struct VoiceModulation {
    std::array<float, kNumLfos> lfo{};
    float aftertouch = 0.0f;
};

/// @brief Complete per-voice processing unit.
///
/// @par Thread Safety
/// Audio thread only, except prepare().
///
/// @par Real-Time Safety
/// Everything except prepare() is real-time safe.
class ActuateVoice {
public:
    ActuateVoice() noexcept = default;

    ActuateVoice(const ActuateVoice&) = delete;
    ActuateVoice& operator=(const ActuateVoice&) = delete;
    ActuateVoice(ActuateVoice&&) noexcept = default;
    ActuateVoice& operator=(ActuateVoice&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Prepare every sub-component for the context's sample rate.
    /// @param voiceIndex Seeds the per-voice random generators
    void prepare(const SynthContext& context, size_t voiceIndex) noexcept {
        sampleRate_ = context.sampleRate;
        voiceIndex_ = voiceIndex;
        rng_.seed(kNoiseSeed + static_cast<uint32_t>(voiceIndex + 1) * 0x9E3779B9u);

        for (size_t m = 0; m < kNumAudioModules; ++m) {
            auto& mod = modules_[m];
            mod.oscillator.setVarianceSeed(varianceSeed(m));
            mod.oscillator.prepare(sampleRate_);
            mod.additive.prepare(sampleRate_);
            mod.additive.setSineTable(context.sineTable.get());
            mod.ampEnvelope.prepare(static_cast<float>(sampleRate_));
        }
        for (auto& env : pitchEnvelopes_) {
            env.prepare(static_cast<float>(sampleRate_));
        }
        fm_.prepare(sampleRate_);
        filters_.prepare(sampleRate_);
        prepared_ = true;
        reset();
    }

    /// @brief Silence immediately and clear all state.
    void reset() noexcept {
        for (auto& mod : modules_) {
            mod.oscillator.reset();
            mod.additive.reset();
            mod.player.reset();
            mod.granulizer.reset();
            mod.ampEnvelope.reset();
        }
        for (auto& env : pitchEnvelopes_) {
            env.reset();
        }
        fm_.reset();
        filters_.reset();
        active_ = false;
        released_ = false;
        silentRun_ = 0;
    }

    /// @brief Apply a new patch snapshot. The patch must outlive its use:
    /// the voice keeps a reference until the next applyPatch().
    void applyPatch(const SynthPatch& patch) noexcept {
        patch_ = &patch;
        for (size_t m = 0; m < kNumAudioModules; ++m) {
            const ModulePatch& mp = patch.modules[m];
            auto& mod = modules_[m];
            mod.oscillator.setShape(mp.shape);
            mod.additive.setPartials(mp.partials);
            mod.ampEnvelope.setShape(mp.ampEnvelope);
            if (mp.type == AudioModuleType::SingleCycle) {
                mod.player.setRegion(0.0f, 1.0f);
                mod.player.setLoop(true);
            } else {
                mod.player.setRegion(mp.startPosition, mp.endPosition);
                mod.player.setLoop(mp.loop);
            }
            mod.granulizer.setRegion(mp.startPosition, mp.endPosition);
            mod.granulizer.setLoop(mp.loop);
            mod.granulizer.setSettings(mp.grains);
            filterRouting_[m] = mp.filterRouting;
            if (mod.type != mp.type && active_) {
                // A type change mid-note starts the new source from the top
                triggerSource(m, mp.type);
            }
            mod.type = mp.type;
        }
        for (size_t k = 0; k < kNumPitchEnvelopes; ++k) {
            pitchEnvelopes_[k].setShape(patch.pitchEnvelopes[k].envelope);
        }
        for (size_t i = 0; i < kNumVoiceFilters; ++i) {
            filters_.setSettings(i, patch.filters[i]);
        }
        filters_.setRouting(patch.filterRouting);
        fm_.setSettings(patch.fm);
    }

    /// @brief Snapshot the modulation routes for this block.
    void beginBlock(const ModRouteTable& routes) noexcept { matrix_.beginBlock(routes); }

    // =========================================================================
    // Note Control
    // =========================================================================

    /// @brief Start (or restart) the voice for an allocator NoteOn event.
    void noteOn(const VoiceEvent& event) noexcept {
        if (!prepared_ || patch_ == nullptr) return;

        note_ = event.note;
        noteFrequency_ = event.frequency;
        unisonIndex_ = event.unisonIndex;
        unisonCount_ = std::max<uint8_t>(event.unisonCount, 1);
        matrix_.setSourceValue(ModSource::Velocity, static_cast<float>(event.velocity) / 127.0f);

        for (size_t m = 0; m < kNumAudioModules; ++m) {
            auto& mod = modules_[m];
            if (mod.type == AudioModuleType::Off) {
                mod.ampEnvelope.reset();
                continue;
            }
            triggerSource(m, mod.type);
            mod.ampEnvelope.gate(true);
        }
        for (auto& env : pitchEnvelopes_) {
            env.gate(true);
        }
        fm_.gate(true);
        filters_.gate(true);

        active_ = true;
        released_ = false;
        silentRun_ = 0;
    }

    /// @brief Enter release for every envelope.
    void noteOff() noexcept {
        if (!active_) return;
        for (auto& mod : modules_) {
            mod.ampEnvelope.gate(false);
        }
        for (auto& env : pitchEnvelopes_) {
            env.gate(false);
        }
        fm_.gate(false);
        filters_.gate(false);
        released_ = true;
        silentRun_ = 0;
    }

    /// @brief Note frequency after a pitch-bend or tuning change.
    void setNoteFrequency(float hz) noexcept {
        if (!detail::isNonFinite(hz) && hz > 0.0f) {
            noteFrequency_ = hz;
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] bool isActive() const noexcept { return active_; }
    [[nodiscard]] bool isReleased() const noexcept { return released_; }
    [[nodiscard]] uint8_t note() const noexcept { return note_; }
    [[nodiscard]] float noteFrequency() const noexcept { return noteFrequency_; }

    /// @brief True once every sounding module's amp envelope has finished
    /// its release and the output tail has been silent long enough.
    [[nodiscard]] bool isFinished() const noexcept {
        return active_ && released_ && ampEnvelopesIdle()
            && silentRun_ >= kVoiceRetireSilenceSamples;
    }

    [[nodiscard]] bool ampEnvelopesIdle() const noexcept {
        return std::none_of(modules_.begin(), modules_.end(), [](const Module& mod) {
            return mod.type != AudioModuleType::Off && mod.ampEnvelope.isActive();
        });
    }

    /// @brief Frequency module m played at the last control update.
    [[nodiscard]] float moduleFrequency(size_t m) const noexcept {
        return m < kNumAudioModules ? modules_[m].frequency : 0.0f;
    }

    [[nodiscard]] const ModulationMatrix& matrix() const noexcept { return matrix_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Render numSamples (at most kVoiceControlInterval) into left and
    /// right, overwriting them.
    /// @return false if the voice produced a non-finite sample; the output is
    /// then silent and the voice has been reset
    [[nodiscard]] bool processBlock(float* left, float* right, size_t numSamples,
                                    const VoiceModulation& modulation,
                                    const ModuleBanks& banks) noexcept {
        std::fill_n(left, numSamples, 0.0f);
        std::fill_n(right, numSamples, 0.0f);
        if (!active_ || patch_ == nullptr) {
            return true;
        }

        updateControls(modulation, banks);

        const bool fmActive = fm_.isActive();
        std::array<StereoFrame, kNumAudioModules> frames{};

        for (size_t i = 0; i < numSamples; ++i) {
            const FmOffsets fm = fmActive ? fm_.process() : FmOffsets{};
            for (auto& env : pitchEnvelopes_) {
                (void)env.process();
            }

            for (size_t m = 0; m < kNumAudioModules; ++m) {
                frames[m] = renderModule(m, fm);
            }

            const StereoFrame out = filters_.process(frames, filterRouting_);
            if (detail::isNonFinite(out.left) || detail::isNonFinite(out.right)) {
                std::fill_n(left, numSamples, 0.0f);
                std::fill_n(right, numSamples, 0.0f);
                reset();
                return false;
            }
            left[i] = out.left;
            right[i] = out.right;

            if (released_) {
                const bool silent = std::abs(out.left) < kVoiceSilenceThreshold &&
                                    std::abs(out.right) < kVoiceSilenceThreshold;
                silentRun_ = silent ? silentRun_ + 1 : 0;
            }
        }
        return true;
    }

private:
    struct Module {
        AudioModuleType type = AudioModuleType::Off;
        Oscillator oscillator;
        AdditiveOscillator additive;
        SamplePlayer player;
        Granulizer granulizer;
        ADSREnvelope ampEnvelope;
        SampleSelection selection{};
        PanGains pan{};
        float gain = 1.0f;
        float frequency = 0.0f;
    };

    [[nodiscard]] uint32_t varianceSeed(size_t module) const noexcept {
        return kNoiseSeed + static_cast<uint32_t>(voiceIndex_ * kNumAudioModules + module + 1);
    }

    /// Restart a module's source according to its retrigger mode.
    void triggerSource(size_t m, AudioModuleType type) noexcept {
        auto& mod = modules_[m];
        const OscRetrigger retrigger = patch_->modules[m].retrigger;
        switch (type) {
            case AudioModuleType::Off:
                break;
            case AudioModuleType::Oscillator: {
                const double phase = mod.oscillator.phase();
                mod.oscillator.setVarianceSeed(varianceSeed(m));
                mod.oscillator.reset();
                if (retrigger == OscRetrigger::Free) {
                    mod.oscillator.resetPhase(phase);
                } else if (retrigger == OscRetrigger::Random) {
                    mod.oscillator.resetPhase(rng_.nextUnipolar());
                }
                break;
            }
            case AudioModuleType::Additive:
                if (retrigger == OscRetrigger::Retrigger) {
                    mod.additive.resetPhase(0.0);
                } else if (retrigger == OscRetrigger::Random) {
                    mod.additive.resetPhase(rng_.nextUnipolar());
                }
                break;
            case AudioModuleType::Sampler:
            case AudioModuleType::SingleCycle:
                mod.player.trigger();
                break;
            case AudioModuleType::Granulizer:
                mod.granulizer.reset();
                mod.granulizer.trigger();
                break;
        }
    }

    /// Control-rate update: matrix sources, tuning, gains, pan, filters and
    /// sample selection.
    void updateControls(const VoiceModulation& modulation, const ModuleBanks& banks) noexcept {
        const SynthPatch& patch = *patch_;

        matrix_.setSourceValue(ModSource::Aftertouch, modulation.aftertouch);
        matrix_.setSourceValue(ModSource::Lfo1, modulation.lfo[0]);
        matrix_.setSourceValue(ModSource::Lfo2, modulation.lfo[1]);
        matrix_.setSourceValue(ModSource::Lfo3, modulation.lfo[2]);
        matrix_.setSourceValue(ModSource::FilterEnv1, filters_.envelopeLevel(0));
        matrix_.setSourceValue(ModSource::FilterEnv2, filters_.envelopeLevel(1));

        filters_.setTargets(0,
            matrix_.resolve(ModDestination::Cutoff1, patch.filters[0].cutoffHz),
            matrix_.resolve(ModDestination::Resonance1, patch.filters[0].resonance));
        filters_.setTargets(1,
            matrix_.resolve(ModDestination::Cutoff2, patch.filters[1].cutoffHz),
            matrix_.resolve(ModDestination::Resonance2, patch.filters[1].resonance));

        // Position of this voice within its unison group, [-1, +1]
        const float spread = unisonCount_ > 1
            ? 2.0f * static_cast<float>(unisonIndex_) / static_cast<float>(unisonCount_ - 1) - 1.0f
            : 0.0f;

        for (size_t m = 0; m < kNumAudioModules; ++m) {
            const ModulePatch& mp = patch.modules[m];
            auto& mod = modules_[m];
            if (mod.type == AudioModuleType::Off) continue;

            const float detune = matrix_.resolve(
                moduleDestination(ModDestination::Osc1Detune, m), mp.detune);
            const float uniDetune = matrix_.resolve(
                moduleDestination(ModDestination::Osc1UniDetune, m), mp.uniDetune);
            float semitones = static_cast<float>(mp.octave * 12 + mp.semitones)
                            + detune + spread * uniDetune;
            for (size_t k = 0; k < kNumPitchEnvelopes; ++k) {
                if (pitchEnvTargets(patch.pitchEnvelopes[k].routing, m)) {
                    semitones += pitchEnvelopes_[k].getOutput() * patch.pitchEnvelopes[k].peakSemitones;
                }
            }
            mod.frequency = noteFrequency_ * semitonesToRatio(semitones);
            mod.gain = matrix_.resolve(moduleDestination(ModDestination::Osc1Gain, m), mp.gain);
            mod.pan = equalPowerPan(std::clamp(
                mp.pan + unisonPanPosition(unisonIndex_, unisonCount_, mp.stereo, mp.stereoAlgorithm),
                -1.0f, 1.0f));

            switch (mod.type) {
                case AudioModuleType::Oscillator:
                    mod.oscillator.setFrequency(mod.frequency);
                    break;
                case AudioModuleType::Additive:
                    mod.additive.setFrequency(mod.frequency);
                    mod.additive.setPartialLevel(matrix_.resolve(
                        moduleDestination(ModDestination::Osc1PartialLevel, m), mp.partialLevel));
                    break;
                case AudioModuleType::Sampler:
                case AudioModuleType::Granulizer:
                    mod.selection = banks[m] != nullptr
                        ? banks[m]->select(frequencyToMidiNote(mod.frequency, patch.tuningReference))
                        : SampleSelection{};
                    break;
                case AudioModuleType::SingleCycle:
                    mod.selection = banks[m] != nullptr
                        ? banks[m]->selectSingleCycle(mod.frequency)
                        : SampleSelection{};
                    break;
                case AudioModuleType::Off:
                    break;
            }
        }

        fm_.setSourceFrequencies(modules_[0].frequency, modules_[1].frequency);
    }

    /// One sample of module m, enveloped, gained and panned.
    [[nodiscard]] StereoFrame renderModule(size_t m, const FmOffsets& fm) noexcept {
        auto& mod = modules_[m];
        if (mod.type == AudioModuleType::Off) {
            return {};
        }

        const float phaseMod = (m == 1) ? fm.module2 : ((m == 2) ? fm.module3 : 0.0f);
        const float amp = mod.ampEnvelope.process() * mod.gain;

        switch (mod.type) {
            case AudioModuleType::Oscillator: {
                mod.oscillator.setPhaseModulation(phaseMod);
                const float s = mod.oscillator.process() * amp;
                return {s * mod.pan.left, s * mod.pan.right};
            }
            case AudioModuleType::Additive: {
                const float s = mod.additive.process(phaseMod) * amp;
                return {s * mod.pan.left, s * mod.pan.right};
            }
            case AudioModuleType::Sampler:
            case AudioModuleType::SingleCycle:
                return balance(mod.player.process(mod.selection.buffer, mod.selection.rate), amp, mod.pan);
            case AudioModuleType::Granulizer:
                // Grains keep spawning through the release
                if (!mod.ampEnvelope.isActive()) {
                    mod.granulizer.stop();
                }
                return balance(mod.granulizer.process(mod.selection.buffer, mod.selection.rate), amp, mod.pan);
            case AudioModuleType::Off:
                break;
        }
        return {};
    }

    /// Stereo sources keep unity gain at centre pan.
    [[nodiscard]] static StereoFrame balance(StereoFrame in, float amp, PanGains pan) noexcept {
        const float scale = amp / kInvSqrt2;
        return {in.left * pan.left * scale, in.right * pan.right * scale};
    }

    std::array<Module, kNumAudioModules> modules_{};
    std::array<ModuleFilterRouting, kNumAudioModules> filterRouting_{
        ModuleFilterRouting::Filter1, ModuleFilterRouting::Filter1, ModuleFilterRouting::Filter1};
    std::array<ADSREnvelope, kNumPitchEnvelopes> pitchEnvelopes_{};
    FmOperator fm_;
    FilterBank filters_;
    ModulationMatrix matrix_;
    Xorshift32 rng_{kNoiseSeed};

    const SynthPatch* patch_ = nullptr;
    double sampleRate_ = 44100.0;
    size_t voiceIndex_ = 0;
    float noteFrequency_ = 0.0f;
    uint8_t note_ = 0;
    uint8_t unisonIndex_ = 0;
    uint8_t unisonCount_ = 1;
    size_t silentRun_ = 0;
    bool active_ = false;
    bool released_ = false;
    bool prepared_ = false;
};

} // namespace Actuate::DSP
