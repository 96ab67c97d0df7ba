// ==============================================================================
// Actuate Plugin - Synthesizer Engine
// ==============================================================================
// Top-level polyphonic engine. Composes the voice allocator, 32 pre-allocated
// ActuateVoice instances, three global LFOs, the master effects chain and the
// output stage.
//
// Control side (any single thread):  publishPatch(), pushEvent(),
//                                    setSampleBank(), setTempo()
// Audio thread:                      processBlock()
//
// Signal flow:
//   Voices (summed, equal-power panned) -> Stereo Width (M/S)
//     -> Effects Chain -> Gain Compensation -> Master Gain
//     -> Soft Limit (tanh knee above 0.9) -> NaN/Inf Flush -> Output
//
// Events are sample-accurate: the block is split into segments at event
// offsets, and each segment is rendered in control chunks of at most
// kVoiceControlInterval samples.
// ==============================================================================

#pragma once

#include "actuate_effects_chain.h"
#include "actuate_voice.h"
#include "note_event_queue.h"
#include "patch_publisher.h"
#include "synth_patch.h"

#include <actuate/dsp/core/block_context.h>
#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/stereo_utils.h>
#include <actuate/dsp/primitives/lfo.h>
#include <actuate/dsp/systems/engine_diagnostics.h>
#include <actuate/dsp/systems/sample_bank.h>
#include <actuate/dsp/systems/synth_context.h>
#include <actuate/dsp/systems/voice_allocator.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace Actuate::DSP {

/// @brief Complete polyphonic Actuate engine.
///
/// @par Thread Safety
/// One control thread and one audio thread. The control side hands over
/// patches, events, sample banks and tempo through lock-free channels.
///
/// @par Real-Time Safety
/// processBlock() is real-time safe. prepare() is NOT (allocates scratch
/// buffers, LFO tables and effect delay memory).
class ActuateEngine {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr size_t kMaxPolyphony = VoiceAllocator::kMaxVoices;
    static constexpr float kMinMasterGain = 0.0f;
    static constexpr float kMaxMasterGain = 2.0f;
    static constexpr float kMaxMasterWidth = 2.0f;
    static constexpr float kGainSmoothCoeff = 0.005f;
    static constexpr float kSoftLimitKnee = 0.9f;
    static constexpr size_t kMaxPendingDiagnostics = 32;

    ActuateEngine() noexcept = default;

    ActuateEngine(const ActuateEngine&) = delete;
    ActuateEngine& operator=(const ActuateEngine&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Initialize all sub-components for the context. NOT real-time safe.
    void prepare(const SynthContext& context) {
        context_ = context;
        maxBlockSize_ = context.maxBlockSize;

        for (size_t i = 0; i < kMaxPolyphony; ++i) {
            voices_[i].prepare(context_, i);
        }
        for (auto& lfo : lfos_) {
            lfo.prepare(context_.sampleRate);
        }
        effects_.prepare(context_.sampleRate);

        voiceScratchL_.assign(maxBlockSize_, 0.0f);
        voiceScratchR_.assign(maxBlockSize_, 0.0f);
        mixBufferL_.assign(maxBlockSize_, 0.0f);
        mixBufferR_.assign(maxBlockSize_, 0.0f);

        prepared_ = true;
        applyPatch(publisher_.acquire());
        reset();
    }

    /// @brief Silence every voice and clear effect tails. Real-time safe.
    void reset() noexcept {
        for (auto& voice : voices_) {
            voice.reset();
        }
        allocator_.reset();
        [[maybe_unused]] auto resetEvents = allocator_.setVoiceCount(patch_.voiceCount);
        for (auto& lfo : lfos_) {
            lfo.reset();
        }
        effects_.reset();
        events_.clear();
        pitchBend_ = 0.0f;
        aftertouch_ = 0.0f;
        smoothedGainCompensation_ = 1.0f;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    /// @brief Enable/disable the output soft limiter (enabled by default).
    void setSoftLimitEnabled(bool enabled) noexcept { softLimitEnabled_ = enabled; }
    [[nodiscard]] bool isSoftLimitEnabled() const noexcept { return softLimitEnabled_; }

    /// @brief Identity below kSoftLimitKnee, tanh knee above, bounded by 1.
    [[nodiscard]] static float softLimit(float x) noexcept {
        const float magnitude = std::abs(x);
        if (magnitude <= kSoftLimitKnee) {
            return x;
        }
        constexpr float range = 1.0f - kSoftLimitKnee;
        const float limited = kSoftLimitKnee + range * std::tanh((magnitude - kSoftLimitKnee) / range);
        return std::copysign(limited, x);
    }

    // =========================================================================
    // Control Side
    // =========================================================================

    /// @brief Hand a new patch to the audio thread. Never blocks.
    void publishPatch(const SynthPatch& patch) noexcept { publisher_.publish(patch); }

    /// @brief Queue a performance event. Returns false if the queue is full.
    bool pushEvent(const NoteEvent& event) noexcept { return events_.push(event); }

    /// @brief Install (or clear, with nullptr) the sample bank of module m.
    /// Also frees banks the audio thread has released.
    void setSampleBank(size_t module, std::shared_ptr<const SampleBank> bank) {
        if (module >= kNumAudioModules) return;
        bankSlots_[module].publish(std::move(bank));
    }

    [[nodiscard]] const std::shared_ptr<const SampleBank>& sampleBank(size_t module) const noexcept {
        return bankSlots_[std::min(module, kNumAudioModules - 1)].current();
    }

    /// @brief Free retired sample banks. Call periodically from the control side.
    void collectGarbage() {
        for (auto& slot : bankSlots_) {
            slot.collect();
        }
    }

    /// @brief Host tempo in BPM, clamped to [20, 300].
    void setTempo(double bpm) noexcept {
        if (!std::isfinite(bpm)) return;
        tempo_.store(std::clamp(bpm, kMinTempoBPM, kMaxTempoBPM), std::memory_order_relaxed);
    }

    [[nodiscard]] DiagnosticQueue& diagnostics() noexcept { return diagnostics_; }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t getActiveVoiceCount() const noexcept {
        return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(),
            [](const ActuateVoice& v) { return v.isActive(); }));
    }

    [[nodiscard]] const ActuateVoice& voice(size_t index) const noexcept {
        return voices_[std::min(index, kMaxPolyphony - 1)];
    }

    [[nodiscard]] const VoiceAllocator& allocator() const noexcept { return allocator_; }

    /// @brief Patch the audio thread is currently rendering with.
    [[nodiscard]] const SynthPatch& currentPatch() const noexcept { return patch_; }

    [[nodiscard]] const ActuateEffectsChain& effects() const noexcept { return effects_; }

    /// @brief Diagnostics held back because the queue was full.
    [[nodiscard]] size_t pendingDiagnosticCount() const noexcept { return pendingCount_; }

    /// @brief Diagnostics lost because the queue and the pending store were full.
    [[nodiscard]] uint32_t droppedDiagnosticCount() const noexcept { return droppedDiagnostics_; }

    /// @brief Voices silenced because they produced NaN or Inf.
    [[nodiscard]] uint32_t voiceFaultCount() const noexcept { return voiceFaults_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Render one block. Blocks longer than the prepared maximum are
    /// rendered in pieces and reported as an Overrun diagnostic.
    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        if (!prepared_ || numSamples == 0) {
            if (left != nullptr) std::fill(left, left + numSamples, 0.0f);
            if (right != nullptr) std::fill(right, right + numSamples, 0.0f);
            return;
        }

        // Step 1: Pick up the latest patch, sample banks and tempo
        bool changed = false;
        const SynthPatch& published = publisher_.acquire(changed);
        if (changed) {
            applyPatch(published);
        }
        for (size_t m = 0; m < kNumAudioModules; ++m) {
            banks_[m] = bankSlots_[m].acquire();
        }
        flushPendingDiagnostics();
        const double tempo = tempo_.load(std::memory_order_relaxed);
        effects_.setTempo(tempo);
        for (auto& lfo : lfos_) {
            lfo.setTempo(static_cast<float>(tempo));
        }
        for (auto& voice : voices_) {
            voice.beginBlock(patch_.modRoutes);
        }

        // Step 2: Sorted events for the whole block
        const size_t eventCount = events_.drain(numSamples);
        size_t nextEvent = 0;

        if (numSamples > maxBlockSize_) {
            postDiagnostic(ActuateError::Overrun, 0, static_cast<float>(numSamples));
        }

        for (size_t base = 0; base < numSamples; base += maxBlockSize_) {
            const size_t n = std::min(maxBlockSize_, numSamples - base);
            renderSubBlock(left + base, right + base, base, n, eventCount, nextEvent);
        }
    }

private:
    // =========================================================================
    // Patch Application
    // =========================================================================

    void applyPatch(const SynthPatch& published) noexcept {
        patch_ = published;

        handleVoiceEvents(allocator_.setVoiceCount(patch_.voiceCount));
        allocator_.setUnisonCount(patch_.unisonCount);
        allocator_.setTuningReference(patch_.tuningReference);
        allocator_.setPitchBend(pitchBend_ * patch_.pitchBendRange);
        refreshVoiceFrequencies();

        for (auto& voice : voices_) {
            voice.applyPatch(patch_);
        }

        for (size_t k = 0; k < kNumLfos; ++k) {
            const LfoPatch& lp = patch_.lfos[k];
            auto& lfo = lfos_[k];
            lfo.setWaveform(lp.waveform);
            lfo.setFrequency(lp.rateHz);
            lfo.setNoteValue(lp.noteValue, lp.modifier);
            lfo.setTempoSync(lp.sync);
            lfo.setRetrigger(lp.retrigger);
            lfo.setStartPhase(lp.startPhase);
        }

        effects_.setPatch(patch_.effects);
        masterGain_ = std::clamp(patch_.masterGain, kMinMasterGain, kMaxMasterGain);
        masterWidth_ = std::clamp(patch_.masterWidth, 0.0f, kMaxMasterWidth);
    }

    void refreshVoiceFrequencies() noexcept {
        for (auto& voice : voices_) {
            if (voice.isActive()) {
                voice.setNoteFrequency(allocator_.noteFrequency(voice.note()));
            }
        }
    }

    // =========================================================================
    // Event Handling
    // =========================================================================

    void handleEvent(const NoteEvent& event) noexcept {
        switch (event.type) {
            case NoteEvent::Type::NoteOn:
                if (event.velocity == 0) {
                    handleVoiceEvents(allocator_.noteOff(event.note));
                    break;
                }
                reportMissingBanks(event.note);
                handleVoiceEvents(allocator_.noteOn(event.note, event.velocity));
                for (auto& lfo : lfos_) {
                    lfo.noteOn();
                }
                break;
            case NoteEvent::Type::NoteOff:
                handleVoiceEvents(allocator_.noteOff(event.note));
                break;
            case NoteEvent::Type::PitchBend:
                if (detail::isNonFinite(event.value)) break;
                pitchBend_ = std::clamp(event.value, -1.0f, 1.0f);
                allocator_.setPitchBend(pitchBend_ * patch_.pitchBendRange);
                refreshVoiceFrequencies();
                break;
            case NoteEvent::Type::Aftertouch:
                if (detail::isNonFinite(event.value)) break;
                aftertouch_ = std::clamp(event.value, 0.0f, 1.0f);
                break;
        }
    }

    void handleVoiceEvents(std::span<const VoiceEvent> events) noexcept {
        for (const auto& e : events) {
            if (e.voiceIndex >= kMaxPolyphony) continue;
            auto& voice = voices_[e.voiceIndex];
            switch (e.type) {
                case VoiceEvent::Type::NoteOn:
                    voice.noteOn(e);
                    break;
                case VoiceEvent::Type::NoteOff:
                    voice.noteOff();
                    break;
                case VoiceEvent::Type::Steal:
                    voice.reset();
                    break;
            }
        }
    }

    /// Sample-reading modules with no bank play silence; say so once per note.
    void reportMissingBanks(uint8_t note) noexcept {
        for (size_t m = 0; m < kNumAudioModules; ++m) {
            if (usesSampleBank(patch_.modules[m].type) && banks_[m] == nullptr) {
                postDiagnostic(ActuateError::ResourceMissing, static_cast<uint8_t>(m),
                               static_cast<float>(note));
            }
        }
    }

    /// Reports that do not fit the queue wait in pending_ and are retried at
    /// the start of every block, oldest first.
    void postDiagnostic(ActuateError code, uint8_t module, float value) noexcept {
        const Diagnostic diagnostic{code, module, value};
        if (pendingCount_ == 0 && diagnostics_.push(diagnostic)) {
            return;
        }
        if (pendingCount_ < kMaxPendingDiagnostics) {
            pending_[pendingCount_++] = diagnostic;
            return;
        }
        ++droppedDiagnostics_;
    }

    void flushPendingDiagnostics() noexcept {
        size_t sent = 0;
        while (sent < pendingCount_ && diagnostics_.push(pending_[sent])) {
            ++sent;
        }
        if (sent > 0) {
            std::copy(pending_.begin() + static_cast<std::ptrdiff_t>(sent),
                      pending_.begin() + static_cast<std::ptrdiff_t>(pendingCount_),
                      pending_.begin());
            pendingCount_ -= sent;
        }
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    void renderSubBlock(float* left, float* right, size_t base, size_t numSamples,
                        size_t eventCount, size_t& nextEvent) noexcept {
        // Count voices before processing; voices finishing mid-block still
        // contributed audio.
        const size_t activeVoices = getActiveVoiceCount();

        std::fill_n(mixBufferL_.begin(), numSamples, 0.0f);
        std::fill_n(mixBufferR_.begin(), numSamples, 0.0f);

        const size_t end = base + numSamples;
        size_t pos = base;
        while (pos < end) {
            while (nextEvent < eventCount && events_.event(nextEvent).sampleOffset <= pos) {
                handleEvent(events_.event(nextEvent));
                ++nextEvent;
            }
            size_t segmentEnd = end;
            if (nextEvent < eventCount) {
                segmentEnd = std::min<size_t>(end, events_.event(nextEvent).sampleOffset);
            }
            while (pos < segmentEnd) {
                const size_t chunk = std::min(kVoiceControlInterval, segmentEnd - pos);
                renderChunk(pos - base, chunk);
                pos += chunk;
            }
        }

        // Stereo width (Mid/Side)
        if (masterWidth_ != 1.0f) {
            for (size_t s = 0; s < numSamples; ++s) {
                applyStereoWidth(mixBufferL_[s], mixBufferR_[s], masterWidth_);
            }
        }

        effects_.processBlock(mixBufferL_.data(), mixBufferR_.data(), numSamples);

        // 1/sqrt(N) keeps perceived loudness steady as voices stack up
        float targetCompensation = 1.0f;
        if (activeVoices > 1) {
            targetCompensation = 1.0f / std::sqrt(static_cast<float>(activeVoices));
        }
        for (size_t s = 0; s < numSamples; ++s) {
            smoothedGainCompensation_ += kGainSmoothCoeff
                * (targetCompensation - smoothedGainCompensation_);
            const float gain = masterGain_ * smoothedGainCompensation_;
            float l = mixBufferL_[s] * gain;
            float r = mixBufferR_[s] * gain;
            if (softLimitEnabled_) {
                l = softLimit(l);
                r = softLimit(r);
            }
            if (detail::isNonFinite(l)) l = 0.0f;
            if (detail::isNonFinite(r)) r = 0.0f;
            left[s] = l;
            right[s] = r;
        }
    }

    /// Render one control chunk of every active voice into the mix at offset.
    void renderChunk(size_t offset, size_t numSamples) noexcept {
        VoiceModulation modulation;
        for (size_t k = 0; k < kNumLfos; ++k) {
            const float value = lfos_[k].processBlockRate(numSamples);
            modulation.lfo[k] = patch_.lfos[k].enabled ? value : 0.0f;
        }
        modulation.aftertouch = aftertouch_;

        float* scratchL = voiceScratchL_.data();
        float* scratchR = voiceScratchR_.data();
        for (size_t i = 0; i < kMaxPolyphony; ++i) {
            auto& voice = voices_[i];
            if (!voice.isActive()) continue;

            if (!voice.processBlock(scratchL, scratchR, numSamples, modulation, banks_)) {
                ++voiceFaults_;
                allocator_.voiceFinished(i);
                continue;
            }
            for (size_t s = 0; s < numSamples; ++s) {
                mixBufferL_[offset + s] += scratchL[s];
                mixBufferR_[offset + s] += scratchR[s];
            }
            if (voice.isFinished()) {
                voice.reset();
                allocator_.voiceFinished(i);
            }
        }
    }

    // =========================================================================
    // State
    // =========================================================================

    SynthContext context_{};
    std::array<ActuateVoice, kMaxPolyphony> voices_{};
    VoiceAllocator allocator_;
    std::array<LFO, kNumLfos> lfos_{};
    ActuateEffectsChain effects_;

    PatchPublisher publisher_;
    SynthPatch patch_{};
    NoteEventQueue events_;
    std::array<SampleBankSlot, kNumAudioModules> bankSlots_{};
    ModuleBanks banks_{};
    DiagnosticQueue diagnostics_;
    std::array<Diagnostic, kMaxPendingDiagnostics> pending_{};
    size_t pendingCount_ = 0;
    uint32_t droppedDiagnostics_ = 0;
    std::atomic<double> tempo_{120.0};

    std::vector<float> voiceScratchL_;
    std::vector<float> voiceScratchR_;
    std::vector<float> mixBufferL_;
    std::vector<float> mixBufferR_;

    size_t maxBlockSize_ = 0;
    float masterGain_ = 1.0f;
    float masterWidth_ = 1.0f;
    float pitchBend_ = 0.0f;
    float aftertouch_ = 0.0f;
    float smoothedGainCompensation_ = 1.0f;
    uint32_t voiceFaults_ = 0;
    bool softLimitEnabled_ = true;
    bool prepared_ = false;
};

} // namespace Actuate::DSP
