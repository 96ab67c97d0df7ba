// ==============================================================================
// Layer 3: System Component - Voice Allocator
// ==============================================================================
// Note-to-voice routing for the polyphonic engine. Owns no DSP: it returns
// VoiceEvent instructions that the engine applies to its voice pool.
//
// Allocation order for a note-on:
//   1. a free voice
//   2. otherwise the oldest voice in release
//   3. otherwise the oldest voice
// A steal always takes the whole unison group of the victim. Exceeding the
// polyphony steals, it never rejects.
//
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Query methods read atomics and may be called from any thread.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/pitch_utils.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Actuate {
namespace DSP {

/// Voice lifecycle state.
enum class VoiceState : uint8_t {
    Idle = 0,      ///< Available for assignment
    Active = 1,    ///< Playing a held note (gate on)
    Releasing = 2  ///< Note-off received, release tail active (gate off)
};

/// Lightweight event descriptor returned by the allocator.
struct VoiceEvent {
    enum class Type : uint8_t {
        NoteOn = 0,   ///< Voice should begin (or restart) playing
        NoteOff = 1,  ///< Voice should enter release
        Steal = 2     ///< Voice is hard-stolen: silence it before reuse
    };

    Type type;
    uint8_t voiceIndex;
    uint8_t note;
    uint8_t velocity;
    float frequency;        ///< Note frequency including pitch bend
    uint8_t unisonIndex;    ///< Position within the unison group
    uint8_t unisonCount;    ///< Size of the unison group
};

class VoiceAllocator {
public:
    static constexpr size_t kMaxVoices = 32;
    static constexpr size_t kDefaultVoiceCount = 16;
    static constexpr size_t kMaxUnisonCount = 9;
    static constexpr size_t kMaxEvents = kMaxVoices * 2;
    static constexpr float kDefaultPitchBendRange = 2.0f;

    VoiceAllocator() noexcept { reset(); }

    // =========================================================================
    // Note Events
    // =========================================================================

    /// @brief Allocate voices for a note. Velocity 0 is a note-off.
    /// @return Events, valid until the next call that returns a span
    [[nodiscard]] std::span<const VoiceEvent> noteOn(uint8_t note, uint8_t velocity) noexcept {
        if (velocity == 0) {
            return noteOff(note);
        }

        eventCount_ = 0;
        note = std::min<uint8_t>(note, 127);
        const size_t groupSize = std::min(unisonCount_, voiceCount_);
        const uint64_t stamp = ++clock_;

        // A re-struck note reuses its own voices first
        std::array<size_t, kMaxUnisonCount> assigned{};
        size_t count = 0;
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) != VoiceState::Idle && voices_[v].note == note) {
                if (count < groupSize) {
                    claimVoice(v, stamp);
                    assigned[count++] = v;
                } else {
                    freeVoice(v);
                    pushEvent(VoiceEvent::Type::Steal, v);
                }
            }
        }

        while (count < groupSize) {
            size_t v = findIdleVoice();
            if (v == kMaxVoices) {
                stealGroup(findStealVictim());
                v = findIdleVoice();
                if (v == kMaxVoices) break;
            }
            claimVoice(v, stamp);
            assigned[count++] = v;
        }

        for (size_t u = 0; u < count; ++u) {
            const size_t v = assigned[u];
            auto& voice = voices_[v];
            voice.note = note;
            voice.velocity = velocity;
            voice.unisonIndex = static_cast<uint8_t>(u);
            voice.unisonCount = static_cast<uint8_t>(count);
            voiceNotes_[v].store(static_cast<int8_t>(note), std::memory_order_relaxed);
            pushEvent(VoiceEvent::Type::NoteOn, v);
        }

        updateActiveCount();
        return {events_.data(), eventCount_};
    }

    /// @brief Release every voice of a note. Unknown notes yield no events.
    [[nodiscard]] std::span<const VoiceEvent> noteOff(uint8_t note) noexcept {
        eventCount_ = 0;
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) == VoiceState::Active && voices_[v].note == note) {
                setState(v, VoiceState::Releasing);
                pushEvent(VoiceEvent::Type::NoteOff, v);
            }
        }
        return {events_.data(), eventCount_};
    }

    /// @brief Release every sounding voice.
    [[nodiscard]] std::span<const VoiceEvent> allNotesOff() noexcept {
        eventCount_ = 0;
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) == VoiceState::Active) {
                setState(v, VoiceState::Releasing);
                pushEvent(VoiceEvent::Type::NoteOff, v);
            }
        }
        return {events_.data(), eventCount_};
    }

    /// @brief A voice's release tail has gone silent. Returns it to the pool.
    /// Ignored for out-of-range indices and idle voices.
    void voiceFinished(size_t voiceIndex) noexcept {
        if (voiceIndex >= kMaxVoices || state(voiceIndex) == VoiceState::Idle) {
            return;
        }
        freeVoice(voiceIndex);
        updateActiveCount();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Set the polyphony, clamped to [1, kMaxVoices]. Voices above the
    /// new count are released.
    [[nodiscard]] std::span<const VoiceEvent> setVoiceCount(size_t count) noexcept {
        eventCount_ = 0;
        count = std::clamp<size_t>(count, 1, kMaxVoices);
        for (size_t v = count; v < voiceCount_; ++v) {
            if (state(v) == VoiceState::Active) {
                setState(v, VoiceState::Releasing);
                pushEvent(VoiceEvent::Type::NoteOff, v);
            }
        }
        voiceCount_ = count;
        return {events_.data(), eventCount_};
    }

    /// @brief Voices per note, clamped to [1, kMaxUnisonCount]. Applies to
    /// subsequent note-ons.
    void setUnisonCount(size_t count) noexcept {
        unisonCount_ = std::clamp<size_t>(count, 1, kMaxUnisonCount);
    }

    /// @brief Global pitch bend in semitones. NaN/Inf ignored.
    void setPitchBend(float semitones) noexcept {
        if (detail::isNonFinite(semitones)) return;
        pitchBend_ = semitones;
    }

    /// @brief A4 reference in Hz. NaN/Inf and non-positive values ignored.
    void setTuningReference(float a4Hz) noexcept {
        if (detail::isNonFinite(a4Hz) || a4Hz <= 0.0f) return;
        tuningReference_ = a4Hz;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @return MIDI note of a voice, or -1 if idle
    [[nodiscard]] int getVoiceNote(size_t voiceIndex) const noexcept {
        if (voiceIndex >= kMaxVoices) return -1;
        return voiceNotes_[voiceIndex].load(std::memory_order_relaxed);
    }

    [[nodiscard]] VoiceState getVoiceState(size_t voiceIndex) const noexcept {
        if (voiceIndex >= kMaxVoices) return VoiceState::Idle;
        return state(voiceIndex);
    }

    [[nodiscard]] bool isVoiceActive(size_t voiceIndex) const noexcept {
        return getVoiceState(voiceIndex) != VoiceState::Idle;
    }

    [[nodiscard]] uint32_t getActiveVoiceCount() const noexcept {
        return activeCount_.load(std::memory_order_relaxed);
    }

    /// @return Trigger stamp of a voice; larger is younger
    [[nodiscard]] uint64_t getVoiceAge(size_t voiceIndex) const noexcept {
        return voiceIndex < kMaxVoices ? voices_[voiceIndex].age : 0;
    }

    [[nodiscard]] size_t getVoiceCount() const noexcept { return voiceCount_; }
    [[nodiscard]] size_t getUnisonCount() const noexcept { return unisonCount_; }
    [[nodiscard]] float getPitchBend() const noexcept { return pitchBend_; }

    /// @brief Frequency of a note with the current pitch bend and tuning.
    [[nodiscard]] float noteFrequency(uint8_t note) const noexcept {
        return midiNoteToFrequency(static_cast<float>(note) + pitchBend_, tuningReference_);
    }

    /// @brief All voices idle. No events generated.
    void reset() noexcept {
        for (size_t v = 0; v < kMaxVoices; ++v) {
            voices_[v] = VoiceSlot{};
            voiceStates_[v].store(static_cast<uint8_t>(VoiceState::Idle), std::memory_order_relaxed);
            voiceNotes_[v].store(-1, std::memory_order_relaxed);
        }
        eventCount_ = 0;
        clock_ = 0;
        activeCount_.store(0, std::memory_order_relaxed);
    }

private:
    struct VoiceSlot {
        uint8_t note = 0;
        uint8_t velocity = 0;
        uint8_t unisonIndex = 0;
        uint8_t unisonCount = 1;
        uint64_t age = 0;    ///< Trigger stamp
        uint64_t group = 0;  ///< Shared by all voices of one note-on
    };

    [[nodiscard]] VoiceState state(size_t v) const noexcept {
        return static_cast<VoiceState>(voiceStates_[v].load(std::memory_order_relaxed));
    }

    void setState(size_t v, VoiceState s) noexcept {
        voiceStates_[v].store(static_cast<uint8_t>(s), std::memory_order_relaxed);
    }

    /// Mark a voice as taken by the note-on with this stamp, so the steal
    /// search never picks it while the group is still being assembled.
    void claimVoice(size_t v, uint64_t stamp) noexcept {
        voices_[v].age = stamp;
        voices_[v].group = stamp;
        setState(v, VoiceState::Active);
    }

    void freeVoice(size_t v) noexcept {
        setState(v, VoiceState::Idle);
        voiceNotes_[v].store(-1, std::memory_order_relaxed);
    }

    [[nodiscard]] size_t findIdleVoice() const noexcept {
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) == VoiceState::Idle) return v;
        }
        return kMaxVoices;
    }

    /// Oldest releasing voice, else oldest voice. Ties go to the lower index.
    [[nodiscard]] size_t findStealVictim() const noexcept {
        size_t victim = kMaxVoices;
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) == VoiceState::Releasing &&
                (victim == kMaxVoices || voices_[v].age < voices_[victim].age)) {
                victim = v;
            }
        }
        if (victim != kMaxVoices) return victim;

        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) != VoiceState::Idle &&
                (victim == kMaxVoices || voices_[v].age < voices_[victim].age)) {
                victim = v;
            }
        }
        return victim;
    }

    void stealGroup(size_t victim) noexcept {
        if (victim >= kMaxVoices) return;
        const uint64_t group = voices_[victim].group;
        for (size_t v = 0; v < voiceCount_; ++v) {
            if (state(v) != VoiceState::Idle && voices_[v].group == group) {
                pushEvent(VoiceEvent::Type::Steal, v);
                freeVoice(v);
            }
        }
    }

    void pushEvent(VoiceEvent::Type type, size_t v) noexcept {
        if (eventCount_ >= kMaxEvents) return;
        const auto& voice = voices_[v];
        events_[eventCount_++] = VoiceEvent{type, static_cast<uint8_t>(v), voice.note,
                                            voice.velocity, noteFrequency(voice.note),
                                            voice.unisonIndex, voice.unisonCount};
    }

    void updateActiveCount() noexcept {
        uint32_t count = 0;
        for (size_t v = 0; v < kMaxVoices; ++v) {
            if (state(v) != VoiceState::Idle) ++count;
        }
        activeCount_.store(count, std::memory_order_relaxed);
    }

    std::array<VoiceSlot, kMaxVoices> voices_{};
    std::array<std::atomic<uint8_t>, kMaxVoices> voiceStates_{};
    std::array<std::atomic<int8_t>, kMaxVoices> voiceNotes_{};
    std::array<VoiceEvent, kMaxEvents> events_{};
    size_t eventCount_ = 0;
    size_t voiceCount_ = kDefaultVoiceCount;
    size_t unisonCount_ = 1;
    uint64_t clock_ = 0;
    float pitchBend_ = 0.0f;
    float tuningReference_ = kDefaultTuningReference;
    std::atomic<uint32_t> activeCount_{0};
};

} // namespace DSP
} // namespace Actuate
