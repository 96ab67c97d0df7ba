// ==============================================================================
// Actuate Plugin - Note Event Queue
// ==============================================================================
// Timestamped performance events from the control side to the audio thread.
//
// push() is wait-free (SpscQueue). Once per block the audio thread drains the
// queue into a fixed array, clamps each sample offset into the block and
// sorts by offset. The sort is an insertion sort: stable, so events sharing a
// timestamp keep their arrival order, and it never allocates. The engine then
// splits the block into segments at the event offsets.
// ==============================================================================

#pragma once

#include <actuate/dsp/primitives/spsc_queue.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace Actuate::DSP {

struct NoteEvent {
    enum class Type : uint8_t {
        NoteOn = 0,
        NoteOff,
        PitchBend,    ///< value: normalized bend [-1, +1]
        Aftertouch    ///< value: pressure [0, 1]
    };

    Type type = Type::NoteOn;
    uint32_t sampleOffset = 0;   ///< Position within the block
    uint8_t note = 0;
    uint8_t velocity = 0;        ///< 0-127; 0 on a note-on is a note-off
    float value = 0.0f;
};

inline constexpr size_t kNoteEventQueueCapacity = 1024;
inline constexpr size_t kMaxEventsPerBlock = 512;

class NoteEventQueue {
public:
    NoteEventQueue() noexcept = default;

    NoteEventQueue(const NoteEventQueue&) = delete;
    NoteEventQueue& operator=(const NoteEventQueue&) = delete;

    /// @brief Producer side. Returns false (event dropped) when full.
    bool push(const NoteEvent& event) noexcept { return queue_.push(event); }

    /// @brief Audio thread: take every pending event for a block of
    /// numSamples, sorted by sample offset.
    /// @return Number of events now readable through events()
    size_t drain(size_t numSamples) noexcept {
        count_ = 0;
        const auto lastOffset = static_cast<uint32_t>(numSamples > 0 ? numSamples - 1 : 0);
        NoteEvent event;
        while (count_ < kMaxEventsPerBlock && queue_.pop(event)) {
            if (event.sampleOffset > lastOffset) {
                event.sampleOffset = lastOffset;
            }
            sorted_[count_++] = event;
        }

        for (size_t i = 1; i < count_; ++i) {
            const NoteEvent key = sorted_[i];
            size_t j = i;
            while (j > 0 && sorted_[j - 1].sampleOffset > key.sampleOffset) {
                sorted_[j] = sorted_[j - 1];
                --j;
            }
            sorted_[j] = key;
        }
        return count_;
    }

    [[nodiscard]] const NoteEvent& event(size_t index) const noexcept { return sorted_[index]; }
    [[nodiscard]] size_t size() const noexcept { return count_; }

    /// @brief Audio thread: discard pending and drained events.
    void clear() noexcept {
        queue_.clear();
        count_ = 0;
    }

private:
    SpscQueue<NoteEvent, kNoteEventQueueCapacity> queue_;
    std::array<NoteEvent, kMaxEventsPerBlock> sorted_{};
    size_t count_ = 0;
};

} // namespace Actuate::DSP
