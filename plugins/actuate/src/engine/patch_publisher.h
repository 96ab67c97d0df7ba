// ==============================================================================
// Actuate Plugin - Patch Publisher
// ==============================================================================
// Triple buffer that hands SynthPatch snapshots from the control thread to the
// audio thread without locks.
//
// Three slots: the writer owns one (back), the reader owns one (front) and the
// third (middle) is exchanged through a single atomic byte holding its index
// plus a "fresh" bit.
//
//   control  publish():  fill back, then swap back <-> middle, marking fresh
//   audio    acquire():  if middle is fresh, swap front <-> middle
//
// The reader always sees the most recently completed snapshot; intermediate
// publishes between two acquires are skipped.
// ==============================================================================

#pragma once

#include "synth_patch.h"

#include <array>
#include <atomic>
#include <cstdint>

namespace Actuate::DSP {

class PatchPublisher {
public:
    PatchPublisher() noexcept = default;

    PatchPublisher(const PatchPublisher&) = delete;
    PatchPublisher& operator=(const PatchPublisher&) = delete;

    /// @brief Control thread: make patch the latest snapshot.
    void publish(const SynthPatch& patch) noexcept {
        slots_[back_] = patch;
        const uint8_t previous = middle_.exchange(
            static_cast<uint8_t>(back_ | kFreshBit), std::memory_order_acq_rel);
        back_ = static_cast<uint8_t>(previous & kIndexMask);
        publishCount_.fetch_add(1, std::memory_order_relaxed);
    }

    /// @brief Audio thread: latest snapshot. Valid until the next acquire().
    /// @param changed Set to true when a newer snapshot was picked up
    [[nodiscard]] const SynthPatch& acquire(bool& changed) noexcept {
        changed = false;
        if ((middle_.load(std::memory_order_relaxed) & kFreshBit) != 0) {
            const uint8_t previous = middle_.exchange(front_, std::memory_order_acq_rel);
            front_ = static_cast<uint8_t>(previous & kIndexMask);
            changed = true;
        }
        return slots_[front_];
    }

    [[nodiscard]] const SynthPatch& acquire() noexcept {
        bool changed = false;
        return acquire(changed);
    }

    /// @brief Number of publish() calls so far.
    [[nodiscard]] uint64_t publishCount() const noexcept {
        return publishCount_.load(std::memory_order_relaxed);
    }

private:
    static constexpr uint8_t kIndexMask = 0x3;
    static constexpr uint8_t kFreshBit = 0x4;

    std::array<SynthPatch, 3> slots_{};
    std::atomic<uint8_t> middle_{1};
    std::atomic<uint64_t> publishCount_{0};
    uint8_t front_ = 0;   // Audio thread only
    uint8_t back_ = 2;    // Control thread only
};

} // namespace Actuate::DSP
