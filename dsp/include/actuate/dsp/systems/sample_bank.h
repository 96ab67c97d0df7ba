// ==============================================================================
// Layer 3: System Component - Sample Bank
// ==============================================================================
// Playable form of one loaded sample, built on the control thread.
//
// Restretch mode plays the source buffer with varispeed at
// 2^((note - 60) / 12). Otherwise one phase-vocoder copy per note in
// [lowNote, highNote] is rendered up front so that every note keeps the
// source duration and plays at unit rate; notes outside the range use the
// nearest copy with a rate correction.
//
// SampleBankSlot hands a bank to the audio thread without the audio thread
// ever freeing memory:
//   control  publish(): store pointer, then bump generation (release);
//            the old bank moves to a retire list
//   audio    acquire(): load generation (acquire), load pointer, then
//            acknowledge the generation
//   control  collect(): free retired banks whose replacement generation has
//            been acknowledged
// ==============================================================================

#pragma once

#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/pitch_utils.h>
#include <actuate/dsp/primitives/sample_buffer.h>
#include <actuate/dsp/processors/pitch_shifter.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace Actuate {
namespace DSP {

inline constexpr int kDefaultBankLowNote = 36;
inline constexpr int kDefaultBankHighNote = 84;

struct SampleBankOptions {
    bool restretch = true;
    int lowNote = kDefaultBankLowNote;
    int highNote = kDefaultBankHighNote;
};

/// @brief Buffer and playback rate for one note.
struct SampleSelection {
    const SampleBuffer* buffer = nullptr;
    double rate = 1.0;
};

class SampleBank {
public:
    /// @brief Build a bank. Allocates; control thread only.
    /// @return nullptr if source is null or the pitch shifter cannot be set up
    [[nodiscard]] static std::shared_ptr<const SampleBank> build(
        std::shared_ptr<const SampleBuffer> source, const SampleBankOptions& options) {
        if (!source || source->numFrames() == 0) {
            return nullptr;
        }

        std::shared_ptr<SampleBank> bank(new SampleBank(std::move(source), options));
        if (bank->restretch_) {
            return bank;
        }

        PitchShifter shifter;
        if (!shifter.prepare()) {
            return nullptr;
        }
        bank->shifted_.reserve(static_cast<size_t>(bank->highNote_ - bank->lowNote_ + 1));
        for (int note = bank->lowNote_; note <= bank->highNote_; ++note) {
            const float ratio = semitonesToRatio(static_cast<float>(note - kSampleRootNote));
            auto copy = shifter.process(*bank->source_, ratio);
            if (!copy) {
                return nullptr;
            }
            bank->shifted_.push_back(std::move(copy));
        }
        return bank;
    }

    [[nodiscard]] const SampleBuffer& source() const noexcept { return *source_; }
    [[nodiscard]] bool restretch() const noexcept { return restretch_; }
    [[nodiscard]] int lowNote() const noexcept { return lowNote_; }
    [[nodiscard]] int highNote() const noexcept { return highNote_; }
    [[nodiscard]] size_t shiftedCount() const noexcept { return shifted_.size(); }

    /// @brief Buffer and rate for a (fractional) note. Real-time safe.
    [[nodiscard]] SampleSelection select(float note) const noexcept {
        if (restretch_ || shifted_.empty()) {
            return {source_.get(), static_cast<double>(
                semitonesToRatio(note - static_cast<float>(kSampleRootNote)))};
        }
        const int nearest = std::clamp(static_cast<int>(std::lround(note)), lowNote_, highNote_);
        const auto index = static_cast<size_t>(nearest - lowNote_);
        return {shifted_[index].get(),
                static_cast<double>(semitonesToRatio(note - static_cast<float>(nearest)))};
    }

    /// @brief Whole source buffer as one wavetable cycle at frequencyHz.
    [[nodiscard]] SampleSelection selectSingleCycle(float frequencyHz) const noexcept {
        const double rate = static_cast<double>(std::max(0.0f, frequencyHz))
                          * static_cast<double>(source_->numFrames()) / source_->sampleRate();
        return {source_.get(), rate};
    }

private:
    SampleBank(std::shared_ptr<const SampleBuffer> source, const SampleBankOptions& options)
        : source_(std::move(source))
        , restretch_(options.restretch)
        , lowNote_(std::clamp(std::min(options.lowNote, options.highNote), 0, 127))
        , highNote_(std::clamp(std::max(options.lowNote, options.highNote), 0, 127)) {}

    std::shared_ptr<const SampleBuffer> source_;
    std::vector<std::shared_ptr<const SampleBuffer>> shifted_;
    bool restretch_ = true;
    int lowNote_ = kDefaultBankLowNote;
    int highNote_ = kDefaultBankHighNote;
};

// =============================================================================
// SampleBankSlot
// =============================================================================

class SampleBankSlot {
public:
    SampleBankSlot() = default;
    SampleBankSlot(const SampleBankSlot&) = delete;
    SampleBankSlot& operator=(const SampleBankSlot&) = delete;

    /// @brief Control thread: make bank current (nullptr clears the slot).
    void publish(std::shared_ptr<const SampleBank> bank) {
        collect();
        if (current_) {
            retired_.push_back({std::move(current_), generation_.load(std::memory_order_relaxed) + 1});
        }
        current_ = std::move(bank);
        bank_.store(current_.get(), std::memory_order_relaxed);
        generation_.fetch_add(1, std::memory_order_release);
    }

    /// @brief Control thread: free banks the audio thread can no longer see.
    void collect() {
        const uint64_t ack = ack_.load(std::memory_order_acquire);
        std::erase_if(retired_, [ack](const Retired& r) { return ack >= r.replacedAt; });
    }

    /// @brief Audio thread: current bank for this block, or nullptr.
    [[nodiscard]] const SampleBank* acquire() noexcept {
        const uint64_t gen = generation_.load(std::memory_order_acquire);
        const SampleBank* bank = bank_.load(std::memory_order_relaxed);
        ack_.store(gen, std::memory_order_release);
        return bank;
    }

    /// @brief Control thread: the bank most recently published.
    [[nodiscard]] const std::shared_ptr<const SampleBank>& current() const noexcept { return current_; }

    [[nodiscard]] size_t retiredCount() const noexcept { return retired_.size(); }

private:
    struct Retired {
        std::shared_ptr<const SampleBank> bank;
        uint64_t replacedAt = 0;  ///< Generation that superseded this bank
    };

    std::atomic<const SampleBank*> bank_{nullptr};
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> ack_{0};
    std::shared_ptr<const SampleBank> current_;
    std::vector<Retired> retired_;
};

} // namespace DSP
} // namespace Actuate
