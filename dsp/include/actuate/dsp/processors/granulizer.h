// ==============================================================================
// Layer 2: DSP Processor - Granulizer
// ==============================================================================
// Plays a sample region as a stream of windowed grains.
//
// Timing, in samples:
//   hold     grain length
//   gap      silence between grains
//   fade     raised-cosine edge (clamped to hold / 2)
//   period   hold + gap - overlap, where overlap = fade when gap == 0
//
// With no gap, consecutive grains overlap by exactly one fade and the
// complementary windows sum to unity. The read head advances through the
// region by period * rate per grain; at the region end it wraps when looping,
// otherwise the granulizer stops spawning and lets the last grains finish.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/grain_envelope.h>
#include <actuate/dsp/primitives/sample_buffer.h>
#include <actuate/dsp/processors/sample_player.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

inline constexpr size_t kMaxGrains = 8;
inline constexpr uint32_t kMinGrainHold = 5;
inline constexpr uint32_t kMaxGrainHold = 22050;
inline constexpr uint32_t kMaxGrainGap = 22050;
inline constexpr uint32_t kMinGrainCrossfade = 1;
inline constexpr uint32_t kMaxGrainCrossfade = 22050;

/// State of a single grain
struct Grain {
    double startFrame = 0.0;   ///< Read position of the first grain sample
    double rate = 1.0;         ///< Buffer frames per output sample
    size_t position = 0;       ///< Samples rendered so far
    size_t length = 0;         ///< Window length
    size_t fade = 0;           ///< Window crossfade
    uint64_t startSample = 0;  ///< Trigger time, for stealing
    bool active = false;
};

/// Grain timing as carried in a patch
struct GrainSettings {
    uint32_t hold = 1024;
    uint32_t gap = 0;
    uint32_t crossfade = 128;
};

class Granulizer {
public:
    void reset() noexcept {
        for (auto& grain : grains_) {
            grain = Grain{};
        }
        clock_ = 0;
        samplesUntilGrain_ = 0;
        readHead_ = 0.0;
        spawning_ = false;
        pendingStart_ = false;
    }

    void setSettings(const GrainSettings& settings) noexcept {
        hold_ = std::clamp(settings.hold, kMinGrainHold, kMaxGrainHold);
        gap_ = std::min(settings.gap, kMaxGrainGap);
        fade_ = std::min(std::clamp(settings.crossfade, kMinGrainCrossfade, kMaxGrainCrossfade),
                         hold_ / 2);
    }

    void setRegion(float start, float end) noexcept {
        startPosition_ = start;
        endPosition_ = end;
    }

    void setLoop(bool loop) noexcept { loop_ = loop; }

    /// @brief Start a new grain stream at the region start.
    void trigger() noexcept {
        spawning_ = true;
        pendingStart_ = true;
        samplesUntilGrain_ = 0;
    }

    /// @brief Stop spawning; active grains play out.
    void stop() noexcept { spawning_ = false; }

    [[nodiscard]] uint32_t hold() const noexcept { return hold_; }
    [[nodiscard]] uint32_t fade() const noexcept { return fade_; }

    /// @brief Samples between consecutive grain onsets.
    [[nodiscard]] uint32_t period() const noexcept {
        const uint32_t overlap = (gap_ == 0) ? fade_ : 0;
        return std::max<uint32_t>(1, hold_ + gap_ - overlap);
    }

    [[nodiscard]] bool isPlaying() const noexcept { return spawning_ || activeGrainCount() > 0; }

    [[nodiscard]] size_t activeGrainCount() const noexcept {
        return static_cast<size_t>(std::count_if(grains_.begin(), grains_.end(),
                                                 [](const Grain& g) { return g.active; }));
    }

    /// @brief Render one frame.
    /// @param buffer Buffer for this block, or nullptr (silence, no grains spawn)
    /// @param rate Buffer frames per output sample
    [[nodiscard]] StereoFrame process(const SampleBuffer* buffer, double rate) noexcept {
        if (buffer == nullptr || buffer->numFrames() == 0) {
            ++clock_;
            return {};
        }
        if (detail::isNonFinite(rate) || rate <= 0.0) {
            rate = 1.0;
        }

        const SampleRegion region = resolveRegion(startPosition_, endPosition_, buffer->numFrames());
        if (pendingStart_) {
            readHead_ = region.start;
            pendingStart_ = false;
        }

        if (spawning_ && samplesUntilGrain_ == 0) {
            spawnGrain(region, rate);
        }
        if (samplesUntilGrain_ > 0) {
            --samplesUntilGrain_;
        }

        StereoFrame out{};
        for (auto& grain : grains_) {
            if (!grain.active) continue;

            const float gain = GrainEnvelope::gainAt(grain.position, grain.length, grain.fade);
            double readPos = grain.startFrame + static_cast<double>(grain.position) * grain.rate;
            if (readPos >= region.end && loop_) {
                readPos = SamplePlayer::wrapInto(readPos, region);
            }
            if (readPos < region.end) {
                const StereoFrame f = buffer->frameAt(readPos);
                out.left += gain * f.left;
                out.right += gain * f.right;
            }

            if (++grain.position >= grain.length) {
                grain.active = false;
            }
        }

        ++clock_;
        return {detail::flushDenormal(out.left), detail::flushDenormal(out.right)};
    }

    void processBlock(const SampleBuffer* buffer, double rate,
                      float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            const StereoFrame f = process(buffer, rate);
            left[i] = f.left;
            right[i] = f.right;
        }
    }

private:
    void spawnGrain(const SampleRegion& region, double rate) noexcept {
        if (region.length() <= 0.0 || readHead_ >= region.end) {
            spawning_ = false;
            return;
        }

        Grain* grain = acquireGrain();
        grain->startFrame = readHead_;
        grain->rate = rate;
        grain->position = 0;
        grain->length = hold_;
        grain->fade = fade_;

        const uint32_t p = period();
        samplesUntilGrain_ = p;
        readHead_ += static_cast<double>(p) * rate;
        if (readHead_ >= region.end) {
            if (loop_) {
                readHead_ = SamplePlayer::wrapInto(readHead_, region);
            } else {
                spawning_ = false;
            }
        }
    }

    [[nodiscard]] Grain* acquireGrain() noexcept {
        for (auto& grain : grains_) {
            if (!grain.active) {
                grain.active = true;
                grain.startSample = clock_;
                return &grain;
            }
        }

        // Pool exhausted: steal the oldest
        Grain* oldest = &grains_[0];
        for (auto& grain : grains_) {
            if (grain.startSample < oldest->startSample) {
                oldest = &grain;
            }
        }
        *oldest = Grain{};
        oldest->active = true;
        oldest->startSample = clock_;
        return oldest;
    }

    std::array<Grain, kMaxGrains> grains_{};
    uint64_t clock_ = 0;
    uint32_t samplesUntilGrain_ = 0;
    double readHead_ = 0.0;
    uint32_t hold_ = 1024;
    uint32_t gap_ = 0;
    uint32_t fade_ = 128;
    float startPosition_ = 0.0f;
    float endPosition_ = 1.0f;
    bool loop_ = false;
    bool spawning_ = false;
    bool pendingStart_ = false;
};

} // namespace DSP
} // namespace Actuate
