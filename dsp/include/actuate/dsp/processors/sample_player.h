// ==============================================================================
// Layer 2: DSP Processor - Sample Player
// ==============================================================================
// Varispeed playback of a region of a SampleBuffer.
//
// The player never owns or retains a buffer: the caller hands in the buffer
// for every sample (or block) it renders. Position is kept in frames, so a
// buffer swap between blocks keeps playback continuous as long as the
// buffers share a length (pitch-shifted copies of one source do).
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/primitives/sample_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

/// @brief Playback region in frames, resolved against a buffer.
struct SampleRegion {
    double start = 0.0;
    double end = 0.0;

    [[nodiscard]] double length() const noexcept { return end - start; }
};

/// @brief Resolve normalized start/end positions against a frame count.
/// Start and end are swapped when start > end.
[[nodiscard]] inline SampleRegion resolveRegion(float startPosition, float endPosition,
                                                size_t numFrames) noexcept {
    float s = std::clamp(detail::sanitize(startPosition), 0.0f, 1.0f);
    float e = std::clamp(detail::sanitize(endPosition), 0.0f, 1.0f);
    if (s > e) {
        std::swap(s, e);
    }
    const auto frames = static_cast<double>(numFrames);
    return {static_cast<double>(s) * frames, static_cast<double>(e) * frames};
}

class SamplePlayer {
public:
    void reset() noexcept {
        position_ = 0.0;
        playing_ = false;
        pendingStart_ = false;
    }

    /// @param start Normalized region start [0, 1]
    /// @param end Normalized region end [0, 1]
    void setRegion(float start, float end) noexcept {
        startPosition_ = start;
        endPosition_ = end;
    }

    void setLoop(bool loop) noexcept { loop_ = loop; }

    /// @brief Restart from the region start on the next rendered sample.
    void trigger() noexcept {
        playing_ = true;
        pendingStart_ = true;
    }

    void stop() noexcept { playing_ = false; }

    [[nodiscard]] bool isPlaying() const noexcept { return playing_; }
    [[nodiscard]] double position() const noexcept { return position_; }

    /// @brief Render one frame.
    /// @param buffer Buffer for this block, or nullptr (silence)
    /// @param rate Playback rate in buffer frames per output sample
    [[nodiscard]] StereoFrame process(const SampleBuffer* buffer, double rate) noexcept {
        if (!playing_ || buffer == nullptr || buffer->numFrames() == 0) {
            return {};
        }

        const SampleRegion region = resolveRegion(startPosition_, endPosition_, buffer->numFrames());
        if (region.length() <= 0.0) {
            playing_ = false;
            return {};
        }

        if (pendingStart_) {
            position_ = region.start;
            pendingStart_ = false;
        }

        if (position_ >= region.end || position_ < region.start) {
            if (!loop_) {
                playing_ = false;
                return {};
            }
            position_ = wrapInto(position_, region);
        }

        // The frame after the last one wraps to the region start only when it
        // is the whole buffer; inner regions read their true neighbour.
        const bool wrapRead = loop_ && region.end >= static_cast<double>(buffer->numFrames());
        const StereoFrame out = buffer->frameAt(position_, wrapRead);

        if (!detail::isNonFinite(rate) && rate > 0.0) {
            position_ += rate;
        }
        return out;
    }

    void processBlock(const SampleBuffer* buffer, double rate,
                      float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            const StereoFrame f = process(buffer, rate);
            left[i] = f.left;
            right[i] = f.right;
        }
    }

    [[nodiscard]] static double wrapInto(double position, const SampleRegion& region) noexcept {
        const double len = region.length();
        if (len <= 0.0) {
            return region.start;
        }
        double offset = std::fmod(position - region.start, len);
        if (offset < 0.0) {
            offset += len;
        }
        return region.start + offset;
    }

private:
    double position_ = 0.0;
    float startPosition_ = 0.0f;
    float endPosition_ = 1.0f;
    bool loop_ = false;
    bool playing_ = false;
    bool pendingStart_ = false;
};

} // namespace DSP
} // namespace Actuate
