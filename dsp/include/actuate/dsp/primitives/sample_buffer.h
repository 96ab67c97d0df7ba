// ==============================================================================
// Layer 1: DSP Primitive - Sample Buffer
// ==============================================================================
// Immutable, de-interleaved PCM held at the engine sample rate. Built off the
// audio thread from decoded interleaved input and shared read-only through
// std::shared_ptr<const SampleBuffer>.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/interpolation.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

namespace Actuate {
namespace DSP {

inline constexpr size_t kMaxSampleChannels = 2;
inline constexpr double kMinSampleRate = 8000.0;
inline constexpr double kMaxSampleRate = 384000.0;

/// @brief Stereo frame read from a sample buffer.
struct StereoFrame {
    float left = 0.0f;
    float right = 0.0f;
};

class SampleBuffer {
public:
    /// @brief Build a buffer from interleaved PCM, resampled to targetRate.
    ///
    /// Non-finite input samples are replaced with silence.
    /// @return nullptr when channels is not 1 or 2, frames is 0, or either
    ///         rate is outside [8 kHz, 384 kHz]
    [[nodiscard]] static std::shared_ptr<const SampleBuffer> fromInterleaved(
        const float* interleaved, size_t channels, size_t frames,
        double sourceRate, double targetRate) {
        if (interleaved == nullptr || channels == 0 || channels > kMaxSampleChannels ||
            frames == 0 || !validRate(sourceRate) || !validRate(targetRate)) {
            return nullptr;
        }

        std::array<std::vector<float>, kMaxSampleChannels> source;
        for (size_t ch = 0; ch < channels; ++ch) {
            source[ch].resize(frames);
            for (size_t i = 0; i < frames; ++i) {
                source[ch][i] = detail::sanitize(interleaved[i * channels + ch]);
            }
        }

        if (sourceRate == targetRate) {
            return std::shared_ptr<const SampleBuffer>(
                new SampleBuffer(std::move(source), channels, frames, targetRate));
        }

        const double ratio = sourceRate / targetRate;
        const auto outFrames = std::max<size_t>(
            1, static_cast<size_t>(std::floor(static_cast<double>(frames) / ratio)));

        std::array<std::vector<float>, kMaxSampleChannels> resampled;
        for (size_t ch = 0; ch < channels; ++ch) {
            resampled[ch].resize(outFrames);
            const auto& in = source[ch];
            for (size_t i = 0; i < outFrames; ++i) {
                resampled[ch][i] = readCubic(in, static_cast<double>(i) * ratio);
            }
        }

        return std::shared_ptr<const SampleBuffer>(
            new SampleBuffer(std::move(resampled), channels, outFrames, targetRate));
    }

    /// @brief Build directly from per-channel data already at sampleRate.
    [[nodiscard]] static std::shared_ptr<const SampleBuffer> fromChannels(
        std::vector<float> left, std::vector<float> right, double sampleRate) {
        if (left.empty() || !validRate(sampleRate) ||
            (!right.empty() && right.size() != left.size())) {
            return nullptr;
        }
        const size_t frames = left.size();
        const size_t channels = right.empty() ? 1 : 2;
        std::array<std::vector<float>, kMaxSampleChannels> data{std::move(left), std::move(right)};
        return std::shared_ptr<const SampleBuffer>(
            new SampleBuffer(std::move(data), channels, frames, sampleRate));
    }

    [[nodiscard]] size_t numChannels() const noexcept { return channels_; }
    [[nodiscard]] size_t numFrames() const noexcept { return frames_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    /// @brief Channel data; mono buffers return channel 0 for either index.
    [[nodiscard]] const float* channel(size_t index) const noexcept {
        return data_[index < channels_ ? index : 0].data();
    }

    /// @brief Integer-position read. Out-of-range positions return silence.
    [[nodiscard]] StereoFrame frame(size_t index) const noexcept {
        if (index >= frames_) {
            return {};
        }
        const float l = data_[0][index];
        const float r = (channels_ > 1) ? data_[1][index] : l;
        return {l, r};
    }

    /// @brief Fractional read with linear interpolation.
    /// @param wrap When true, the position after the last frame reads frame 0.
    [[nodiscard]] StereoFrame frameAt(double position, bool wrap = false) const noexcept {
        if (frames_ == 0 || position < 0.0) {
            return {};
        }
        const auto i0 = static_cast<size_t>(position);
        if (i0 >= frames_) {
            return {};
        }
        const float frac = static_cast<float>(position - static_cast<double>(i0));
        size_t i1 = i0 + 1;
        if (i1 >= frames_) {
            i1 = wrap ? 0 : i0;
        }
        const StereoFrame a = frame(i0);
        const StereoFrame b = frame(i1);
        return {Interpolation::linearInterpolate(a.left, b.left, frac),
                Interpolation::linearInterpolate(a.right, b.right, frac)};
    }

private:
    SampleBuffer(std::array<std::vector<float>, kMaxSampleChannels> data,
                 size_t channels, size_t frames, double sampleRate)
        : data_(std::move(data))
        , channels_(channels)
        , frames_(frames)
        , sampleRate_(sampleRate) {}

    [[nodiscard]] static bool validRate(double rate) noexcept {
        return rate >= kMinSampleRate && rate <= kMaxSampleRate;
    }

    [[nodiscard]] static float readCubic(const std::vector<float>& in, double position) noexcept {
        const auto last = static_cast<std::ptrdiff_t>(in.size()) - 1;
        const auto i0 = static_cast<std::ptrdiff_t>(position);
        const float t = static_cast<float>(position - static_cast<double>(i0));
        auto at = [&](std::ptrdiff_t i) { return in[static_cast<size_t>(std::clamp<std::ptrdiff_t>(i, 0, last))]; };
        return Interpolation::cubicHermiteInterpolate(at(i0 - 1), at(i0), at(i0 + 1), at(i0 + 2), t);
    }

    std::array<std::vector<float>, kMaxSampleChannels> data_;
    size_t channels_ = 0;
    size_t frames_ = 0;
    double sampleRate_ = 44100.0;
};

} // namespace DSP
} // namespace Actuate
