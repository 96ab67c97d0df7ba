// ==============================================================================
// Layer 2: DSP Processor - Offline Phase Vocoder Pitch Shifter
// ==============================================================================
// Shifts the pitch of a whole buffer while keeping its duration. Runs on the
// control thread when a sample bank is built; allocates freely.
//
// Algorithm (Dolson, "The Phase Vocoder: A Tutorial"):
// 1. Hann-windowed STFT, 2048-point, hop 512 (75% overlap)
// 2. Instantaneous frequency per bin from the frame-to-frame phase delta
// 3. Destination bin k reads source bin k / ratio (linear magnitude
//    interpolation), its frequency is scaled by ratio and accumulated
// 4. Hann synthesis window, overlap-add normalized by 1.5 (sum of Hann^2
//    at 75% overlap)
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/fft.h>
#include <actuate/dsp/primitives/sample_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

namespace Actuate {
namespace DSP {

class PitchShifter {
public:
    static constexpr size_t kFFTSize = 2048;
    static constexpr size_t kHopSize = kFFTSize / 4;
    static constexpr float kOverlapGain = 1.5f;
    static constexpr float kMinRatio = 0.0625f;
    static constexpr float kMaxRatio = 16.0f;

    PitchShifter() = default;

    PitchShifter(const PitchShifter&) = delete;
    PitchShifter& operator=(const PitchShifter&) = delete;
    PitchShifter(PitchShifter&&) noexcept = default;
    PitchShifter& operator=(PitchShifter&&) noexcept = default;

    /// @brief Allocate FFT and spectral buffers.
    /// @return false if the FFT backend could not be set up
    [[nodiscard]] bool prepare() {
        fft_.prepare(kFFTSize);
        if (!fft_.isPrepared()) {
            return false;
        }

        const size_t numBins = fft_.numBins();
        window_.resize(kFFTSize);
        for (size_t i = 0; i < kFFTSize; ++i) {
            window_[i] = 0.5f - 0.5f * std::cos(kTwoPi * static_cast<float>(i)
                                                / static_cast<float>(kFFTSize));
        }

        frame_.assign(kFFTSize, 0.0f);
        analysis_.assign(numBins, Complex{});
        synthesis_.assign(numBins, Complex{});
        magnitude_.assign(numBins, 0.0f);
        frequency_.assign(numBins, 0.0f);
        prevPhase_.assign(numBins, 0.0f);
        synthPhase_.assign(numBins, 0.0f);
        expectedPhaseInc_.resize(numBins);
        for (size_t k = 0; k < numBins; ++k) {
            expectedPhaseInc_[k] = kTwoPi * static_cast<float>(k) * static_cast<float>(kHopSize)
                                 / static_cast<float>(kFFTSize);
        }
        return true;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return fft_.isPrepared(); }

    /// @brief Pitch-shift one channel. Output has the same length as input.
    /// @param ratio Frequency ratio, clamped to [1/16, 16]
    [[nodiscard]] std::vector<float> process(const float* input, size_t numSamples, float ratio) {
        std::vector<float> output(numSamples, 0.0f);
        if (!isPrepared() || input == nullptr || numSamples == 0) {
            return output;
        }

        ratio = std::clamp(detail::isNonFinite(ratio) ? 1.0f : ratio, kMinRatio, kMaxRatio);
        if (ratio == 1.0f) {
            std::copy_n(input, numSamples, output.begin());
            return output;
        }

        std::fill(prevPhase_.begin(), prevPhase_.end(), 0.0f);
        std::fill(synthPhase_.begin(), synthPhase_.end(), 0.0f);

        // Frames start one FFT length early so every output sample is covered
        // by the full four overlapping windows.
        const auto N = static_cast<std::ptrdiff_t>(kFFTSize);
        const auto hop = static_cast<std::ptrdiff_t>(kHopSize);
        const auto length = static_cast<std::ptrdiff_t>(numSamples);
        const float normalization = 1.0f / kOverlapGain;

        for (std::ptrdiff_t start = hop - N; start < length; start += hop) {
            for (std::ptrdiff_t i = 0; i < N; ++i) {
                const std::ptrdiff_t src = start + i;
                const float x = (src >= 0 && src < length) ? input[src] : 0.0f;
                frame_[static_cast<size_t>(i)] = x * window_[static_cast<size_t>(i)];
            }

            fft_.forward(frame_.data(), analysis_.data());
            shiftFrame(ratio);
            fft_.inverse(synthesis_.data(), frame_.data());

            for (std::ptrdiff_t i = 0; i < N; ++i) {
                const std::ptrdiff_t dst = start + i;
                if (dst < 0 || dst >= length) continue;
                output[static_cast<size_t>(dst)] +=
                    frame_[static_cast<size_t>(i)] * window_[static_cast<size_t>(i)] * normalization;
            }
        }

        for (auto& sample : output) {
            sample = detail::flushDenormal(detail::sanitize(sample));
        }
        return output;
    }

    /// @brief Pitch-shift every channel of a buffer.
    /// @return nullptr if the shifter is not prepared
    [[nodiscard]] std::shared_ptr<const SampleBuffer> process(const SampleBuffer& source, float ratio) {
        if (!isPrepared() || source.numFrames() == 0) {
            return nullptr;
        }
        std::vector<float> left = process(source.channel(0), source.numFrames(), ratio);
        std::vector<float> right;
        if (source.numChannels() > 1) {
            right = process(source.channel(1), source.numFrames(), ratio);
        }
        return SampleBuffer::fromChannels(std::move(left), std::move(right), source.sampleRate());
    }

private:
    void shiftFrame(float ratio) noexcept {
        const size_t numBins = fft_.numBins();

        for (size_t k = 0; k < numBins; ++k) {
            magnitude_[k] = analysis_[k].magnitude();
            const float phase = analysis_[k].phase();
            float deviation = phase - prevPhase_[k] - expectedPhaseInc_[k];
            prevPhase_[k] = phase;
            deviation = wrapPi(deviation);
            frequency_[k] = expectedPhaseInc_[k] + deviation;
        }

        for (size_t k = 0; k < numBins; ++k) {
            const float srcBin = static_cast<float>(k) / ratio;
            if (srcBin >= static_cast<float>(numBins - 1)) {
                synthesis_[k] = Complex{};
                continue;
            }
            const auto bin0 = static_cast<size_t>(srcBin);
            const size_t bin1 = bin0 + 1;
            const float frac = srcBin - static_cast<float>(bin0);
            const float mag = magnitude_[bin0] * (1.0f - frac) + magnitude_[bin1] * frac;

            synthPhase_[k] = wrapPi(synthPhase_[k] + frequency_[bin0] * ratio);
            synthesis_[k] = Complex::fromPolar(mag, synthPhase_[k]);
        }
    }

    [[nodiscard]] static float wrapPi(float phase) noexcept {
        return phase - kTwoPi * std::floor((phase + kPi) / kTwoPi);
    }

    FFT fft_;
    std::vector<float> window_;
    std::vector<float> frame_;
    std::vector<Complex> analysis_;
    std::vector<Complex> synthesis_;
    std::vector<float> magnitude_;
    std::vector<float> frequency_;
    std::vector<float> prevPhase_;
    std::vector<float> synthPhase_;
    std::vector<float> expectedPhaseInc_;
};

} // namespace DSP
} // namespace Actuate
