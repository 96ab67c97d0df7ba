// ==============================================================================
// Layer 1: DSP Primitive - FFT
// ==============================================================================
// Real-input FFT backed by pffft. Used off the audio thread by the phase
// vocoder that pre-renders pitch-shifted sample banks.
//
// prepare() allocates; forward()/inverse() do not.
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Actuate {
namespace DSP {

inline constexpr size_t kMinFFTSize = 256;
inline constexpr size_t kMaxFFTSize = 8192;

struct Complex {
    float real = 0.0f;
    float imag = 0.0f;

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {real * other.real - imag * other.imag,
                real * other.imag + imag * other.real};
    }

    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    [[nodiscard]] float phase() const noexcept {
        return std::atan2(imag, real);
    }

    [[nodiscard]] static Complex fromPolar(float magnitude, float phase) noexcept {
        return {magnitude * std::cos(phase), magnitude * std::sin(phase)};
    }
};

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Allocate for fftSize (power of 2). Leaves the FFT unprepared on
    /// invalid sizes or setup failure.
    void prepare(size_t fftSize) noexcept {
        size_ = fftSize;

        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            size_ = 0;
            return;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            size_ = 0;
            return;
        }

        buf1_ = detail::makeAlignedBuffer(fftSize);
        buf2_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
    }

    /// @brief Real input of size() samples to numBins() complex bins.
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        std::copy_n(input, N, buf1_.get());
        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft packs DC and Nyquist into the first pair
        const float* fftOut = buf2_.get();
        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief numBins() complex bins back to size() real samples, scaled by 1/N.
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        float* fftIn = buf1_.get();
        fftIn[0] = input[0].real;
        fftIn[1] = input[N / 2].real;
        for (size_t k = 1; k < N / 2; ++k) {
            fftIn[2 * k] = input[k].real;
            fftIn[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), fftIn, buf2_.get(),
                                work_.get(), PFFFT_BACKWARD);

        const float scale = 1.0f / static_cast<float>(N);
        const float* fftOut = buf2_.get();
        for (size_t i = 0; i < N; ++i) {
            output[i] = fftOut[i] * scale;
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf1_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf2_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> work_;
};

} // namespace DSP
} // namespace Actuate
