// ==============================================================================
// Layer 4: User Feature - Saturation
// ==============================================================================
// Five static waveshapers selected by a closed enum. Drive is the normalized
// amount; zero drive is nudged to kSaturationMinDrive so every curve stays
// defined. Asymmetric curves (SinPow, Subtle) are followed by a DC blocker.
//
//   Tape   : tanh(x * (10d + 1))
//   Clip   : x(1 - d) + sign(x) d
//   SinPow : sin(x d)^2
//   Subtle : d cos(d pi x) / 4 + x
//   Sine   : sign(x) sin(|x| + d)
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/primitives/dc_blocker.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

enum class SaturationType : uint8_t {
    Tape = 0,
    Clip,
    SinPow,
    Subtle,
    Sine
};

inline constexpr size_t kSaturationTypeCount = 5;
inline constexpr float kSaturationMinDrive = 0.0001f;

namespace saturation_detail {

[[nodiscard]] inline float signOf(float x) noexcept {
    return (x > 0.0f) ? 1.0f : ((x < 0.0f) ? -1.0f : 0.0f);
}

[[nodiscard]] inline float shape(SaturationType type, float x, float drive) noexcept {
    switch (type) {
        case SaturationType::Tape:
            return std::tanh(x * (10.0f * drive + 1.0f));
        case SaturationType::Clip:
            return x * (1.0f - drive) + signOf(x) * drive;
        case SaturationType::SinPow: {
            const float s = std::sin(x * drive);
            return s * s;
        }
        case SaturationType::Subtle:
            return (drive * std::cos(drive * kPi * x)) * 0.25f + x;
        case SaturationType::Sine:
            return signOf(x) * std::sin(std::abs(x) + drive);
    }
    return x;
}

} // namespace saturation_detail

struct SaturationParams {
    SaturationType type = SaturationType::Tape;
    float amount = 0.0f;   ///< Drive [0, 1]
};

class Saturation {
public:
    void prepare(double sampleRate) noexcept {
        for (auto& dc : dcBlockers_) dc.prepare(sampleRate, 10.0f);
        prepared_ = true;
        reset();
    }

    void reset() noexcept {
        for (auto& dc : dcBlockers_) dc.reset();
    }

    void setParams(const SaturationParams& params) noexcept {
        if (params.type != params_.type) {
            for (auto& dc : dcBlockers_) dc.reset();
        }
        params_.type = params.type;
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        drive_ = (params_.amount == 0.0f) ? kSaturationMinDrive : params_.amount;
    }

    [[nodiscard]] const SaturationParams& params() const noexcept { return params_; }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        left = saturation_detail::shape(params_.type, left, drive_);
        right = saturation_detail::shape(params_.type, right, drive_);

        if (params_.type == SaturationType::SinPow || params_.type == SaturationType::Subtle) {
            left = dcBlockers_[0].process(left);
            right = dcBlockers_[1].process(right);
        }
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    SaturationParams params_;
    std::array<DCBlocker, 2> dcBlockers_{};
    float drive_ = kSaturationMinDrive;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
