// ==============================================================================
// Layer 4: User Feature - A-Bass Harmonic Enhancer
// ==============================================================================
// Psychoacoustic bass enhancer. The band below kABassCrossoverHz is pushed
// through a four-term sin/cos harmonic generator, softened by a Chebyshev
// tape curve, DC-blocked and added back on top of the dry signal.
//
// generator(x, h) = h*31.42*cos(x) - x + h*189.30*sin(2x) - x
//                 + h*25.0*cos(3x) - x + h*26.20*sin(4x) - x
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/primitives/biquad.h>
#include <actuate/dsp/primitives/dc_blocker.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kABassCrossoverHz = 180.0f;
inline constexpr float kABassMaxStrength = 0.01f;
inline constexpr float kABassTapeDrive = 0.0093f;
inline constexpr float kABassOutputDb = -9.0f;

namespace abass_detail {

/// @brief Soft polynomial tape curve blended with the dry sample by drive.
[[nodiscard]] inline float chebyshevTape(float sample, float drive) noexcept {
    const float dry = 1.0f - drive;
    const float peak = std::max(std::abs(sample), 1.0f);
    const float x = sample / peak;
    const float x2 = x * x;
    const float x3 = x * x2;
    const float x5 = x3 * x2;
    const float x6 = x3 * x3;
    const float y = x - 0.166667f * x3 + 0.00833333f * x5 - 0.000198413f * x6 +
                    0.0000000238f * x6 * drive;
    return dry * sample + (1.0f - dry) * y / (1.0f + std::abs(y));
}

[[nodiscard]] inline float harmonicGenerator(float x, float strength) noexcept {
    float summed = strength * 31.422043f * std::cos(x) - x;
    summed += strength * 189.29568f * std::sin(x * 2.0f) - x;
    summed += strength * 25.0f * std::cos(x * 3.0f) - x;
    summed += strength * 26.197401f * std::sin(x * 4.0f) - x;
    return summed;
}

/// @brief Harmonic series for one sample at the given strength.
[[nodiscard]] inline float shape(float x, float strength) noexcept {
    float output = harmonicGenerator(x, strength);
    output += (output * 2.0f - output * output) * 0.0070118904f;
    return chebyshevTape(output, kABassTapeDrive);
}

} // namespace abass_detail

struct ABassParams {
    float amount = 0.0f;   ///< Enhancement amount [0, 1]
};

class ABass {
public:
    void prepare(double sampleRate) noexcept {
        const float sr = static_cast<float>(sampleRate);
        for (auto& lp : crossover_) {
            lp.configure(FilterType::Lowpass, kABassCrossoverHz, kButterworthQ, 0.0f, sr);
        }
        for (auto& dc : dcBlockers_) dc.prepare(sampleRate, 10.0f);
        amountSmoother_.configure(20.0f, sr);
        amountSmoother_.snapTo(params_.amount);
        outputGain_ = dbToGain(kABassOutputDb);
        prepared_ = true;
        reset();
    }

    void reset() noexcept {
        for (auto& lp : crossover_) lp.reset();
        for (auto& dc : dcBlockers_) dc.reset();
    }

    void setParams(const ABassParams& params) noexcept {
        params_.amount = std::clamp(params.amount, 0.0f, 1.0f);
        amountSmoother_.setTarget(params_.amount);
    }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        const float strength = amountSmoother_.process() * kABassMaxStrength;
        if (strength <= 0.0f) {
            // Keep the crossover warm so enabling is click-free
            (void)crossover_[0].process(left);
            (void)crossover_[1].process(right);
            return;
        }

        left += enhance(0, left, strength);
        right += enhance(1, right, strength);
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    [[nodiscard]] float enhance(size_t channel, float x, float strength) noexcept {
        const float low = crossover_[channel].process(x);
        const float harmonics = abass_detail::shape(low, strength) * outputGain_;
        return dcBlockers_[channel].process(harmonics);
    }

    ABassParams params_;
    std::array<Biquad, 2> crossover_{};
    std::array<DCBlocker, 2> dcBlockers_{};
    OnePoleSmoother amountSmoother_;
    float outputGain_ = 1.0f;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
