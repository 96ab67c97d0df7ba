// ==============================================================================
// Layer 4: User Feature - Three-Band EQ
// ==============================================================================
// Low shelf, peak and high shelf in series per channel. Gains are smoothed in
// dB and coefficients are refreshed every kEqControlInterval samples while a
// gain is still moving.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/primitives/biquad.h>
#include <actuate/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cstddef>

namespace Actuate {
namespace DSP {

inline constexpr float kEqMinGainDb = -24.0f;
inline constexpr float kEqMaxGainDb = 24.0f;
inline constexpr float kEqShelfQ = kButterworthQ;
inline constexpr float kEqPeakQ = 0.9f;
inline constexpr size_t kEqControlInterval = 32;

struct ThreeBandEqParams {
    float lowFreqHz = 800.0f;     ///< Low shelf corner [20, 2000]
    float midFreqHz = 3000.0f;    ///< Peak centre [100, 10000]
    float highFreqHz = 10000.0f;  ///< High shelf corner [1000, 20000]
    float lowGainDb = 0.0f;       ///< [-24, +24]
    float midGainDb = 0.0f;       ///< [-24, +24]
    float highGainDb = 0.0f;      ///< [-24, +24]
};

class ThreeBandEq {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        for (auto& s : gainSmoothers_) {
            s.configure(20.0f, sampleRate_);
            s.snapTo(0.0f);
        }
        prepared_ = true;
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        for (auto& channel : bands_) {
            for (auto& band : channel) band.reset();
        }
        controlCounter_ = 0;
    }

    void setParams(const ThreeBandEqParams& params) noexcept {
        params_.lowFreqHz = std::clamp(params.lowFreqHz, 20.0f, 2000.0f);
        params_.midFreqHz = std::clamp(params.midFreqHz, 100.0f, 10000.0f);
        params_.highFreqHz = std::clamp(params.highFreqHz, 1000.0f, 20000.0f);
        params_.lowGainDb = std::clamp(params.lowGainDb, kEqMinGainDb, kEqMaxGainDb);
        params_.midGainDb = std::clamp(params.midGainDb, kEqMinGainDb, kEqMaxGainDb);
        params_.highGainDb = std::clamp(params.highGainDb, kEqMinGainDb, kEqMaxGainDb);

        gainSmoothers_[0].setTarget(params_.lowGainDb);
        gainSmoothers_[1].setTarget(params_.midGainDb);
        gainSmoothers_[2].setTarget(params_.highGainDb);
        dirty_ = true;
    }

    [[nodiscard]] const ThreeBandEqParams& params() const noexcept { return params_; }

    void process(float& left, float& right) noexcept {
        if (!prepared_) return;
        if (detail::isNonFinite(left)) left = 0.0f;
        if (detail::isNonFinite(right)) right = 0.0f;

        if (controlCounter_ == 0) {
            const bool moving = !gainSmoothers_[0].isComplete() ||
                                !gainSmoothers_[1].isComplete() ||
                                !gainSmoothers_[2].isComplete();
            if (moving || dirty_) {
                for (auto& s : gainSmoothers_) s.advance(kEqControlInterval);
                updateCoefficients();
                dirty_ = false;
            }
        }
        controlCounter_ = (controlCounter_ + 1) % kEqControlInterval;

        for (auto& band : bands_[0]) left = band.process(left);
        for (auto& band : bands_[1]) right = band.process(right);
    }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            process(left[i], right[i]);
        }
    }

private:
    void updateCoefficients() noexcept {
        const auto low = BiquadCoefficients::calculate(
            FilterType::LowShelf, params_.lowFreqHz, kEqShelfQ,
            gainSmoothers_[0].getCurrentValue(), sampleRate_);
        const auto mid = BiquadCoefficients::calculate(
            FilterType::Peak, params_.midFreqHz, kEqPeakQ,
            gainSmoothers_[1].getCurrentValue(), sampleRate_);
        const auto high = BiquadCoefficients::calculate(
            FilterType::HighShelf, params_.highFreqHz, kEqShelfQ,
            gainSmoothers_[2].getCurrentValue(), sampleRate_);

        for (auto& channel : bands_) {
            channel[0].setCoefficients(low);
            channel[1].setCoefficients(mid);
            channel[2].setCoefficients(high);
        }
    }

    ThreeBandEqParams params_;
    std::array<std::array<Biquad, 3>, 2> bands_{};
    std::array<OnePoleSmoother, 3> gainSmoothers_{};
    float sampleRate_ = 44100.0f;
    size_t controlCounter_ = 0;
    bool dirty_ = true;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Actuate
