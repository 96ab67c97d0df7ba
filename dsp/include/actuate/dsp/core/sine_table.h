// ==============================================================================
// Layer 0: Core Utility - Sine Table
// ==============================================================================
// Shared single-cycle sine lookup with linear interpolation, used by the
// additive oscillator where sixteen partials per sample make std::sin the
// dominant cost. Built once per engine configuration and shared read-only.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/math_constants.h>

#include <array>
#include <cmath>
#include <cstddef>

namespace Actuate {
namespace DSP {

class SineTable {
public:
    static constexpr size_t kSize = 4096;

    SineTable() noexcept {
        for (size_t i = 0; i <= kSize; ++i) {
            table_[i] = std::sin(kTwoPi * static_cast<float>(i) / static_cast<float>(kSize));
        }
    }

    /// @brief sin(2*pi*phase) for any phase (wrapped to [0, 1)).
    [[nodiscard]] float lookup(float phase) const noexcept {
        phase -= std::floor(phase);
        const float pos = phase * static_cast<float>(kSize);
        auto i0 = static_cast<size_t>(pos);
        if (i0 >= kSize) i0 = kSize - 1;
        const float frac = pos - static_cast<float>(i0);
        return table_[i0] + frac * (table_[i0 + 1] - table_[i0]);
    }

private:
    std::array<float, kSize + 1> table_{};  // Guard point at kSize
};

} // namespace DSP
} // namespace Actuate
