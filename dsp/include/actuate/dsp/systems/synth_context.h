// ==============================================================================
// Layer 3: System Component - Synth Context
// ==============================================================================
// Explicit engine configuration handed to prepare(). There is no global
// mutable state: everything a voice needs beyond its patch arrives here.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/core/sine_table.h>
#include <actuate/dsp/primitives/sample_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>

namespace Actuate {
namespace DSP {

inline constexpr size_t kMinBlockSize = 1;
inline constexpr size_t kMaxBlockSize = 8192;

struct SynthContext {
    double sampleRate = 44100.0;
    size_t maxBlockSize = 512;
    float tuningReference = kDefaultTuningReference;
    std::shared_ptr<const SineTable> sineTable;

    /// @brief Build a context. Out-of-range values are clamped: sample rate to
    /// [8 kHz, 384 kHz], block size to [1, 8192]. Allocates the shared tables.
    [[nodiscard]] static SynthContext create(double sampleRate, size_t maxBlockSize) {
        SynthContext context;
        context.sampleRate = std::clamp(std::isfinite(sampleRate) ? sampleRate : 44100.0,
                                        kMinSampleRate, kMaxSampleRate);
        context.maxBlockSize = std::clamp(maxBlockSize, kMinBlockSize, kMaxBlockSize);
        context.sineTable = std::make_shared<const SineTable>();
        return context;
    }
};

} // namespace DSP
} // namespace Actuate
