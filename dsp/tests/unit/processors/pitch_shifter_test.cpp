// ==============================================================================
// Layer 2: DSP Processor - PitchShifter Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/processors/pitch_shifter.h>
#include "signal_metrics.h"

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;

std::vector<float> makeSine(float frequency, size_t n) {
    std::vector<float> data(n);
    for (size_t i = 0; i < n; ++i) {
        data[i] = 0.5f * std::sin(6.283185307f * frequency * static_cast<float>(i)
                                  / static_cast<float>(kSampleRate));
    }
    return data;
}

} // namespace

TEST_CASE("PitchShifter prepares its FFT", "[pitch_shifter]") {
    PitchShifter shifter;
    REQUIRE_FALSE(shifter.isPrepared());
    REQUIRE(shifter.prepare());
    REQUIRE(shifter.isPrepared());
}

TEST_CASE("PitchShifter moves a sine by the ratio and keeps the length", "[pitch_shifter]") {
    PitchShifter shifter;
    REQUIRE(shifter.prepare());

    const auto input = makeSine(440.0f, 32768);

    SECTION("octave up") {
        const auto out = shifter.process(input.data(), input.size(), 2.0f);
        REQUIRE(out.size() == input.size());
        const double f = Metrics::dominantFrequency(out.data() + 4096, 16384, kSampleRate,
                                                    300.0, 1200.0, 2.0);
        REQUIRE(f == Approx(880.0).margin(12.0));
    }

    SECTION("fifth down") {
        const auto out = shifter.process(input.data(), input.size(), 2.0f / 3.0f);
        const double f = Metrics::dominantFrequency(out.data() + 4096, 16384, kSampleRate,
                                                    150.0, 600.0, 2.0);
        REQUIRE(f == Approx(293.3).margin(12.0));
    }
}

TEST_CASE("PitchShifter keeps a shifted tone near its input level", "[pitch_shifter]") {
    PitchShifter shifter;
    REQUIRE(shifter.prepare());
    const auto input = makeSine(440.0f, 32768);
    const auto out = shifter.process(input.data(), input.size(), 1.5f);

    const float inRms = Metrics::rms(input.data() + 4096, 16384);
    const float outRms = Metrics::rms(out.data() + 4096, 16384);
    REQUIRE(outRms > 0.5f * inRms);
    REQUIRE(outRms < 2.0f * inRms);
    REQUIRE(Metrics::allFinite(out.data(), out.size()));
}

TEST_CASE("Unity ratio copies the input", "[pitch_shifter]") {
    PitchShifter shifter;
    REQUIRE(shifter.prepare());
    const auto input = makeSine(1000.0f, 1000);
    REQUIRE(shifter.process(input.data(), input.size(), 1.0f) == input);
}

TEST_CASE("Unprepared shifter returns silence of the input length", "[pitch_shifter]") {
    PitchShifter shifter;
    const auto input = makeSine(1000.0f, 100);
    const auto out = shifter.process(input.data(), input.size(), 2.0f);
    REQUIRE(out.size() == 100);
    REQUIRE(Metrics::isSilent(out.data(), out.size()));
}
