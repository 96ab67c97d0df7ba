// ==============================================================================
// Layer 2: DSP Processor - Additive Oscillator Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/processors/additive_oscillator.h>
#include "signal_metrics.h"

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;

std::vector<float> render(AdditiveOscillator& osc, size_t n) {
    std::vector<float> out(n);
    for (auto& s : out) s = osc.process();
    return out;
}

} // namespace

TEST_CASE("Fundamental-only table renders a plain sine", "[additive]") {
    AdditiveOscillator osc;
    osc.prepare(kSampleRate);
    osc.setFrequency(440.0f);

    for (size_t i = 0; i < 1000; ++i) {
        const float expected = std::sin(kTwoPi * 440.0f * static_cast<float>(i) /
                                        static_cast<float>(kSampleRate));
        INFO("sample " << i);
        REQUIRE(osc.process() == Approx(expected).margin(2e-3));
    }
}

TEST_CASE("Partials at or above Nyquist are dropped", "[additive]") {
    AdditiveOscillator osc;
    osc.prepare(kSampleRate);

    osc.setFrequency(1000.0f);
    REQUIRE(osc.audiblePartialCount() == kNumPartials);

    osc.setFrequency(5000.0f);
    REQUIRE(osc.audiblePartialCount() == 4);

    osc.setFrequency(30000.0f);
    REQUIRE(osc.audiblePartialCount() == 0);
    REQUIRE(Metrics::isSilent(render(osc, 256).data(), 256));
}

TEST_CASE("Sawtooth-like table stays normalized", "[additive]") {
    AdditiveOscillator osc;
    osc.prepare(kSampleRate);
    osc.setFrequency(110.0f);

    PartialTable table{};
    for (size_t k = 0; k < kNumPartials; ++k) {
        table[k].amplitude = 1.0f / static_cast<float>(k + 1);
    }
    osc.setPartials(table);

    const auto out = render(osc, 44100);
    REQUIRE(Metrics::allFinite(out.data(), out.size()));
    REQUIRE(Metrics::peak(out.data(), out.size()) <= 1.0f + 1e-4f);
    REQUIRE(Metrics::dominantFrequency(out.data(), out.size(), kSampleRate, 50.0, 2000.0, 1.0)
            == Approx(110.0).margin(2.0));
}

TEST_CASE("Partial level scales only the upper harmonics", "[additive]") {
    AdditiveOscillator osc;
    osc.prepare(kSampleRate);
    osc.setFrequency(220.0f);

    PartialTable table{};
    table[0].amplitude = 0.5f;
    table[2].amplitude = 0.5f;
    osc.setPartials(table);

    osc.setPartialLevel(0.0f);
    const auto fundamentalOnly = render(osc, 44100);
    REQUIRE(Metrics::goertzelMagnitude(fundamentalOnly.data(), fundamentalOnly.size(),
                                       660.0, kSampleRate) < 0.01);
    REQUIRE(Metrics::goertzelMagnitude(fundamentalOnly.data(), fundamentalOnly.size(),
                                       220.0, kSampleRate) == Approx(0.5).margin(0.05));

    osc.setPartialLevel(1.0f);
    const auto both = render(osc, 44100);
    REQUIRE(Metrics::goertzelMagnitude(both.data(), both.size(), 660.0, kSampleRate)
            == Approx(0.5).margin(0.05));
}

TEST_CASE("Invalid partial data is sanitized", "[additive][safety]") {
    AdditiveOscillator osc;
    osc.prepare(kSampleRate);
    osc.setFrequency(std::numeric_limits<float>::quiet_NaN());
    REQUIRE(osc.process() == 0.0f);

    PartialTable table{};
    table[0].amplitude = std::numeric_limits<float>::infinity();
    table[1].amplitude = -3.0f;
    table[1].phase = std::numeric_limits<float>::quiet_NaN();
    osc.setPartials(table);
    REQUIRE(osc.partials()[0].amplitude == 0.0f);
    REQUIRE(osc.partials()[1].amplitude == 0.0f);
    REQUIRE(osc.partials()[1].phase == 0.0f);
}
