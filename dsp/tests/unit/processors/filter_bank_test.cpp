// ==============================================================================
// Layer 2: DSP Processor - Filter Bank Tests
// ==============================================================================
// Frequency response of the voice filters, resonance curves, routing and
// recovery from non-finite input.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/primitives/svf_filter.h>
#include <actuate/dsp/processors/filter_bank.h>
#include "signal_metrics.h"

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

constexpr double kSampleRate = 44100.0;

/// Steady-state gain of a VoiceFilter for a sine at frequencyHz.
float measureGain(VoiceFilter& filter, float frequencyHz, float amplitude = 1.0f) {
    constexpr size_t kSettle = 8192;
    constexpr size_t kMeasure = 8820;  // whole cycles for 100 Hz multiples
    double inSq = 0.0;
    double outSq = 0.0;
    for (size_t i = 0; i < kSettle + kMeasure; ++i) {
        const float x = amplitude * std::sin(6.283185307f * frequencyHz * static_cast<float>(i)
                                             / static_cast<float>(kSampleRate));
        const StereoFrame y = filter.process({x, x});
        if (i >= kSettle) {
            inSq += static_cast<double>(x) * x;
            outSq += static_cast<double>(y.left) * y.left;
        }
    }
    return static_cast<float>(std::sqrt(outSq / inSq));
}

float toDb(float gain) { return 20.0f * std::log10(gain); }

VoiceFilter makeFilter(FilterTopology topology, float cutoff, float resonance) {
    VoiceFilter filter;
    filter.prepare(kSampleRate);
    filter.setTopology(topology);
    filter.setCutoff(cutoff);
    filter.setResonance(resonance);
    return filter;
}

constexpr std::array<FilterTopology, kFilterTopologyCount> kTopologies = {
    FilterTopology::SVF, FilterTopology::Tilt, FilterTopology::VCF,
    FilterTopology::V4, FilterTopology::A4I
};

// Small enough that the saturating feedback paths stay linear
constexpr float kLinearAmplitude = 0.1f;

/// Highest gain over a log-spaced scan from half to three times the cutoff.
float peakGainNearCutoff(FilterTopology topology, float cutoff, float resonance) {
    constexpr int kSteps = 24;
    float peak = 0.0f;
    for (int i = 0; i <= kSteps; ++i) {
        const float hz = cutoff * 0.5f * std::pow(6.0f, static_cast<float>(i) / kSteps);
        auto filter = makeFilter(topology, cutoff, resonance);
        peak = std::max(peak, measureGain(filter, hz, kLinearAmplitude));
    }
    return peak;
}

} // namespace

TEST_CASE("Every topology is -3 dB at the cutoff with zero resonance", "[filter]") {
    for (auto topology : kTopologies) {
        for (float cutoff : {500.0f, 1000.0f, 4000.0f}) {
            DYNAMIC_SECTION("topology " << static_cast<int>(topology) << " cutoff " << cutoff) {
                auto filter = makeFilter(topology, cutoff, 0.0f);
                const float db = toDb(measureGain(filter, cutoff, kLinearAmplitude));
                INFO("measured " << db << " dB");
                REQUIRE(db == Approx(-3.0f).margin(1.0f));
            }
        }
    }
}

TEST_CASE("SVF lowpass passes the band below cutoff and rejects above", "[filter][svf]") {
    auto low = makeFilter(FilterTopology::SVF, 1000.0f, 0.0f);
    REQUIRE(toDb(measureGain(low, 100.0f)) == Approx(0.0f).margin(0.5f));

    auto high = makeFilter(FilterTopology::SVF, 1000.0f, 0.0f);
    REQUIRE(toDb(measureGain(high, 8000.0f)) < -30.0f);
}

TEST_CASE("SVF highpass tap is selected by the mix", "[filter][svf]") {
    auto filter = makeFilter(FilterTopology::SVF, 1000.0f, 0.0f);
    filter.setMix(0.0f, 0.0f, 1.0f, 1.0f);
    REQUIRE(toDb(measureGain(filter, 8000.0f)) == Approx(0.0f).margin(1.0f));
}

TEST_CASE("Wet 0 passes the input unchanged", "[filter]") {
    auto filter = makeFilter(FilterTopology::VCF, 200.0f, 0.5f);
    filter.setMix(1.0f, 0.0f, 0.0f, 0.0f);
    for (int i = 0; i < 64; ++i) {
        const float x = 0.01f * static_cast<float>(i);
        REQUIRE(filter.process({x, -x}).left == Approx(x));
    }
}

TEST_CASE("SVF gain at cutoff grows monotonically with resonance", "[filter][svf][resonance]") {
    float previous = 0.0f;
    for (float resonance : {0.0f, 0.2f, 0.4f, 0.6f, 0.8f}) {
        auto filter = makeFilter(FilterTopology::SVF, 1000.0f, resonance);
        const float gain = measureGain(filter, 1000.0f, kLinearAmplitude);
        INFO("resonance " << resonance << " gain " << gain);
        REQUIRE(gain > previous);
        previous = gain;
    }
}

TEST_CASE("Every topology's peak near cutoff grows with resonance", "[filter][resonance]") {
    for (auto topology : kTopologies) {
        DYNAMIC_SECTION("topology " << static_cast<int>(topology)) {
            float previous = 0.0f;
            for (float resonance : {0.0f, 0.25f, 0.5f, 0.75f}) {
                const float peak = peakGainNearCutoff(topology, 1000.0f, resonance);
                INFO("resonance " << resonance << " peak gain " << peak);
                REQUIRE(std::isfinite(peak));
                REQUIRE(peak > previous);
                previous = peak;
            }
        }
    }
}

TEST_CASE("Every resonance curve maps resonance to non-increasing damping", "[filter][resonance]") {
    for (size_t c = 0; c < kResonanceCurveCount; ++c) {
        const auto curve = static_cast<ResonanceCurve>(c);
        DYNAMIC_SECTION("curve " << c) {
            REQUIRE(SvfFilter::dampingFor(curve, 0.0f) == Approx(SvfFilter::kMaxDamping));
            float previous = SvfFilter::dampingFor(curve, 0.0f);
            for (int i = 1; i <= 20; ++i) {
                const float d = SvfFilter::dampingFor(curve, static_cast<float>(i) / 20.0f);
                REQUIRE(d <= previous + 1e-6f);
                REQUIRE(d >= SvfFilter::kMinDamping - 1e-6f);
                previous = d;
            }
        }
    }
}

TEST_CASE("Every topology stays finite under full resonance and hot input", "[filter][stability]") {
    for (auto topology : kTopologies) {
        DYNAMIC_SECTION("topology " << static_cast<int>(topology)) {
            auto filter = makeFilter(topology, 2000.0f, 1.0f);
            float peak = 0.0f;
            for (size_t i = 0; i < 44100; ++i) {
                const float x = (i % 100 < 50) ? 4.0f : -4.0f;
                const StereoFrame y = filter.process({x, x});
                REQUIRE(std::isfinite(y.left));
                REQUIRE(std::isfinite(y.right));
                peak = std::max(peak, std::abs(y.left));
            }
            REQUIRE(peak < 100.0f);
        }
    }
}

TEST_CASE("Non-finite input resets the filter instead of poisoning it", "[filter][stability]") {
    for (auto topology : kTopologies) {
        DYNAMIC_SECTION("topology " << static_cast<int>(topology)) {
            auto filter = makeFilter(topology, 1000.0f, 0.5f);
            const float nan = std::numeric_limits<float>::quiet_NaN();
            (void)filter.process({nan, nan});
            for (int i = 0; i < 256; ++i) {
                const StereoFrame y = filter.process({0.5f, 0.5f});
                REQUIRE(std::isfinite(y.left));
                REQUIRE(std::isfinite(y.right));
            }
        }
    }
}

TEST_CASE("Cutoff is clamped to the audible range", "[filter]") {
    VoiceFilter filter;
    filter.prepare(kSampleRate);
    filter.setCutoff(5.0f);
    REQUIRE(filter.cutoff() == kMinFilterCutoffHz);
    filter.setCutoff(50000.0f);
    REQUIRE(filter.cutoff() == kMaxFilterCutoffHz);
    filter.setCutoff(std::numeric_limits<float>::infinity());
    REQUIRE(filter.cutoff() == kMaxFilterCutoffHz);
}

TEST_CASE("FilterBank routes modules by their filter assignment", "[filter][routing]") {
    FilterBank bank;
    bank.prepare(kSampleRate);

    FilterSettings settings;
    settings.wet = 0.0f;  // filters pass input through
    bank.setSettings(0, settings);
    bank.setSettings(1, settings);
    bank.setTargets(0, 1000.0f, 0.0f);
    bank.setTargets(1, 1000.0f, 0.0f);

    const std::array<StereoFrame, kNumAudioModules> modules = {
        StereoFrame{1.0f, 1.0f}, StereoFrame{2.0f, 2.0f}, StereoFrame{4.0f, 4.0f}};

    SECTION("parallel sums every routed module once") {
        bank.setRouting(FilterRouting::Parallel);
        const auto out = bank.process(modules, {ModuleFilterRouting::Filter1,
                                                ModuleFilterRouting::Filter2,
                                                ModuleFilterRouting::Bypass});
        REQUIRE(out.left == Approx(7.0f));
    }

    SECTION("both sends a module through the two filters") {
        bank.setRouting(FilterRouting::Parallel);
        const auto out = bank.process(modules, {ModuleFilterRouting::Both,
                                                ModuleFilterRouting::Bypass,
                                                ModuleFilterRouting::Bypass});
        REQUIRE(out.left == Approx(8.0f));
    }

    SECTION("series feeds filter 1 into filter 2") {
        bank.setRouting(FilterRouting::Series12);
        const auto out = bank.process(modules, {ModuleFilterRouting::Filter1,
                                                ModuleFilterRouting::Filter2,
                                                ModuleFilterRouting::Bypass});
        REQUIRE(out.left == Approx(7.0f));
    }
}
