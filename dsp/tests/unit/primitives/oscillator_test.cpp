// ==============================================================================
// Layer 1: DSP Primitive - Oscillator Tests
// ==============================================================================
// Pitch accuracy for every periodic shape, noise determinism and output
// sanitization.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/core/pitch_utils.h>
#include <actuate/dsp/primitives/oscillator.h>
#include "signal_metrics.h"

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;

std::vector<float> render(OscShape shape, float frequency, size_t numSamples) {
    Oscillator osc;
    osc.prepare(kSampleRate);
    osc.setShape(shape);
    osc.setFrequency(frequency);
    osc.reset();
    std::vector<float> out(numSamples);
    osc.processBlock(out.data(), out.size());
    return out;
}

constexpr std::array<OscShape, 11> kPeriodicShapes = {
    OscShape::Sine, OscShape::Tri, OscShape::Saw, OscShape::RSaw, OscShape::WSaw,
    OscShape::SSaw, OscShape::RASaw, OscShape::Ramp, OscShape::Square, OscShape::RSquare,
    OscShape::Pulse
};

constexpr int kLowestNote = 21;    // A0
constexpr int kHighestNote = 108;  // C8

double relativeError(double measured, double expected) {
    return std::abs(measured - expected) / expected;
}

/// Strongest bin within half a percent of the expected pitch, on a 0.01% grid.
/// A pitch outside the window lands on its edge and fails the 0.1% check.
double fundamentalNear(const std::vector<float>& signal, double expectedHz) {
    return Metrics::dominantFrequency(signal.data(), signal.size(), kSampleRate,
                                      expectedHz * 0.995, expectedHz * 1.005, expectedHz * 1e-4);
}

} // namespace

TEST_CASE("Oscillator shape classification", "[oscillator]") {
    for (auto shape : kPeriodicShapes) {
        REQUIRE(isPeriodic(shape));
    }
    REQUIRE_FALSE(isPeriodic(OscShape::Noise));
    REQUIRE(kOscShapeCount == kPeriodicShapes.size() + 1);
}

TEST_CASE("Sine pitch tracks the keyboard across the MIDI range", "[oscillator][pitch]") {
    // Two seconds keeps even A0 above fifty cycles
    const size_t n = static_cast<size_t>(2.0 * kSampleRate);

    for (int note = kLowestNote; note <= kHighestNote; note += 3) {
        const float expected = midiNoteToFrequency(static_cast<float>(note));
        DYNAMIC_SECTION("note " << note) {
            const auto out = render(OscShape::Sine, expected, n);
            const double measured = Metrics::zeroCrossingFrequency(out.data(), out.size(), kSampleRate);
            INFO("expected " << expected << " Hz, measured " << measured << " Hz");
            REQUIRE(relativeError(measured, expected) < 0.001);
        }
    }
}

TEST_CASE("Every periodic shape sounds at the requested fundamental", "[oscillator][pitch]") {
    const size_t n = static_cast<size_t>(kSampleRate);

    for (auto shape : kPeriodicShapes) {
        for (int note : {kLowestNote, 45, 60, 84, kHighestNote}) {
            const float expected = midiNoteToFrequency(static_cast<float>(note));
            DYNAMIC_SECTION("shape " << static_cast<int>(shape) << " note " << note) {
                const auto out = render(shape, expected, n);
                const double measured = fundamentalNear(out, expected);
                INFO("expected " << expected << " Hz, measured " << measured << " Hz");
                REQUIRE(relativeError(measured, expected) < 0.001);
            }
        }
    }
}

TEST_CASE("Periodic shapes stay within [-1.1, 1.1] and finite", "[oscillator]") {
    for (auto shape : kPeriodicShapes) {
        DYNAMIC_SECTION("shape " << static_cast<int>(shape)) {
            const auto out = render(shape, 1000.0f, 8192);
            REQUIRE(Metrics::allFinite(out.data(), out.size()));
            REQUIRE(Metrics::peak(out) <= 1.1f);
            REQUIRE(Metrics::rms(out) > 0.1f);
        }
    }
}

TEST_CASE("Sine matches the analytic sine", "[oscillator]") {
    const auto out = render(OscShape::Sine, 440.0f, 512);
    for (size_t i = 0; i < out.size(); ++i) {
        const double expected = std::sin(2.0 * 3.14159265358979 * 440.0 * static_cast<double>(i) / kSampleRate);
        REQUIRE(out[i] == Approx(expected).margin(1e-3));
    }
}

TEST_CASE("Noise is deterministic after reset", "[oscillator][noise]") {
    const auto a = render(OscShape::Noise, 440.0f, 1024);
    const auto b = render(OscShape::Noise, 440.0f, 1024);
    REQUIRE(a == b);
    REQUIRE(Metrics::rms(a) > 0.2f);
    REQUIRE(Metrics::peak(a) <= 1.0f);
}

TEST_CASE("Oscillator frequency is clamped below Nyquist", "[oscillator]") {
    Oscillator osc;
    osc.prepare(kSampleRate);

    osc.setFrequency(30000.0f);
    REQUIRE(osc.frequency() < static_cast<float>(kSampleRate) * 0.5f);

    osc.setFrequency(-10.0f);
    REQUIRE(osc.frequency() == 0.0f);

    osc.setFrequency(std::numeric_limits<float>::quiet_NaN());
    REQUIRE(osc.frequency() == 0.0f);
}

TEST_CASE("Phase modulation offsets one sample only", "[oscillator]") {
    Oscillator osc;
    osc.prepare(kSampleRate);
    osc.setShape(OscShape::Sine);
    osc.setFrequency(0.0f);

    osc.setPhaseModulation(3.14159265f * 0.5f);
    REQUIRE(osc.process() == Approx(1.0f).margin(1e-4));
    REQUIRE(osc.process() == Approx(0.0f).margin(1e-4));
}
