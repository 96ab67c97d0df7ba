// ==============================================================================
// Layer 2: DSP Processor - Granulizer Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/processors/granulizer.h>
#include "signal_metrics.h"

#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

std::shared_ptr<const SampleBuffer> makeConstant(float value, size_t frames) {
    std::vector<float> data(frames, value);
    return SampleBuffer::fromChannels(std::move(data), {}, 44100.0);
}

std::vector<float> renderLeft(Granulizer& g, const SampleBuffer* buffer, double rate, size_t n) {
    std::vector<float> left(n);
    std::vector<float> right(n);
    g.processBlock(buffer, rate, left.data(), right.data(), n);
    return left;
}

} // namespace

TEST_CASE("Overlapping grains cross-fade to a constant level", "[granulizer][continuity]") {
    auto buffer = makeConstant(1.0f, 20000);
    Granulizer g;
    g.setSettings({1000, 0, 100});
    g.setLoop(true);
    g.trigger();

    const auto out = renderLeft(g, buffer.get(), 1.0, 12000);
    // After the first fade-in the stream never dips or bumps
    for (size_t i = 100; i < out.size(); ++i) {
        INFO("sample " << i);
        REQUIRE(out[i] == Approx(1.0f).margin(1e-4));
    }
    REQUIRE(Actuate::DSP::TestUtils::SignalMetrics::maxStep(out.data() + 100, out.size() - 100) < 1e-3f);
}

TEST_CASE("Grain period is hold minus crossfade without a gap", "[granulizer]") {
    Granulizer g;
    g.setSettings({1000, 0, 100});
    REQUIRE(g.period() == 900);

    g.setSettings({1000, 500, 100});
    REQUIRE(g.period() == 1500);
}

TEST_CASE("Grain settings are clamped", "[granulizer]") {
    Granulizer g;
    g.setSettings({1, 100000, 100000});
    REQUIRE(g.hold() == kMinGrainHold);
    REQUIRE(g.fade() <= g.hold() / 2);

    g.setSettings({100000, 0, 0});
    REQUIRE(g.hold() == kMaxGrainHold);
    REQUIRE(g.fade() == kMinGrainCrossfade);
}

TEST_CASE("Gap inserts silence between grains", "[granulizer]") {
    auto buffer = makeConstant(1.0f, 20000);
    Granulizer g;
    g.setSettings({200, 300, 20});
    g.trigger();

    const auto out = renderLeft(g, buffer.get(), 1.0, 500);
    REQUIRE(out[100] == Approx(1.0f).margin(1e-4));
    REQUIRE(out[350] == 0.0f);
}

TEST_CASE("Without loop the stream ends at the region end", "[granulizer]") {
    auto buffer = makeConstant(0.5f, 4000);
    Granulizer g;
    g.setSettings({1000, 0, 100});
    g.setLoop(false);
    g.trigger();

    (void)renderLeft(g, buffer.get(), 1.0, 8000);
    REQUIRE_FALSE(g.isPlaying());
}

TEST_CASE("Missing buffer renders silence and spawns nothing", "[granulizer]") {
    Granulizer g;
    g.trigger();
    const auto out = renderLeft(g, nullptr, 1.0, 256);
    REQUIRE(Actuate::DSP::TestUtils::SignalMetrics::isSilent(out.data(), out.size()));
    REQUIRE(g.activeGrainCount() == 0);
}

TEST_CASE("Stop lets active grains play out", "[granulizer]") {
    auto buffer = makeConstant(1.0f, 20000);
    Granulizer g;
    g.setSettings({1000, 0, 100});
    g.trigger();
    (void)renderLeft(g, buffer.get(), 1.0, 10);
    g.stop();
    REQUIRE(g.isPlaying());
    (void)renderLeft(g, buffer.get(), 1.0, 1000);
    REQUIRE_FALSE(g.isPlaying());
}
