// ==============================================================================
// Layer 4: Effects Tests
// ==============================================================================
// Covers the individual units of the master effect chain.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/effects/abass.h>
#include <actuate/dsp/effects/buffer_modulator.h>
#include <actuate/dsp/effects/chorus.h>
#include <actuate/dsp/effects/compressor.h>
#include <actuate/dsp/effects/flanger.h>
#include <actuate/dsp/effects/limiter.h>
#include <actuate/dsp/effects/phaser.h>
#include <actuate/dsp/effects/reverb.h>
#include <actuate/dsp/effects/saturation.h>
#include <actuate/dsp/effects/tempo_delay.h>
#include <actuate/dsp/effects/three_band_eq.h>
#include "signal_metrics.h"

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;

struct StereoBuffer {
    std::vector<float> left;
    std::vector<float> right;
};

StereoBuffer makeSine(float hz, float amplitude, size_t n) {
    StereoBuffer b{std::vector<float>(n), std::vector<float>(n)};
    for (size_t i = 0; i < n; ++i) {
        const float x = amplitude * std::sin(kTwoPi * hz * static_cast<float>(i) /
                                             static_cast<float>(kSampleRate));
        b.left[i] = x;
        b.right[i] = -x;
    }
    return b;
}

StereoBuffer makeImpulse(size_t n) {
    StereoBuffer b{std::vector<float>(n, 0.0f), std::vector<float>(n, 0.0f)};
    b.left[0] = 1.0f;
    b.right[0] = 1.0f;
    return b;
}

template <typename Effect>
bool staysFinite(Effect& fx) {
    auto b = makeSine(220.0f, 1.0f, 44100);
    b.left[100] = std::numeric_limits<float>::quiet_NaN();
    b.right[200] = std::numeric_limits<float>::infinity();
    fx.processBlock(b.left.data(), b.right.data(), b.left.size());
    return Metrics::allFinite(b.left.data(), b.left.size()) &&
           Metrics::allFinite(b.right.data(), b.right.size()) &&
           Metrics::peak(b.left) < 100.0f && Metrics::peak(b.right) < 100.0f;
}

} // namespace

// =============================================================================
// Limiter
// =============================================================================

TEST_CASE("Limiter output never exceeds its ceiling", "[effects][limiter]") {
    Limiter limiter;
    limiter.prepare(kSampleRate);
    limiter.setParams({0.5f, 0.2f});
    REQUIRE(limiter.ceiling() == Approx(0.7f));

    for (float x = -50.0f; x <= 50.0f; x += 0.01f) {
        const float y = limiter.processSample(x);
        REQUIRE(std::abs(y) <= limiter.ceiling());
    }
}

TEST_CASE("Limiter is transparent below the soft threshold", "[effects][limiter]") {
    Limiter limiter;
    limiter.prepare(kSampleRate);
    limiter.setParams({0.5f, 0.2f});
    REQUIRE(limiter.softThreshold() == Approx(0.6f));
    REQUIRE(limiter.processSample(0.3f) == 0.3f);
    REQUIRE(limiter.processSample(-0.59f) == -0.59f);
    REQUIRE(limiter.processSample(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
}

TEST_CASE("Limiter curve is monotonic", "[effects][limiter]") {
    Limiter limiter;
    limiter.prepare(kSampleRate);
    limiter.setParams({0.3f, 0.5f});
    float previous = limiter.processSample(0.0f);
    for (float x = 0.001f; x < 10.0f; x += 0.001f) {
        const float y = limiter.processSample(x);
        REQUIRE(y >= previous);
        previous = y;
    }
}

// =============================================================================
// Tempo Delay
// =============================================================================

TEST_CASE("Delay length follows tempo and note value", "[effects][delay]") {
    TempoDelay delay;
    delay.prepare(kSampleRate);
    delay.setTempo(120.0);

    TempoDelayParams params;
    params.time = NoteValue::Quarter;
    delay.setParams(params);
    REQUIRE(delay.delaySamples() == 22050);

    params.modifier = NoteModifier::Dotted;
    delay.setParams(params);
    REQUIRE(delay.delaySamples() == 33075);

    params.time = NoteValue::Eighth;
    params.modifier = NoteModifier::None;
    delay.setParams(params);
    delay.setTempo(60.0);
    REQUIRE(delay.delaySamples() == 22050);
}

TEST_CASE("Delay echoes an impulse after one delay length", "[effects][delay]") {
    TempoDelay delay;
    TempoDelayParams params;
    params.time = NoteValue::Sixteenth;
    params.amount = 1.0f;
    params.decay = 0.5f;
    delay.setParams(params);
    delay.prepare(kSampleRate);
    delay.setTempo(120.0);

    const size_t length = delay.delaySamples();
    REQUIRE(length == 5512);

    auto b = makeImpulse(3 * length);
    delay.processBlock(b.left.data(), b.right.data(), b.left.size());
    REQUIRE(b.left[length] == Approx(0.5f).margin(1e-3));
    REQUIRE(b.left[2 * length] == Approx(0.25f).margin(1e-3));
    REQUIRE(b.left[length / 2] == 0.0f);
}

TEST_CASE("Ping-pong delay alternates sides", "[effects][delay]") {
    TempoDelay delay;
    TempoDelayParams params;
    params.time = NoteValue::Sixteenth;
    params.amount = 1.0f;
    params.decay = 0.5f;
    params.mode = DelayMode::PingPongL;
    delay.setParams(params);
    delay.prepare(kSampleRate);
    delay.setTempo(120.0);

    const size_t length = delay.delaySamples();
    auto b = makeImpulse(3 * length);
    b.right[0] = 0.0f;
    delay.processBlock(b.left.data(), b.right.data(), b.left.size());
    REQUIRE(std::abs(b.left[length]) + std::abs(b.right[length]) > 0.0f);
    REQUIRE(Metrics::allFinite(b.right.data(), b.right.size()));
}

// =============================================================================
// Three-Band EQ
// =============================================================================

TEST_CASE("Flat EQ passes the signal through", "[effects][eq]") {
    ThreeBandEq eq;
    eq.prepare(kSampleRate);
    eq.setParams({});

    auto b = makeSine(1000.0f, 0.5f, 4096);
    const auto reference = b;
    eq.processBlock(b.left.data(), b.right.data(), b.left.size());
    for (size_t i = 0; i < b.left.size(); ++i) {
        REQUIRE(b.left[i] == Approx(reference.left[i]).margin(1e-4));
    }
}

TEST_CASE("EQ boost raises the band level", "[effects][eq]") {
    ThreeBandEq eq;
    eq.prepare(kSampleRate);
    ThreeBandEqParams params;
    params.midGainDb = 12.0f;
    eq.setParams(params);

    auto b = makeSine(3000.0f, 0.1f, 44100);
    eq.processBlock(b.left.data(), b.right.data(), b.left.size());
    const float tailRms = Metrics::rms(b.left.data() + 22050, 22050);
    REQUIRE(tailRms > 2.0f * 0.1f / std::sqrt(2.0f));
}

// =============================================================================
// Dynamics and Saturation
// =============================================================================

TEST_CASE("Compressor reduces gain on a loud signal", "[effects][compressor]") {
    Compressor comp;
    comp.prepare(kSampleRate);
    CompressorParams params;
    params.amount = 1.0f;
    comp.setParams(params);

    auto b = makeSine(220.0f, 0.9f, 44100);
    comp.processBlock(b.left.data(), b.right.data(), b.left.size());
    REQUIRE(comp.gainReduction(0) < 1.0f);
    REQUIRE(comp.gainReduction(0) > 0.0f);
}

TEST_CASE("Clip saturation bounds the output", "[effects][saturation]") {
    Saturation sat;
    sat.prepare(kSampleRate);
    sat.setParams({SaturationType::Clip, 1.0f});

    auto b = makeSine(220.0f, 4.0f, 4410);
    sat.processBlock(b.left.data(), b.right.data(), b.left.size());
    REQUIRE(Metrics::peak(b.left) <= 1.0f + 1e-4f);
}

// =============================================================================
// Reverb
// =============================================================================

TEST_CASE("Every reverb model produces a decaying tail", "[effects][reverb]") {
    for (size_t m = 0; m < kReverbModelCount; ++m) {
        DYNAMIC_SECTION("model " << m) {
            Reverb reverb;
            ReverbParams params;
            params.model = static_cast<ReverbModel>(m);
            params.amount = 1.0f;
            params.size = 0.5f;
            params.feedback = 0.5f;
            reverb.setParams(params);
            reverb.prepare(kSampleRate);

            auto b = makeImpulse(4 * 44100);
            reverb.processBlock(b.left.data(), b.right.data(), b.left.size());
            REQUIRE(Metrics::allFinite(b.left.data(), b.left.size()));
            REQUIRE(Metrics::rms(b.left.data() + 4410, 22050) > 1e-5f);
            const float early = Metrics::rms(b.left.data() + 4410, 22050);
            const float late = Metrics::rms(b.left.data() + 3 * 44100, 22050);
            REQUIRE(late < early);
        }
    }
}

// =============================================================================
// Stability
// =============================================================================

TEST_CASE("Every effect stays finite at full settings", "[effects][safety]") {
    SECTION("abass") {
        ABass fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f});
        REQUIRE(staysFinite(fx));
    }
    SECTION("buffer modulator") {
        BufferModulator fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f, kBufferModMaxDepth, kBufferModMaxRateHz, 1.0f, kBufferModMaxTiming});
        REQUIRE(staysFinite(fx));
    }
    SECTION("chorus") {
        Chorus fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f, 1.0f, 1.0f});
        REQUIRE(staysFinite(fx));
    }
    SECTION("compressor") {
        Compressor fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f, 1.0f, 1.0f, kCompressorMaxDrive});
        REQUIRE(staysFinite(fx));
    }
    SECTION("flanger") {
        Flanger fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f, 1.0f, kFlangerMaxRateHz, 1.0f});
        REQUIRE(staysFinite(fx));
    }
    SECTION("phaser") {
        Phaser fx;
        fx.prepare(kSampleRate);
        fx.setParams({1.0f, 1.0f, kPhaserMaxRateHz, kPhaserMaxFeedback});
        REQUIRE(staysFinite(fx));
    }
    SECTION("reverb") {
        Reverb fx;
        fx.prepare(kSampleRate);
        fx.setParams({ReverbModel::Galactic, 1.0f, 1.0f, 1.0f});
        REQUIRE(staysFinite(fx));
    }
    SECTION("saturation") {
        for (size_t t = 0; t < kSaturationTypeCount; ++t) {
            Saturation fx;
            fx.prepare(kSampleRate);
            fx.setParams({static_cast<SaturationType>(t), 1.0f});
            REQUIRE(staysFinite(fx));
        }
    }
    SECTION("tempo delay") {
        TempoDelay fx;
        fx.prepare(kSampleRate);
        TempoDelayParams params;
        params.amount = 1.0f;
        params.decay = kMaxDelayDecay;
        fx.setParams(params);
        REQUIRE(staysFinite(fx));
    }
    SECTION("eq") {
        ThreeBandEq fx;
        fx.prepare(kSampleRate);
        fx.setParams({800.0f, 3000.0f, 10000.0f, kEqMaxGainDb, kEqMaxGainDb, kEqMaxGainDb});
        REQUIRE(staysFinite(fx));
    }
}
