// ==============================================================================
// Unit Test: Actuate Instrument
// ==============================================================================
// Host-facing behaviour: parameter application, performance input, sample
// loading and housekeeping.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "processor/instrument.h"
#include "plugin_ids.h"
#include "signal_metrics.h"

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr size_t kBlockSize = 512;

std::vector<float> renderLeft(ActuateInstrument& instrument, size_t numSamples) {
    std::vector<float> left(numSamples);
    std::vector<float> right(numSamples);
    for (size_t pos = 0; pos < numSamples; pos += kBlockSize) {
        const size_t n = std::min(kBlockSize, numSamples - pos);
        instrument.process(left.data() + pos, right.data() + pos, n);
    }
    return left;
}

std::vector<float> makeSine(float hz, size_t frames) {
    std::vector<float> pcm(frames);
    for (size_t i = 0; i < frames; ++i) {
        pcm[i] = 0.5f * std::sin(DSP::kTwoPi * hz * static_cast<float>(i) /
                                 static_cast<float>(kSampleRate));
    }
    return pcm;
}

} // anonymous namespace

// =============================================================================
// Parameters
// =============================================================================

TEST_CASE("Instrument registers the full parameter surface", "[instrument]") {
    ActuateInstrument instrument;
    REQUIRE(instrument.parameters().getParameterCount() > 0);
    auto* gain = instrument.parameters().getParameter(kMasterGainId);
    REQUIRE(gain != nullptr);
    REQUIRE(gain->getNormalized() == Approx(0.5));
}

TEST_CASE("Parameter changes reach the engine patch", "[instrument]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);

    instrument.setParamNormalized(kMasterGainId, 0.25);
    instrument.setParamNormalized(kVoiceCountId, 2.0);   // clamped to 1.0
    REQUIRE(instrument.params().global.masterGain.load() == Approx(0.5f));
    REQUIRE(instrument.params().global.voiceCount.load() == 32);
    REQUIRE(instrument.parameters().getParameter(kVoiceCountId)->getNormalized() == Approx(1.0));

    (void)renderLeft(instrument, kBlockSize);
    REQUIRE(instrument.engine().currentPatch().masterGain == Approx(0.5f));
    REQUIRE(instrument.engine().currentPatch().voiceCount == 32);
}

TEST_CASE("Moving an effect updates both order positions on the surface", "[instrument][parameters]") {
    ActuateInstrument instrument;
    instrument.setParamNormalized(kFxOrderBaseId + 1, listIndexToNormalized(6, kFxSlotCount));
    REQUIRE(instrument.params().fxEnable.order[1].load() == 6);
    REQUIRE(instrument.params().fxEnable.order[6].load() == 1);

    auto& surface = instrument.parameters();
    REQUIRE(surface.getParameter(kFxOrderBaseId + 1)->getNormalized()
            == Approx(listIndexToNormalized(6, kFxSlotCount)));
    REQUIRE(surface.getParameter(kFxOrderBaseId + 6)->getNormalized()
            == Approx(listIndexToNormalized(1, kFxSlotCount)));
}

// =============================================================================
// Performance
// =============================================================================

TEST_CASE("Default instrument plays a sine at the note pitch", "[instrument][e2e]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    REQUIRE(instrument.noteOn(60, 100));

    const auto out = renderLeft(instrument, 44100);
    REQUIRE(Metrics::dominantFrequency(out.data() + 22050, 22050, kSampleRate, 240.0, 280.0, 0.25)
            == Approx(261.63).margin(1.0));
    REQUIRE(Metrics::peak(out.data() + 22050, 22050)
            == Approx(0.70710678f).margin(0.005));

    REQUIRE(instrument.noteOff(60));
    (void)renderLeft(instrument, 44100);
    REQUIRE(instrument.engine().getActiveVoiceCount() == 0);
}

TEST_CASE("Non-finite bend and pressure are refused", "[instrument][safety]") {
    ActuateInstrument instrument;
    REQUIRE_FALSE(instrument.pitchBend(std::numeric_limits<float>::quiet_NaN()));
    REQUIRE_FALSE(instrument.aftertouch(std::numeric_limits<float>::infinity()));
    REQUIRE(instrument.pitchBend(0.5f));
    REQUIRE(instrument.aftertouch(0.5f));
}

// =============================================================================
// Samples
// =============================================================================

TEST_CASE("loadSample validates its arguments", "[instrument][samples]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    const auto pcm = makeSine(440.0f, 1024);
    DSP::ActuateError error = DSP::ActuateError::None;

    SECTION("module index") {
        REQUIRE_FALSE(instrument.loadSample(3, pcm.data(), 1, 1024, kSampleRate, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }
    SECTION("null data") {
        REQUIRE_FALSE(instrument.loadSample(0, nullptr, 1, 1024, kSampleRate, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }
    SECTION("channel count") {
        REQUIRE_FALSE(instrument.loadSample(0, pcm.data(), 0, 1024, kSampleRate, error));
        REQUIRE_FALSE(instrument.loadSample(0, pcm.data(), 3, 256, kSampleRate, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }
    SECTION("empty data") {
        REQUIRE_FALSE(instrument.loadSample(0, pcm.data(), 1, 0, kSampleRate, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }
    SECTION("non-finite sample") {
        auto bad = pcm;
        bad[17] = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_FALSE(instrument.loadSample(0, bad.data(), 1, 1024, kSampleRate, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }
    SECTION("invalid sample rate") {
        REQUIRE_FALSE(instrument.loadSample(0, pcm.data(), 1, 1024, 0.0, error));
        REQUIRE(error == DSP::ActuateError::ConfigError);
    }

    REQUIRE_FALSE(instrument.hasSample(0));
    REQUIRE(instrument.engine().sampleBank(0) == nullptr);
}

TEST_CASE("Loaded samples are resampled to the engine rate", "[instrument][samples]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    const auto pcm = makeSine(440.0f, 48000);
    DSP::ActuateError error = DSP::ActuateError::ConfigError;

    REQUIRE(instrument.loadSample(1, pcm.data(), 1, 48000, 48000.0, error));
    REQUIRE(error == DSP::ActuateError::None);
    REQUIRE(instrument.hasSample(1));

    const auto bank = instrument.engine().sampleBank(1);
    REQUIRE(bank != nullptr);
    REQUIRE(bank->source().sampleRate() == kSampleRate);
    REQUIRE(bank->source().numFrames() == Approx(44100).margin(2));

    instrument.clearSample(1);
    REQUIRE_FALSE(instrument.hasSample(1));
    REQUIRE(instrument.engine().sampleBank(1) == nullptr);
}

TEST_CASE("Switching restretch off rebuilds a pitch-shifted bank", "[instrument][samples]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    const auto pcm = makeSine(261.63f, 8192);
    DSP::ActuateError error = DSP::ActuateError::None;
    REQUIRE(instrument.loadSample(0, pcm.data(), 1, 8192, kSampleRate, error));

    const auto before = instrument.engine().sampleBank(0);
    REQUIRE(before->restretch());
    REQUIRE(before->shiftedCount() == 0);

    instrument.setParamNormalized(moduleParamId(0, kModuleRestretchOffset), 0.0);
    const auto after = instrument.engine().sampleBank(0);
    REQUIRE(after != before);
    REQUIRE_FALSE(after->restretch());
    REQUIRE(after->shiftedCount() == static_cast<size_t>(after->highNote() - after->lowNote() + 1));
}

TEST_CASE("Sampler module plays a loaded sample", "[instrument][samples][e2e]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    instrument.setParamNormalized(moduleParamId(0, kModuleTypeOffset),
                                  listIndexToNormalized(static_cast<int>(DSP::AudioModuleType::Sampler),
                                                        kModuleTypeCount));
    instrument.setParamNormalized(moduleParamId(0, kModuleLoopOffset), 1.0);

    const auto pcm = makeSine(261.63f, 44100);
    DSP::ActuateError error = DSP::ActuateError::None;
    REQUIRE(instrument.loadSample(0, pcm.data(), 1, pcm.size(), kSampleRate, error));

    // One octave up plays the sample at double speed
    REQUIRE(instrument.noteOn(72, 100));
    const auto out = renderLeft(instrument, 22050);
    REQUIRE(Metrics::dominantFrequency(out.data() + 11025, 11025, kSampleRate, 480.0, 560.0, 0.5)
            == Approx(523.26).margin(3.0));
}

// =============================================================================
// Housekeeping
// =============================================================================

TEST_CASE("idle() drains engine diagnostics", "[instrument][diagnostics]") {
    ActuateInstrument instrument;
    instrument.prepare(kSampleRate, kBlockSize);
    instrument.setParamNormalized(moduleParamId(1, kModuleTypeOffset),
                                  listIndexToNormalized(static_cast<int>(DSP::AudioModuleType::Granulizer),
                                                        kModuleTypeCount));
    REQUIRE(instrument.noteOn(64, 90));
    (void)renderLeft(instrument, kBlockSize);

    REQUIRE(instrument.idle() == 1);
    REQUIRE(instrument.idle() == 0);
}
