// ==============================================================================
// Unit Test: Preset Save/Load
// ==============================================================================
// Round trip of parameters, metadata and embedded samples through
// savePreset()/loadPreset(), and rejection of malformed streams without
// touching the current state.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "processor/instrument.h"
#include "plugin_ids.h"

#include "public.sdk/source/common/memorystream.h"
#include "base/source/fstreamer.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <vector>

using Catch::Approx;
using namespace Actuate;

namespace {

std::unique_ptr<ActuateInstrument> makeInstrument() {
    auto instrument = std::make_unique<ActuateInstrument>();
    instrument->prepare(44100.0, 512);
    return instrument;
}

std::vector<float> makeStereoRamp(size_t frames) {
    std::vector<float> pcm(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        pcm[2 * i] = static_cast<float>(i) / static_cast<float>(frames);
        pcm[2 * i + 1] = -pcm[2 * i];
    }
    return pcm;
}

void rewind(Steinberg::MemoryStream& stream) {
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);
}

// Byte offsets in a preset with empty name and info
constexpr size_t kVersionOffset = 4;
constexpr size_t kMasterGainOffset = 24;
constexpr size_t kVoiceCountOffset = 32;

template <typename T>
void poke(Steinberg::MemoryStream& stream, size_t offset, T value) {
    REQUIRE(offset + sizeof(T) <= static_cast<size_t>(stream.getSize()));
    std::memcpy(stream.getData() + offset, &value, sizeof(T));
}

/// Stream holding a saved default preset, rewound to the start.
void saveDefault(Steinberg::MemoryStream& stream) {
    ActuateInstrument source;
    REQUIRE(source.savePreset(&stream).ok());
    rewind(stream);
}

} // anonymous namespace

// =============================================================================
// Round Trip
// =============================================================================

TEST_CASE("Preset round trip restores parameters and metadata", "[preset][roundtrip]") {
    auto source = makeInstrument();
    source->setParamNormalized(kMasterGainId, 0.25);
    source->setParamNormalized(kVoiceCountId, 1.0);
    source->setParamNormalized(moduleParamId(1, kModuleTypeOffset), 0.4);
    source->setParamNormalized(filterParamId(0, kFilterResonanceOffset), 0.7);
    source->setParamNormalized(kFxOrderBaseId, listIndexToNormalized(4, kFxSlotCount));
    source->setParamNormalized(kReverbAmountId, 0.3);

    PresetMetadata metadata;
    metadata.name = "Glass Pad";
    metadata.info = "Slow attack, bright tail";
    metadata.category = PresetType::Pad;
    metadata.tags = kTagBright | kTagLush;
    source->setMetadata(metadata);

    Steinberg::MemoryStream stream;
    REQUIRE(source->savePreset(&stream).ok());
    rewind(stream);

    auto restored = makeInstrument();
    const auto status = restored->loadPreset(&stream);
    REQUIRE(status.ok());

    const auto& p = restored->params();
    REQUIRE(p.global.masterGain.load() == Approx(0.5f));
    REQUIRE(p.global.voiceCount.load() == 32);
    REQUIRE(p.modules[1].type.load() == source->params().modules[1].type.load());
    REQUIRE(p.filters[0].resonance.load() == Approx(0.7f));
    REQUIRE(p.fxEnable.order[0].load() == 4);
    REQUIRE(p.fxEnable.order[4].load() == 0);
    REQUIRE(p.reverb.amount.load() == Approx(0.3f));

    REQUIRE(restored->metadata().name == "Glass Pad");
    REQUIRE(restored->metadata().info == "Slow attack, bright tail");
    REQUIRE(restored->metadata().category == PresetType::Pad);
    REQUIRE(restored->metadata().hasTag(kTagBright));
    REQUIRE(restored->metadata().hasTag(kTagLush));
    REQUIRE_FALSE(restored->metadata().hasTag(kTagHarsh));
}

TEST_CASE("Loading a preset updates the parameter surface", "[preset][roundtrip][parameters]") {
    auto source = makeInstrument();
    source->setParamNormalized(kMasterGainId, 0.25);
    source->setParamNormalized(kVoiceCountId, 1.0);
    source->setParamNormalized(moduleParamId(1, kModuleTypeOffset),
                               listIndexToNormalized(2, kModuleTypeCount));
    source->setParamNormalized(moduleParamId(0, kModuleAmpAttackOffset + kEnvReleaseOffset), 0.4);
    source->setParamNormalized(filterParamId(1, kFilterCutoffOffset), 0.3);
    source->setParamNormalized(filterParamId(0, kFilterResonanceOffset), 0.7);
    source->setParamNormalized(lfoParamId(2, kLfoRateOffset), 0.6);
    source->setParamNormalized(modSlotParamId(3, kModSlotDepthOffset), 0.8);
    source->setParamNormalized(kFxOrderBaseId, listIndexToNormalized(4, kFxSlotCount));
    source->setParamNormalized(kEqLowGainId, 0.75);

    Steinberg::MemoryStream stream;
    REQUIRE(source->savePreset(&stream).ok());
    rewind(stream);

    auto restored = makeInstrument();
    // Values the preset must overwrite
    restored->setParamNormalized(kMasterGainId, 0.9);
    restored->setParamNormalized(kReverbAmountId, 0.6);
    REQUIRE(restored->loadPreset(&stream).ok());

    SECTION("edited and stale values follow the preset") {
        auto& surface = restored->parameters();
        REQUIRE(surface.getParameter(kMasterGainId)->getNormalized() == Approx(0.25).margin(1e-6));
        REQUIRE(surface.getParameter(kReverbAmountId)->getNormalized() == Approx(0.0).margin(1e-6));
        REQUIRE(surface.getParameter(kVoiceCountId)->getNormalized() == Approx(1.0).margin(1e-6));
        REQUIRE(surface.getParameter(filterParamId(1, kFilterCutoffOffset))->getNormalized()
                == Approx(0.3).margin(1e-4));
    }

    SECTION("every parameter matches the instrument that saved the preset") {
        auto& expected = source->parameters();
        auto& actual = restored->parameters();
        REQUIRE(actual.getParameterCount() == expected.getParameterCount());
        for (Steinberg::int32 i = 0; i < expected.getParameterCount(); ++i) {
            const auto id = expected.getParameterByIndex(i)->getInfo().id;
            INFO("parameter id " << id);
            REQUIRE(actual.getParameter(id)->getNormalized()
                    == Approx(expected.getParameter(id)->getNormalized()).margin(1e-4));
        }
    }
}

TEST_CASE("A rejected preset leaves the parameter surface untouched", "[preset][parameters]") {
    auto instrument = makeInstrument();
    instrument->setParamNormalized(kMasterGainId, 0.8);

    Steinberg::MemoryStream stream;
    saveDefault(stream);
    poke<Steinberg::int32>(stream, kVersionOffset, kCurrentPresetVersion + 1);
    REQUIRE_FALSE(instrument->loadPreset(&stream).ok());

    REQUIRE(instrument->parameters().getParameter(kMasterGainId)->getNormalized()
            == Approx(0.8).margin(1e-6));
}

TEST_CASE("Preset round trip embeds sample data", "[preset][roundtrip][samples]") {
    auto source = makeInstrument();
    const auto pcm = makeStereoRamp(2048);
    DSP::ActuateError error = DSP::ActuateError::None;
    REQUIRE(source->loadSample(2, pcm.data(), 2, 2048, 44100.0, error));

    Steinberg::MemoryStream stream;
    REQUIRE(source->savePreset(&stream).ok());
    rewind(stream);

    auto restored = makeInstrument();
    REQUIRE(restored->loadPreset(&stream).ok());
    REQUIRE_FALSE(restored->hasSample(0));
    REQUIRE_FALSE(restored->hasSample(1));
    REQUIRE(restored->hasSample(2));

    const auto bank = restored->engine().sampleBank(2);
    REQUIRE(bank != nullptr);
    const auto selection = bank->select(DSP::kSampleRootNote);
    REQUIRE(selection.buffer != nullptr);
    REQUIRE(selection.buffer->numFrames() == 2048);
    REQUIRE(selection.buffer->numChannels() == 2);
    for (size_t i = 0; i < 2048; ++i) {
        REQUIRE(selection.buffer->channel(0)[i] == pcm[2 * i]);
        REQUIRE(selection.buffer->channel(1)[i] == pcm[2 * i + 1]);
    }
}

TEST_CASE("Saving the same state twice yields identical bytes", "[preset][roundtrip]") {
    auto instrument = makeInstrument();
    instrument->setParamNormalized(kChorusAmountId, 0.6);

    Steinberg::MemoryStream first;
    Steinberg::MemoryStream second;
    REQUIRE(instrument->savePreset(&first).ok());
    REQUIRE(instrument->savePreset(&second).ok());
    REQUIRE(first.getSize() == second.getSize());
    REQUIRE(std::memcmp(first.getData(), second.getData(),
                        static_cast<size_t>(first.getSize())) == 0);
}

// =============================================================================
// Rejection
// =============================================================================

TEST_CASE("Malformed presets are rejected without touching state", "[preset][errors]") {
    auto instrument = makeInstrument();
    instrument->setParamNormalized(kMasterGainId, 0.1);
    PresetMetadata metadata;
    metadata.name = "Current";
    instrument->setMetadata(metadata);
    const float gainBefore = instrument->params().global.masterGain.load();

    Steinberg::MemoryStream stream;
    saveDefault(stream);

    SECTION("bad magic") {
        poke<char>(stream, 0, 'X');
        REQUIRE(instrument->loadPreset(&stream).error == DSP::ActuateError::FormatError);
    }
    SECTION("future version") {
        poke<Steinberg::int32>(stream, kVersionOffset, kCurrentPresetVersion + 1);
        REQUIRE(instrument->loadPreset(&stream).error == DSP::ActuateError::FormatError);
    }
    SECTION("truncated stream") {
        Steinberg::MemoryStream truncated;
        Steinberg::int32 written = 0;
        truncated.write(stream.getData(), static_cast<Steinberg::int32>(stream.getSize() / 2),
                        &written);
        rewind(truncated);
        REQUIRE(instrument->loadPreset(&truncated).error == DSP::ActuateError::FormatError);
    }
    SECTION("voice count out of range") {
        poke<Steinberg::int32>(stream, kVoiceCountOffset, 99);
        REQUIRE(instrument->loadPreset(&stream).error == DSP::ActuateError::ConfigError);
    }
    SECTION("NaN master gain") {
        poke<float>(stream, kMasterGainOffset, std::numeric_limits<float>::quiet_NaN());
        REQUIRE(instrument->loadPreset(&stream).error == DSP::ActuateError::ConfigError);
    }
    SECTION("null stream") {
        REQUIRE(instrument->loadPreset(nullptr).error == DSP::ActuateError::FormatError);
    }

    REQUIRE(instrument->params().global.masterGain.load() == gainBefore);
    REQUIRE(instrument->metadata().name == "Current");
}

TEST_CASE("Default preset starts with the expected header", "[preset][format]") {
    Steinberg::MemoryStream stream;
    saveDefault(stream);
    REQUIRE(std::memcmp(stream.getData(), kPresetMagic, sizeof(kPresetMagic)) == 0);

    Steinberg::int32 version = 0;
    std::memcpy(&version, stream.getData() + kVersionOffset, sizeof(version));
    REQUIRE(version == kCurrentPresetVersion);

    float gain = 0.0f;
    std::memcpy(&gain, stream.getData() + kMasterGainOffset, sizeof(gain));
    REQUIRE(gain == 1.0f);

    Steinberg::int32 voices = 0;
    std::memcpy(&voices, stream.getData() + kVoiceCountOffset, sizeof(voices));
    REQUIRE(voices == 16);
}
