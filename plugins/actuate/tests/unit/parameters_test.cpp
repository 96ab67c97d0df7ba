// ==============================================================================
// Unit Test: Parameter Packs and Patch Assembly
// ==============================================================================
// Normalized-to-plain mapping of the parameter packs, effect order handling
// and the SynthPatch produced by buildPatch().
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "parameters/actuate_params.h"
#include "parameters/build_patch.h"
#include "plugin_ids.h"

using Catch::Approx;
using namespace Actuate;

namespace {

template <typename T>
T get(const std::atomic<T>& a) {
    return a.load(std::memory_order_relaxed);
}

} // anonymous namespace

// =============================================================================
// Defaults
// =============================================================================

TEST_CASE("Parameter defaults describe a plain sine patch", "[params][defaults]") {
    ActuateParams params;
    REQUIRE(get(params.global.masterGain) == 1.0f);
    REQUIRE(get(params.global.voiceCount) == 16);
    REQUIRE(get(params.global.unisonCount) == 1);
    REQUIRE(get(params.global.tuningHz) == 440.0f);
    REQUIRE(get(params.modules[0].type) == static_cast<int>(DSP::AudioModuleType::Oscillator));
    REQUIRE(get(params.modules[1].type) == static_cast<int>(DSP::AudioModuleType::Off));
    REQUIRE(get(params.modules[2].type) == static_cast<int>(DSP::AudioModuleType::Off));
    REQUIRE(get(params.modules[0].shape) == static_cast<int>(DSP::OscShape::Sine));
    REQUIRE(get(params.filters[0].cutoffHz) == 20000.0f);
    for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
        REQUIRE_FALSE(get(params.fxEnable.enabled[i]));
        REQUIRE(get(params.fxEnable.order[i]) == static_cast<int>(i));
    }
}

// =============================================================================
// Normalized Mapping
// =============================================================================

TEST_CASE("Global parameters map to their plain ranges", "[params][mapping]") {
    ActuateParams params;

    handleParamChange(params, kMasterGainId, 0.25);
    REQUIRE(get(params.global.masterGain) == Approx(0.5f));

    handleParamChange(params, kVoiceCountId, 1.0);
    REQUIRE(get(params.global.voiceCount) == 32);
    handleParamChange(params, kVoiceCountId, 0.0);
    REQUIRE(get(params.global.voiceCount) == 1);

    handleParamChange(params, kUnisonCountId, 1.0);
    REQUIRE(get(params.global.unisonCount) == 9);

    handleParamChange(params, kTuningId, 0.5);
    REQUIRE(get(params.global.tuningHz) == Approx(440.0f));

    handleParamChange(params, kMasterFxId, 0.0);
    REQUIRE_FALSE(get(params.global.masterFx));
}

TEST_CASE("Module parameters route by module block", "[params][mapping]") {
    ActuateParams params;

    handleParamChange(params, moduleParamId(1, kModuleOctaveOffset), 0.0);
    REQUIRE(get(params.modules[1].octave) == -2);
    REQUIRE(get(params.modules[0].octave) == 0);

    handleParamChange(params, moduleParamId(2, kModuleSemitonesOffset), 1.0);
    REQUIRE(get(params.modules[2].semitones) == 12);

    handleParamChange(params, moduleParamId(0, kModulePanOffset), 0.0);
    REQUIRE(get(params.modules[0].pan) == Approx(-1.0f));

    handleParamChange(params, moduleParamId(0, kModuleTypeOffset), 1.0);
    REQUIRE(get(params.modules[0].type) == static_cast<int>(DSP::AudioModuleType::SingleCycle));

    handleParamChange(params, moduleParamId(0, kModulePartialAmpOffset + 3), 0.75);
    REQUIRE(get(params.modules[0].partialAmp[3]) == Approx(0.75f));

    handleParamChange(params, moduleParamId(0, kModuleRestretchOffset), 0.0);
    REQUIRE_FALSE(get(params.modules[0].restretch));
}

TEST_CASE("Filter cutoff maps logarithmically", "[params][mapping]") {
    ActuateParams params;
    handleParamChange(params, filterParamId(0, kFilterCutoffOffset), 0.0);
    REQUIRE(get(params.filters[0].cutoffHz) == Approx(20.0f));
    handleParamChange(params, filterParamId(0, kFilterCutoffOffset), 1.0);
    REQUIRE(get(params.filters[0].cutoffHz) == Approx(20000.0f));
    handleParamChange(params, filterParamId(1, kFilterCutoffOffset), 0.5);
    REQUIRE(get(params.filters[1].cutoffHz) == Approx(632.456f).epsilon(0.01));
}

TEST_CASE("Modulation slots map source, destination and signed depth", "[params][modmatrix]") {
    ActuateParams params;
    const auto base = static_cast<Steinberg::Vst::ParamID>(kModMatrixBaseId + kModSlotParamStride);

    handleParamChange(params, base + kModSlotSourceOffset,
                      listIndexToNormalized(static_cast<int>(DSP::ModSource::Lfo2), kModSourceCount));
    handleParamChange(params, base + kModSlotDestinationOffset,
                      listIndexToNormalized(static_cast<int>(DSP::ModDestination::Cutoff1),
                                            kModDestinationCount));
    handleParamChange(params, base + kModSlotDepthOffset, 0.25);

    const auto& slot = params.modMatrix.slots[1];
    REQUIRE(get(slot.source) == static_cast<int>(DSP::ModSource::Lfo2));
    REQUIRE(get(slot.dest) == static_cast<int>(DSP::ModDestination::Cutoff1));
    REQUIRE(get(slot.depth) == Approx(-0.5f));
    REQUIRE(get(params.modMatrix.slots[0].source) == 0);
}

// =============================================================================
// Effect Order
// =============================================================================

TEST_CASE("Choosing an effect for a position swaps it into place", "[params][fx]") {
    FxEnableParams params;
    const int limiter = static_cast<int>(DSP::FxSlot::Limiter);

    setFxOrderPosition(params, 0, limiter);
    REQUIRE(get(params.order[0]) == limiter);
    REQUIRE(get(params.order[10]) == static_cast<int>(DSP::FxSlot::Eq));

    DSP::FxOrder order{};
    for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
        order[i] = static_cast<DSP::FxSlot>(get(params.order[i]));
    }
    REQUIRE(DSP::isPermutation(order));

    SECTION("re-selecting the same unit is a no-op") {
        setFxOrderPosition(params, 0, limiter);
        REQUIRE(get(params.order[0]) == limiter);
        REQUIRE(get(params.order[10]) == static_cast<int>(DSP::FxSlot::Eq));
    }
    SECTION("out-of-range requests are ignored") {
        setFxOrderPosition(params, 11, 0);
        setFxOrderPosition(params, 0, 42);
        REQUIRE(get(params.order[0]) == limiter);
    }
}

TEST_CASE("Effect order follows the order parameters", "[params][fx]") {
    ActuateParams params;
    const auto reverb = static_cast<int>(DSP::FxSlot::Reverb);
    handleParamChange(params, kFxOrderBaseId + 2, listIndexToNormalized(reverb, kFxSlotCount));
    handleParamChange(params, kFxEnableBaseId + static_cast<Steinberg::Vst::ParamID>(reverb), 1.0);

    const auto patch = buildPatch(params);
    REQUIRE(patch.effects.order[2] == DSP::FxSlot::Reverb);
    REQUIRE(patch.effects.order[static_cast<size_t>(reverb)] == DSP::FxSlot::ABass);
    REQUIRE(patch.effects.enabled[static_cast<size_t>(reverb)]);
    REQUIRE(DSP::isPermutation(patch.effects.order));
}

TEST_CASE("Permutation check rejects duplicates", "[params][fx]") {
    auto order = DSP::defaultFxOrder();
    REQUIRE(DSP::isPermutation(order));
    order[3] = order[4];
    REQUIRE_FALSE(DSP::isPermutation(order));
}

// =============================================================================
// Patch Assembly
// =============================================================================

TEST_CASE("buildPatch copies plain values into the snapshot", "[params][patch]") {
    ActuateParams params;
    handleParamChange(params, kMasterGainId, 0.25);
    handleParamChange(params, kUnisonCountId, 0.25);
    handleParamChange(params, moduleParamId(0, kModuleShapeOffset),
                      listIndexToNormalized(static_cast<int>(DSP::OscShape::Square), kOscShapeCount));

    const auto patch = buildPatch(params);
    REQUIRE(patch.masterGain == Approx(0.5f));
    REQUIRE(patch.unisonCount == 3);
    REQUIRE(patch.voiceCount == 16);
    REQUIRE(patch.modules[0].type == DSP::AudioModuleType::Oscillator);
    REQUIRE(patch.modules[0].shape == DSP::OscShape::Square);
    REQUIRE(patch.modules[0].partials[0].amplitude == 1.0f);
    REQUIRE(patch.tuningReference == 440.0f);
}

TEST_CASE("Swapped sample bounds are reordered", "[params][patch]") {
    ActuateParams params;
    handleParamChange(params, moduleParamId(1, kModuleStartOffset), 0.8);
    handleParamChange(params, moduleParamId(1, kModuleEndOffset), 0.2);
    const auto patch = buildPatch(params);
    REQUIRE(patch.modules[1].startPosition == Approx(0.2f));
    REQUIRE(patch.modules[1].endPosition == Approx(0.8f));
}

TEST_CASE("Note snaps resolve to note value and modifier", "[params][patch]") {
    ActuateParams params;
    const auto defaults = buildPatch(params);
    REQUIRE(defaults.effects.delay.time == DSP::NoteValue::Quarter);
    REQUIRE(defaults.effects.delay.modifier == DSP::NoteModifier::None);
    REQUIRE(defaults.lfos[0].noteValue == DSP::NoteValue::Quarter);

    // Delay snaps start at the whole note
    handleParamChange(params, kDelayTimeId, 0.0);
    handleParamChange(params, lfoParamId(1, kLfoNoteValueOffset), 1.0);
    const auto patch = buildPatch(params);
    REQUIRE(patch.effects.delay.time == DSP::NoteValue::Whole);
    REQUIRE(patch.effects.delay.modifier == DSP::NoteModifier::None);
    REQUIRE(patch.lfos[1].noteValue == DSP::NoteValue::ThirtySecond);
    REQUIRE(patch.lfos[1].modifier == DSP::NoteModifier::Triplet);
}

TEST_CASE("Every registered parameter has a unique ID", "[params][registration]") {
    Steinberg::Vst::ParameterContainer container;
    registerAllParams(container);
    REQUIRE(container.getParameterCount() > 0);
    REQUIRE(container.getParameter(kMasterGainId) != nullptr);
    REQUIRE(container.getParameter(moduleParamId(2, kModulePartialPhaseOffset + 15)) != nullptr);
    REQUIRE(container.getParameter(kLimiterKneeId) != nullptr);
    REQUIRE(container.getParameter(kNumParameters) == nullptr);
}
