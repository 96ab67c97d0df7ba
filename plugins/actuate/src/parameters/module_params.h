#pragma once

// ==============================================================================
// Audio Module Parameters
// ==============================================================================
// Three identical blocks of 100 IDs. A module is a source (oscillator,
// additive, sampler, granulizer or single cycle) with its own tuning, amp
// envelope, sample region, grain settings and partial table.
// ==============================================================================

#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/envelope_params.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/core/math_constants.h>
#include <actuate/dsp/processors/additive_oscillator.h>
#include <actuate/dsp/processors/granulizer.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>

namespace Actuate {

inline constexpr int kNumModules = 3;
inline constexpr int kMaxOctaveShift = 2;
inline constexpr int kMaxSemitoneShift = 12;
inline constexpr int kNumPartialParams = static_cast<int>(DSP::kNumPartials);

struct ModuleParams {
    std::atomic<int> type{0};               // AudioModuleType
    std::atomic<int> shape{0};              // OscShape
    std::atomic<float> gain{1.0f};          // 0-1
    std::atomic<float> pan{0.0f};           // -1 to +1
    std::atomic<int> octave{0};             // -2 to +2
    std::atomic<int> semitones{0};          // -12 to +12
    std::atomic<float> detune{0.0f};        // -1 to +1 semitone
    std::atomic<float> uniDetune{0.0f};     // 0-1 semitone
    std::atomic<float> stereo{0.0f};        // 0-1
    std::atomic<int> stereoAlgorithm{0};    // StereoAlgorithm
    std::atomic<int> retrigger{1};          // OscRetrigger (Retrigger)
    std::atomic<int> filterRouting{1};      // ModuleFilterRouting (Filter 1)
    EnvelopeParams ampEnv;
    std::atomic<float> startPosition{0.0f}; // 0-1 of the sample
    std::atomic<float> endPosition{1.0f};   // 0-1 of the sample
    std::atomic<bool> loop{false};
    std::atomic<bool> restretch{true};
    std::atomic<int> grainHold{1024};       // samples
    std::atomic<int> grainGap{0};           // samples
    std::atomic<int> grainCrossfade{128};   // samples
    std::atomic<float> partialLevel{1.0f};  // 0-1
    std::array<std::atomic<float>, DSP::kNumPartials> partialAmp{};    // 0-1
    std::array<std::atomic<float>, DSP::kNumPartials> partialPhase{};  // radians, 0-2pi

    ModuleParams() noexcept {
        for (auto& a : partialAmp) a.store(0.0f, std::memory_order_relaxed);
        for (auto& p : partialPhase) p.store(0.0f, std::memory_order_relaxed);
        partialAmp[0].store(1.0f, std::memory_order_relaxed);
    }
};

/// Module 1 starts as a sine oscillator, the others are off.
[[nodiscard]] inline int defaultModuleType(int module) noexcept {
    return module == 0 ? static_cast<int>(DSP::AudioModuleType::Oscillator)
                       : static_cast<int>(DSP::AudioModuleType::Off);
}

inline void handleModuleParamChange(
    ModuleParams& params, Steinberg::Vst::ParamID offset,
    Steinberg::Vst::ParamValue value) {
    if (offset >= kModulePartialAmpOffset &&
        offset < kModulePartialAmpOffset + kNumPartialParams) {
        params.partialAmp[offset - kModulePartialAmpOffset].store(
            std::clamp(static_cast<float>(value), 0.0f, 1.0f), std::memory_order_relaxed);
        return;
    }
    if (offset >= kModulePartialPhaseOffset &&
        offset < kModulePartialPhaseOffset + kNumPartialParams) {
        params.partialPhase[offset - kModulePartialPhaseOffset].store(
            linearFromNormalized(value, 0.0f, DSP::kTwoPi), std::memory_order_relaxed);
        return;
    }
    if (offset >= kModuleAmpAttackOffset && offset <= kModuleAmpReleaseCurveOffset) {
        handleEnvelopeParamChange(params.ampEnv, offset - kModuleAmpAttackOffset, value);
        return;
    }

    switch (offset) {
        case kModuleTypeOffset:
            params.type.store(listIndexFromNormalized(value, kModuleTypeCount),
                std::memory_order_relaxed); break;
        case kModuleShapeOffset:
            params.shape.store(listIndexFromNormalized(value, kOscShapeCount),
                std::memory_order_relaxed); break;
        case kModuleGainOffset:
            params.gain.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModulePanOffset:
            params.pan.store(linearFromNormalized(value, -1.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleOctaveOffset:
            params.octave.store(intFromNormalized(value, -kMaxOctaveShift, kMaxOctaveShift),
                std::memory_order_relaxed); break;
        case kModuleSemitonesOffset:
            params.semitones.store(intFromNormalized(value, -kMaxSemitoneShift, kMaxSemitoneShift),
                std::memory_order_relaxed); break;
        case kModuleDetuneOffset:
            params.detune.store(linearFromNormalized(value, -1.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleUniDetuneOffset:
            params.uniDetune.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleStereoOffset:
            params.stereo.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleStereoAlgorithmOffset:
            params.stereoAlgorithm.store(listIndexFromNormalized(value, kStereoAlgorithmCount),
                std::memory_order_relaxed); break;
        case kModuleRetriggerOffset:
            params.retrigger.store(listIndexFromNormalized(value, kOscRetriggerCount),
                std::memory_order_relaxed); break;
        case kModuleFilterRoutingOffset:
            params.filterRouting.store(listIndexFromNormalized(value, kModuleFilterRoutingCount),
                std::memory_order_relaxed); break;
        case kModuleStartOffset:
            params.startPosition.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleEndOffset:
            params.endPosition.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kModuleLoopOffset:
            params.loop.store(value >= 0.5, std::memory_order_relaxed); break;
        case kModuleRestretchOffset:
            params.restretch.store(value >= 0.5, std::memory_order_relaxed); break;
        case kModuleGrainHoldOffset:
            params.grainHold.store(intFromNormalized(value,
                static_cast<int>(DSP::kMinGrainHold), static_cast<int>(DSP::kMaxGrainHold)),
                std::memory_order_relaxed); break;
        case kModuleGrainGapOffset:
            params.grainGap.store(intFromNormalized(value, 0, static_cast<int>(DSP::kMaxGrainGap)),
                std::memory_order_relaxed); break;
        case kModuleGrainCrossfadeOffset:
            params.grainCrossfade.store(intFromNormalized(value,
                static_cast<int>(DSP::kMinGrainCrossfade), static_cast<int>(DSP::kMaxGrainCrossfade)),
                std::memory_order_relaxed); break;
        case kModulePartialLevelOffset:
            params.partialLevel.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerModuleParams(Steinberg::Vst::ParameterContainer& parameters, int module) {
    using namespace Steinberg::Vst;
    const auto m = static_cast<ParamID>(module);
    const int number = module + 1;
    String128 title;

    makeIndexedTitle(title, "Osc", number, "Type");
    parameters.addParameter(createDropdownParameter(title, moduleParamId(m, kModuleTypeOffset),
        kModuleTypeStrings, kModuleTypeCount, defaultModuleType(module)));
    makeIndexedTitle(title, "Osc", number, "Shape");
    parameters.addParameter(createDropdownParameter(title, moduleParamId(m, kModuleShapeOffset),
        kOscShapeStrings, kOscShapeCount));
    makeIndexedTitle(title, "Osc", number, "Gain");
    parameters.addParameter(title, STR16("%"), 0, 1.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleGainOffset));
    makeIndexedTitle(title, "Osc", number, "Pan");
    parameters.addParameter(title, STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModulePanOffset));
    makeIndexedTitle(title, "Osc", number, "Octave");
    parameters.addParameter(title, STR16("oct"), 2 * kMaxOctaveShift, 0.5,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleOctaveOffset));
    makeIndexedTitle(title, "Osc", number, "Semitones");
    parameters.addParameter(title, STR16("st"), 2 * kMaxSemitoneShift, 0.5,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleSemitonesOffset));
    makeIndexedTitle(title, "Osc", number, "Detune");
    parameters.addParameter(title, STR16("st"), 0, 0.5,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleDetuneOffset));
    makeIndexedTitle(title, "Osc", number, "Uni Detune");
    parameters.addParameter(title, STR16("st"), 0, 0.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleUniDetuneOffset));
    makeIndexedTitle(title, "Osc", number, "Stereo");
    parameters.addParameter(title, STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleStereoOffset));
    makeIndexedTitle(title, "Osc", number, "Stereo Algorithm");
    parameters.addParameter(createDropdownParameter(title,
        moduleParamId(m, kModuleStereoAlgorithmOffset), kStereoAlgorithmStrings, kStereoAlgorithmCount));
    makeIndexedTitle(title, "Osc", number, "Retrigger");
    parameters.addParameter(createDropdownParameter(title,
        moduleParamId(m, kModuleRetriggerOffset), kOscRetriggerStrings, kOscRetriggerCount, 1));
    makeIndexedTitle(title, "Osc", number, "Filter Routing");
    parameters.addParameter(createDropdownParameter(title,
        moduleParamId(m, kModuleFilterRoutingOffset), kModuleFilterRoutingStrings,
        kModuleFilterRoutingCount, 1));

    char prefix[32];
    snprintf(prefix, sizeof(prefix), "Osc %d Amp", number);
    registerEnvelopeParams(parameters, prefix, moduleParamId(m, kModuleAmpAttackOffset));

    makeIndexedTitle(title, "Osc", number, "Start");
    parameters.addParameter(title, STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleStartOffset));
    makeIndexedTitle(title, "Osc", number, "End");
    parameters.addParameter(title, STR16("%"), 0, 1.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleEndOffset));
    makeIndexedTitle(title, "Osc", number, "Loop");
    parameters.addParameter(title, STR16(""), 1, 0.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleLoopOffset));
    makeIndexedTitle(title, "Osc", number, "Restretch");
    parameters.addParameter(title, STR16(""), 1, 1.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleRestretchOffset));
    makeIndexedTitle(title, "Osc", number, "Grain Hold");
    parameters.addParameter(title, STR16("smp"), 0,
        intToNormalized(1024, static_cast<int>(DSP::kMinGrainHold), static_cast<int>(DSP::kMaxGrainHold)),
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleGrainHoldOffset));
    makeIndexedTitle(title, "Osc", number, "Grain Gap");
    parameters.addParameter(title, STR16("smp"), 0, 0.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleGrainGapOffset));
    makeIndexedTitle(title, "Osc", number, "Grain Crossfade");
    parameters.addParameter(title, STR16("smp"), 0,
        intToNormalized(128, static_cast<int>(DSP::kMinGrainCrossfade),
                        static_cast<int>(DSP::kMaxGrainCrossfade)),
        ParameterInfo::kCanAutomate, moduleParamId(m, kModuleGrainCrossfadeOffset));
    makeIndexedTitle(title, "Osc", number, "Partial Level");
    parameters.addParameter(title, STR16("%"), 0, 1.0,
        ParameterInfo::kCanAutomate, moduleParamId(m, kModulePartialLevelOffset));

    for (int k = 0; k < kNumPartialParams; ++k) {
        char text[128];
        snprintf(text, sizeof(text), "Osc %d Partial %d Amp", number, k + 1);
        Steinberg::UString(title, 128).fromAscii(text);
        parameters.addParameter(title, STR16("%"), 0, k == 0 ? 1.0 : 0.0,
            ParameterInfo::kCanAutomate,
            moduleParamId(m, kModulePartialAmpOffset + static_cast<ParamID>(k)));
        snprintf(text, sizeof(text), "Osc %d Partial %d Phase", number, k + 1);
        Steinberg::UString(title, 128).fromAscii(text);
        parameters.addParameter(title, STR16(""), 0, 0.0,
            ParameterInfo::kCanAutomate,
            moduleParamId(m, kModulePartialPhaseOffset + static_cast<ParamID>(k)));
    }
}

inline void saveModuleParams(const ModuleParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.type.load(std::memory_order_relaxed));
    streamer.writeInt32(params.shape.load(std::memory_order_relaxed));
    streamer.writeFloat(params.gain.load(std::memory_order_relaxed));
    streamer.writeFloat(params.pan.load(std::memory_order_relaxed));
    streamer.writeInt32(params.octave.load(std::memory_order_relaxed));
    streamer.writeInt32(params.semitones.load(std::memory_order_relaxed));
    streamer.writeFloat(params.detune.load(std::memory_order_relaxed));
    streamer.writeFloat(params.uniDetune.load(std::memory_order_relaxed));
    streamer.writeFloat(params.stereo.load(std::memory_order_relaxed));
    streamer.writeInt32(params.stereoAlgorithm.load(std::memory_order_relaxed));
    streamer.writeInt32(params.retrigger.load(std::memory_order_relaxed));
    streamer.writeInt32(params.filterRouting.load(std::memory_order_relaxed));
    saveEnvelopeParams(params.ampEnv, streamer);
    streamer.writeFloat(params.startPosition.load(std::memory_order_relaxed));
    streamer.writeFloat(params.endPosition.load(std::memory_order_relaxed));
    streamer.writeInt32(params.loop.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeInt32(params.restretch.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeInt32(params.grainHold.load(std::memory_order_relaxed));
    streamer.writeInt32(params.grainGap.load(std::memory_order_relaxed));
    streamer.writeInt32(params.grainCrossfade.load(std::memory_order_relaxed));
    streamer.writeFloat(params.partialLevel.load(std::memory_order_relaxed));
    for (const auto& a : params.partialAmp) streamer.writeFloat(a.load(std::memory_order_relaxed));
    for (const auto& p : params.partialPhase) streamer.writeFloat(p.load(std::memory_order_relaxed));
}

inline bool loadModuleParams(ModuleParams& params, StateReader& reader) {
    float fv = 0.0f; Steinberg::int32 iv = 0; int index = 0; bool bv = false;
    if (!reader.readIndex(index, kModuleTypeCount)) return false;
    params.type.store(index, std::memory_order_relaxed);
    if (!reader.readIndex(index, kOscShapeCount)) return false;
    params.shape.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.gain.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -1.0f, 1.0f)) return false;
    params.pan.store(fv, std::memory_order_relaxed);
    if (!reader.readInt(iv, -kMaxOctaveShift, kMaxOctaveShift)) return false;
    params.octave.store(iv, std::memory_order_relaxed);
    if (!reader.readInt(iv, -kMaxSemitoneShift, kMaxSemitoneShift)) return false;
    params.semitones.store(iv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -1.0f, 1.0f)) return false;
    params.detune.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.uniDetune.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.stereo.store(fv, std::memory_order_relaxed);
    if (!reader.readIndex(index, kStereoAlgorithmCount)) return false;
    params.stereoAlgorithm.store(index, std::memory_order_relaxed);
    if (!reader.readIndex(index, kOscRetriggerCount)) return false;
    params.retrigger.store(index, std::memory_order_relaxed);
    if (!reader.readIndex(index, kModuleFilterRoutingCount)) return false;
    params.filterRouting.store(index, std::memory_order_relaxed);
    if (!loadEnvelopeParams(params.ampEnv, reader)) return false;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.startPosition.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.endPosition.store(fv, std::memory_order_relaxed);
    if (!reader.readBool(bv)) return false;
    params.loop.store(bv, std::memory_order_relaxed);
    if (!reader.readBool(bv)) return false;
    params.restretch.store(bv, std::memory_order_relaxed);
    if (!reader.readInt(iv, static_cast<Steinberg::int32>(DSP::kMinGrainHold),
                        static_cast<Steinberg::int32>(DSP::kMaxGrainHold))) return false;
    params.grainHold.store(iv, std::memory_order_relaxed);
    if (!reader.readInt(iv, 0, static_cast<Steinberg::int32>(DSP::kMaxGrainGap))) return false;
    params.grainGap.store(iv, std::memory_order_relaxed);
    if (!reader.readInt(iv, static_cast<Steinberg::int32>(DSP::kMinGrainCrossfade),
                        static_cast<Steinberg::int32>(DSP::kMaxGrainCrossfade))) return false;
    params.grainCrossfade.store(iv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.partialLevel.store(fv, std::memory_order_relaxed);
    for (auto& a : params.partialAmp) {
        if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
        a.store(fv, std::memory_order_relaxed);
    }
    for (auto& p : params.partialPhase) {
        if (!reader.readFloat(fv, 0.0f, DSP::kTwoPi)) return false;
        p.store(fv, std::memory_order_relaxed);
    }
    return true;
}

template<typename SetParamFunc>
inline void syncModuleParamsToController(
    const ModuleParams& params, int module, SetParamFunc setParam) {
    const auto m = static_cast<Steinberg::Vst::ParamID>(module);
    auto id = [m](Steinberg::Vst::ParamID offset) { return moduleParamId(m, offset); };
    auto unit = [](const std::atomic<float>& a) {
        return static_cast<double>(a.load(std::memory_order_relaxed));
    };

    setParam(id(kModuleTypeOffset),
        listIndexToNormalized(params.type.load(std::memory_order_relaxed), kModuleTypeCount));
    setParam(id(kModuleShapeOffset),
        listIndexToNormalized(params.shape.load(std::memory_order_relaxed), kOscShapeCount));
    setParam(id(kModuleGainOffset), unit(params.gain));
    setParam(id(kModulePanOffset),
        linearToNormalized(params.pan.load(std::memory_order_relaxed), -1.0f, 1.0f));
    setParam(id(kModuleOctaveOffset),
        intToNormalized(params.octave.load(std::memory_order_relaxed), -kMaxOctaveShift, kMaxOctaveShift));
    setParam(id(kModuleSemitonesOffset),
        intToNormalized(params.semitones.load(std::memory_order_relaxed),
                        -kMaxSemitoneShift, kMaxSemitoneShift));
    setParam(id(kModuleDetuneOffset),
        linearToNormalized(params.detune.load(std::memory_order_relaxed), -1.0f, 1.0f));
    setParam(id(kModuleUniDetuneOffset), unit(params.uniDetune));
    setParam(id(kModuleStereoOffset), unit(params.stereo));
    setParam(id(kModuleStereoAlgorithmOffset),
        listIndexToNormalized(params.stereoAlgorithm.load(std::memory_order_relaxed),
                              kStereoAlgorithmCount));
    setParam(id(kModuleRetriggerOffset),
        listIndexToNormalized(params.retrigger.load(std::memory_order_relaxed), kOscRetriggerCount));
    setParam(id(kModuleFilterRoutingOffset),
        listIndexToNormalized(params.filterRouting.load(std::memory_order_relaxed),
                              kModuleFilterRoutingCount));
    syncEnvelopeParamsToController(params.ampEnv, id(kModuleAmpAttackOffset), setParam);
    setParam(id(kModuleStartOffset), unit(params.startPosition));
    setParam(id(kModuleEndOffset), unit(params.endPosition));
    setParam(id(kModuleLoopOffset), params.loop.load(std::memory_order_relaxed) ? 1.0 : 0.0);
    setParam(id(kModuleRestretchOffset), params.restretch.load(std::memory_order_relaxed) ? 1.0 : 0.0);
    setParam(id(kModuleGrainHoldOffset),
        intToNormalized(params.grainHold.load(std::memory_order_relaxed),
                        static_cast<int>(DSP::kMinGrainHold), static_cast<int>(DSP::kMaxGrainHold)));
    setParam(id(kModuleGrainGapOffset),
        intToNormalized(params.grainGap.load(std::memory_order_relaxed),
                        0, static_cast<int>(DSP::kMaxGrainGap)));
    setParam(id(kModuleGrainCrossfadeOffset),
        intToNormalized(params.grainCrossfade.load(std::memory_order_relaxed),
                        static_cast<int>(DSP::kMinGrainCrossfade),
                        static_cast<int>(DSP::kMaxGrainCrossfade)));
    setParam(id(kModulePartialLevelOffset), unit(params.partialLevel));
    for (int k = 0; k < kNumPartialParams; ++k) {
        const auto partial = static_cast<Steinberg::Vst::ParamID>(k);
        setParam(id(kModulePartialAmpOffset + partial), unit(params.partialAmp[static_cast<size_t>(k)]));
        setParam(id(kModulePartialPhaseOffset + partial),
            linearToNormalized(params.partialPhase[static_cast<size_t>(k)].load(std::memory_order_relaxed),
                               0.0f, DSP::kTwoPi));
    }
}

} // namespace Actuate
