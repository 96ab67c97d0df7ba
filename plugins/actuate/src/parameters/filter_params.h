#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/envelope_params.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/core/filter_types.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>
#include <cstdio>

namespace Actuate {

inline constexpr int kNumFilters = 2;
inline constexpr float kMaxFilterEnvPeakHz = 10000.0f;

struct FilterParams {
    std::atomic<int> topology{0};           // FilterTopology
    std::atomic<int> resonanceCurve{0};     // ResonanceCurve
    std::atomic<float> cutoffHz{20000.0f};  // 20-20000 Hz
    std::atomic<float> resonance{0.0f};     // 0-1
    std::atomic<float> lowMix{1.0f};        // 0-1
    std::atomic<float> bandMix{0.0f};       // 0-1
    std::atomic<float> highMix{0.0f};       // 0-1
    std::atomic<float> wet{1.0f};           // 0-1
    std::atomic<float> envPeakHz{0.0f};     // -10000 to +10000 Hz
    EnvelopeParams envelope;
};

inline void handleFilterParamChange(
    FilterParams& params, Steinberg::Vst::ParamID offset,
    Steinberg::Vst::ParamValue value) {
    if (offset >= kFilterEnvAttackOffset && offset <= kFilterEnvReleaseCurveOffset) {
        handleEnvelopeParamChange(params.envelope, offset - kFilterEnvAttackOffset, value);
        return;
    }
    switch (offset) {
        case kFilterTopologyOffset:
            params.topology.store(listIndexFromNormalized(value, kFilterTopologyCount),
                std::memory_order_relaxed); break;
        case kFilterResonanceCurveOffset:
            params.resonanceCurve.store(listIndexFromNormalized(value, kResonanceCurveCount),
                std::memory_order_relaxed); break;
        case kFilterCutoffOffset:
            // 0-1 -> 20-20000 Hz (logarithmic)
            params.cutoffHz.store(
                logFreqFromNormalized(value, DSP::kMinFilterCutoffHz, DSP::kMaxFilterCutoffHz),
                std::memory_order_relaxed); break;
        case kFilterResonanceOffset:
            params.resonance.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFilterLowMixOffset:
            params.lowMix.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFilterBandMixOffset:
            params.bandMix.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFilterHighMixOffset:
            params.highMix.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFilterWetOffset:
            params.wet.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFilterEnvPeakOffset:
            params.envPeakHz.store(
                linearFromNormalized(value, -kMaxFilterEnvPeakHz, kMaxFilterEnvPeakHz),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerFilterParams(Steinberg::Vst::ParameterContainer& parameters, int filter) {
    using namespace Steinberg::Vst;
    const auto f = static_cast<ParamID>(filter);
    const int number = filter + 1;
    String128 title;

    makeIndexedTitle(title, "Filter", number, "Type");
    parameters.addParameter(createDropdownParameter(title, filterParamId(f, kFilterTopologyOffset),
        kFilterTopologyStrings, kFilterTopologyCount));
    makeIndexedTitle(title, "Filter", number, "Resonance Curve");
    parameters.addParameter(createDropdownParameter(title, filterParamId(f, kFilterResonanceCurveOffset),
        kResonanceCurveStrings, kResonanceCurveCount));
    makeIndexedTitle(title, "Filter", number, "Cutoff");
    parameters.addParameter(title, STR16("Hz"), 0, 1.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterCutoffOffset));
    makeIndexedTitle(title, "Filter", number, "Resonance");
    parameters.addParameter(title, STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterResonanceOffset));
    makeIndexedTitle(title, "Filter", number, "Low Mix");
    parameters.addParameter(title, STR16("%"), 0, 1.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterLowMixOffset));
    makeIndexedTitle(title, "Filter", number, "Band Mix");
    parameters.addParameter(title, STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterBandMixOffset));
    makeIndexedTitle(title, "Filter", number, "High Mix");
    parameters.addParameter(title, STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterHighMixOffset));
    makeIndexedTitle(title, "Filter", number, "Wet");
    parameters.addParameter(title, STR16("%"), 0, 1.0,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterWetOffset));
    makeIndexedTitle(title, "Filter", number, "Env Peak");
    parameters.addParameter(title, STR16("Hz"), 0, 0.5,
        ParameterInfo::kCanAutomate, filterParamId(f, kFilterEnvPeakOffset));

    char prefix[32];
    snprintf(prefix, sizeof(prefix), "Filter %d Env", number);
    registerEnvelopeParams(parameters, prefix, filterParamId(f, kFilterEnvAttackOffset));
}

inline void saveFilterParams(const FilterParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.topology.load(std::memory_order_relaxed));
    streamer.writeInt32(params.resonanceCurve.load(std::memory_order_relaxed));
    streamer.writeFloat(params.cutoffHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.resonance.load(std::memory_order_relaxed));
    streamer.writeFloat(params.lowMix.load(std::memory_order_relaxed));
    streamer.writeFloat(params.bandMix.load(std::memory_order_relaxed));
    streamer.writeFloat(params.highMix.load(std::memory_order_relaxed));
    streamer.writeFloat(params.wet.load(std::memory_order_relaxed));
    streamer.writeFloat(params.envPeakHz.load(std::memory_order_relaxed));
    saveEnvelopeParams(params.envelope, streamer);
}

inline bool loadFilterParams(FilterParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0;
    if (!reader.readIndex(index, kFilterTopologyCount)) return false;
    params.topology.store(index, std::memory_order_relaxed);
    if (!reader.readIndex(index, kResonanceCurveCount)) return false;
    params.resonanceCurve.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, DSP::kMinFilterCutoffHz, DSP::kMaxFilterCutoffHz)) return false;
    params.cutoffHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.resonance.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.lowMix.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.bandMix.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.highMix.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.wet.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -kMaxFilterEnvPeakHz, kMaxFilterEnvPeakHz)) return false;
    params.envPeakHz.store(fv, std::memory_order_relaxed);
    return loadEnvelopeParams(params.envelope, reader);
}

template<typename SetParamFunc>
inline void syncFilterParamsToController(
    const FilterParams& params, int filter, SetParamFunc setParam) {
    const auto f = static_cast<Steinberg::Vst::ParamID>(filter);
    auto id = [f](Steinberg::Vst::ParamID offset) { return filterParamId(f, offset); };
    auto unit = [](const std::atomic<float>& a) {
        return static_cast<double>(a.load(std::memory_order_relaxed));
    };

    setParam(id(kFilterTopologyOffset),
        listIndexToNormalized(params.topology.load(std::memory_order_relaxed), kFilterTopologyCount));
    setParam(id(kFilterResonanceCurveOffset),
        listIndexToNormalized(params.resonanceCurve.load(std::memory_order_relaxed),
                              kResonanceCurveCount));
    setParam(id(kFilterCutoffOffset),
        logFreqToNormalized(params.cutoffHz.load(std::memory_order_relaxed),
                            DSP::kMinFilterCutoffHz, DSP::kMaxFilterCutoffHz));
    setParam(id(kFilterResonanceOffset), unit(params.resonance));
    setParam(id(kFilterLowMixOffset), unit(params.lowMix));
    setParam(id(kFilterBandMixOffset), unit(params.bandMix));
    setParam(id(kFilterHighMixOffset), unit(params.highMix));
    setParam(id(kFilterWetOffset), unit(params.wet));
    setParam(id(kFilterEnvPeakOffset),
        linearToNormalized(params.envPeakHz.load(std::memory_order_relaxed),
                           -kMaxFilterEnvPeakHz, kMaxFilterEnvPeakHz));
    syncEnvelopeParamsToController(params.envelope, id(kFilterEnvAttackOffset), setParam);
}

} // namespace Actuate
