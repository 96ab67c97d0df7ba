#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/envelope_params.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>
#include <cstdio>

namespace Actuate {

inline constexpr int kNumPitchEnvs = 2;
inline constexpr float kMaxPitchEnvPeak = 48.0f;

struct PitchEnvParams {
    std::atomic<float> peakSemitones{0.0f};   // -48 to +48
    EnvelopeParams envelope;
    std::atomic<int> routing{0};              // PitchEnvRouting
};

inline void handlePitchEnvParamChange(
    PitchEnvParams& params, Steinberg::Vst::ParamID offset,
    Steinberg::Vst::ParamValue value) {
    if (offset >= kPitchEnvAttackOffset && offset <= kPitchEnvReleaseCurveOffset) {
        handleEnvelopeParamChange(params.envelope, offset - kPitchEnvAttackOffset, value);
        return;
    }
    switch (offset) {
        case kPitchEnvPeakOffset:
            params.peakSemitones.store(
                linearFromNormalized(value, -kMaxPitchEnvPeak, kMaxPitchEnvPeak),
                std::memory_order_relaxed); break;
        case kPitchEnvRoutingOffset:
            params.routing.store(listIndexFromNormalized(value, kPitchEnvRoutingCount),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerPitchEnvParams(Steinberg::Vst::ParameterContainer& parameters, int env) {
    using namespace Steinberg::Vst;
    const auto e = static_cast<ParamID>(env);
    const int number = env + 1;
    String128 title;

    makeIndexedTitle(title, "Pitch Env", number, "Peak");
    parameters.addParameter(title, STR16("st"), 0, 0.5,
        ParameterInfo::kCanAutomate, pitchEnvParamId(e, kPitchEnvPeakOffset));

    char prefix[32];
    snprintf(prefix, sizeof(prefix), "Pitch Env %d", number);
    registerEnvelopeParams(parameters, prefix, pitchEnvParamId(e, kPitchEnvAttackOffset));

    makeIndexedTitle(title, "Pitch Env", number, "Routing");
    parameters.addParameter(createDropdownParameter(title, pitchEnvParamId(e, kPitchEnvRoutingOffset),
        kPitchEnvRoutingStrings, kPitchEnvRoutingCount));
}

inline void savePitchEnvParams(const PitchEnvParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.peakSemitones.load(std::memory_order_relaxed));
    saveEnvelopeParams(params.envelope, streamer);
    streamer.writeInt32(params.routing.load(std::memory_order_relaxed));
}

inline bool loadPitchEnvParams(PitchEnvParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0;
    if (!reader.readFloat(fv, -kMaxPitchEnvPeak, kMaxPitchEnvPeak)) return false;
    params.peakSemitones.store(fv, std::memory_order_relaxed);
    if (!loadEnvelopeParams(params.envelope, reader)) return false;
    if (!reader.readIndex(index, kPitchEnvRoutingCount)) return false;
    params.routing.store(index, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncPitchEnvParamsToController(
    const PitchEnvParams& params, int env, SetParamFunc setParam) {
    const auto e = static_cast<Steinberg::Vst::ParamID>(env);
    setParam(pitchEnvParamId(e, kPitchEnvPeakOffset),
        linearToNormalized(params.peakSemitones.load(std::memory_order_relaxed),
                           -kMaxPitchEnvPeak, kMaxPitchEnvPeak));
    syncEnvelopeParamsToController(params.envelope, pitchEnvParamId(e, kPitchEnvAttackOffset), setParam);
    setParam(pitchEnvParamId(e, kPitchEnvRoutingOffset),
        listIndexToNormalized(params.routing.load(std::memory_order_relaxed), kPitchEnvRoutingCount));
}

} // namespace Actuate
