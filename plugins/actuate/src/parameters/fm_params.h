#pragma once
#include "plugin_ids.h"
#include "parameters/envelope_params.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/processors/fm_operator.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

struct FmParams {
    std::atomic<float> oneToTwo{0.0f};     // 0-1
    std::atomic<float> oneToThree{0.0f};   // 0-1
    std::atomic<float> twoToThree{0.0f};   // 0-1
    std::atomic<int> ratio{1};             // 1-8
    EnvelopeParams envelope;
};

inline void handleFmParamChange(
    FmParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    if (id >= kFmEnvAttackId && id <= kFmEnvReleaseCurveId) {
        handleEnvelopeParamChange(params.envelope, id - kFmEnvAttackId, value);
        return;
    }
    switch (id) {
        case kFmOneToTwoId:
            params.oneToTwo.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFmOneToThreeId:
            params.oneToThree.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFmTwoToThreeId:
            params.twoToThree.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFmRatioId:
            params.ratio.store(intFromNormalized(value, DSP::kMinFmRatio, DSP::kMaxFmRatio),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerFmParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("FM 1>2"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kFmOneToTwoId);
    parameters.addParameter(STR16("FM 1>3"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kFmOneToThreeId);
    parameters.addParameter(STR16("FM 2>3"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kFmTwoToThreeId);
    parameters.addParameter(STR16("FM Ratio"), STR16(""), DSP::kMaxFmRatio - DSP::kMinFmRatio, 0.0,
        ParameterInfo::kCanAutomate, kFmRatioId);
    registerEnvelopeParams(parameters, "FM Env", kFmEnvAttackId);
}

inline void saveFmParams(const FmParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.oneToTwo.load(std::memory_order_relaxed));
    streamer.writeFloat(params.oneToThree.load(std::memory_order_relaxed));
    streamer.writeFloat(params.twoToThree.load(std::memory_order_relaxed));
    streamer.writeInt32(params.ratio.load(std::memory_order_relaxed));
    saveEnvelopeParams(params.envelope, streamer);
}

inline bool loadFmParams(FmParams& params, StateReader& reader) {
    float fv = 0.0f; Steinberg::int32 iv = 0;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.oneToTwo.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.oneToThree.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.twoToThree.store(fv, std::memory_order_relaxed);
    if (!reader.readInt(iv, DSP::kMinFmRatio, DSP::kMaxFmRatio)) return false;
    params.ratio.store(iv, std::memory_order_relaxed);
    return loadEnvelopeParams(params.envelope, reader);
}

template<typename SetParamFunc>
inline void syncFmParamsToController(const FmParams& params, SetParamFunc setParam) {
    setParam(kFmOneToTwoId, static_cast<double>(params.oneToTwo.load(std::memory_order_relaxed)));
    setParam(kFmOneToThreeId, static_cast<double>(params.oneToThree.load(std::memory_order_relaxed)));
    setParam(kFmTwoToThreeId, static_cast<double>(params.twoToThree.load(std::memory_order_relaxed)));
    setParam(kFmRatioId,
        intToNormalized(params.ratio.load(std::memory_order_relaxed), DSP::kMinFmRatio, DSP::kMaxFmRatio));
    syncEnvelopeParamsToController(params.envelope, kFmEnvAttackId, setParam);
}

} // namespace Actuate
