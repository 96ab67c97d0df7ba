#pragma once
#include "plugin_ids.h"
#include "parameters/parameter_helpers.h"
#include "parameters/phaser_params.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

struct ActuateFlangerParams {
    std::atomic<float> amount{0.0f};     // 0-1
    std::atomic<float> depth{0.5f};      // 0-1
    std::atomic<float> rateHz{0.3f};     // 0.01-10 Hz
    std::atomic<float> feedback{0.5f};   // 0-1
};

inline void handleFlangerParamChange(
    ActuateFlangerParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kFlangerAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFlangerDepthId:
            params.depth.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kFlangerRateId:
            params.rateHz.store(logFreqFromNormalized(value, kMinModFxRateHz, kMaxModFxRateHz),
                std::memory_order_relaxed); break;
        case kFlangerFeedbackId:
            params.feedback.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerFlangerParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Flanger Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kFlangerAmountId);
    parameters.addParameter(STR16("Flanger Depth"), STR16("%"), 0, 0.5,
        ParameterInfo::kCanAutomate, kFlangerDepthId);
    parameters.addParameter(STR16("Flanger Rate"), STR16("Hz"), 0,
        logFreqToNormalized(0.3f, kMinModFxRateHz, kMaxModFxRateHz),
        ParameterInfo::kCanAutomate, kFlangerRateId);
    parameters.addParameter(STR16("Flanger Feedback"), STR16("%"), 0, 0.5,
        ParameterInfo::kCanAutomate, kFlangerFeedbackId);
}

inline void saveFlangerParams(const ActuateFlangerParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.depth.load(std::memory_order_relaxed));
    streamer.writeFloat(params.rateHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.feedback.load(std::memory_order_relaxed));
}

inline bool loadFlangerParams(ActuateFlangerParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.depth.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, kMinModFxRateHz, kMaxModFxRateHz)) return false;
    params.rateHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.feedback.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncFlangerParamsToController(const ActuateFlangerParams& params, SetParamFunc setParam) {
    setParam(kFlangerAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kFlangerDepthId, static_cast<double>(params.depth.load(std::memory_order_relaxed)));
    setParam(kFlangerRateId,
        logFreqToNormalized(params.rateHz.load(std::memory_order_relaxed), kMinModFxRateHz, kMaxModFxRateHz));
    setParam(kFlangerFeedbackId, static_cast<double>(params.feedback.load(std::memory_order_relaxed)));
}

} // namespace Actuate
