#pragma once
#include "plugin_ids.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

struct ActuateChorusParams {
    std::atomic<float> amount{0.0f};   // 0-1
    std::atomic<float> range{0.5f};    // 0-1
    std::atomic<float> speed{0.5f};    // 0-1
};

inline void handleChorusParamChange(
    ActuateChorusParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    const float v = std::clamp(static_cast<float>(value), 0.0f, 1.0f);
    switch (id) {
        case kChorusAmountId: params.amount.store(v, std::memory_order_relaxed); break;
        case kChorusRangeId:  params.range.store(v, std::memory_order_relaxed); break;
        case kChorusSpeedId:  params.speed.store(v, std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerChorusParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Chorus Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kChorusAmountId);
    parameters.addParameter(STR16("Chorus Range"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kChorusRangeId);
    parameters.addParameter(STR16("Chorus Speed"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kChorusSpeedId);
}

inline void saveChorusParams(const ActuateChorusParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.range.load(std::memory_order_relaxed));
    streamer.writeFloat(params.speed.load(std::memory_order_relaxed));
}

inline bool loadChorusParams(ActuateChorusParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.range.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.speed.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncChorusParamsToController(const ActuateChorusParams& params, SetParamFunc setParam) {
    setParam(kChorusAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kChorusRangeId, static_cast<double>(params.range.load(std::memory_order_relaxed)));
    setParam(kChorusSpeedId, static_cast<double>(params.speed.load(std::memory_order_relaxed)));
}

} // namespace Actuate
