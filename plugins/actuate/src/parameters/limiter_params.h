#pragma once
#include "plugin_ids.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

inline constexpr float kMinLimiterKnee = 0.001f;

struct ActuateLimiterParams {
    std::atomic<float> threshold{0.5f};   // 0-1 linear
    std::atomic<float> knee{0.5f};        // 0.001-1
};

inline void handleLimiterParamChange(
    ActuateLimiterParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kLimiterThresholdId:
            params.threshold.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kLimiterKneeId:
            params.knee.store(linearFromNormalized(value, kMinLimiterKnee, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerLimiterParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Limiter Threshold"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kLimiterThresholdId);
    parameters.addParameter(STR16("Limiter Knee"), STR16(""), 0,
        linearToNormalized(0.5f, kMinLimiterKnee, 1.0f),
        ParameterInfo::kCanAutomate, kLimiterKneeId);
}

inline void saveLimiterParams(const ActuateLimiterParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.threshold.load(std::memory_order_relaxed));
    streamer.writeFloat(params.knee.load(std::memory_order_relaxed));
}

inline bool loadLimiterParams(ActuateLimiterParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.threshold.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, kMinLimiterKnee, 1.0f)) return false; params.knee.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncLimiterParamsToController(const ActuateLimiterParams& params, SetParamFunc setParam) {
    setParam(kLimiterThresholdId, static_cast<double>(params.threshold.load(std::memory_order_relaxed)));
    setParam(kLimiterKneeId, linearToNormalized(params.knee.load(std::memory_order_relaxed), kMinLimiterKnee, 1.0f));
}

} // namespace Actuate
