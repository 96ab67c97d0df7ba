#pragma once
#include "plugin_ids.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

struct ActuateABassParams {
    std::atomic<float> amount{0.0f};   // 0-1
};

inline void handleABassParamChange(
    ActuateABassParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    if (id == kABassAmountId) {
        params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
            std::memory_order_relaxed);
    }
}

inline void registerABassParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("A-Bass Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kABassAmountId);
}

inline void saveABassParams(const ActuateABassParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
}

inline bool loadABassParams(ActuateABassParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.amount.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncABassParamsToController(const ActuateABassParams& params, SetParamFunc setParam) {
    setParam(kABassAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
}

} // namespace Actuate
