#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

struct ActuateSaturationParams {
    std::atomic<int> type{0};          // SaturationType
    std::atomic<float> amount{0.0f};   // 0-1
};

inline void handleSaturationParamChange(
    ActuateSaturationParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kSaturationTypeId:
            params.type.store(listIndexFromNormalized(value, kSaturationTypeCount),
                std::memory_order_relaxed); break;
        case kSaturationAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerSaturationParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(createDropdownParameter(STR16("Saturation Type"), kSaturationTypeId,
        kSaturationTypeStrings, kSaturationTypeCount));
    parameters.addParameter(STR16("Saturation Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kSaturationAmountId);
}

inline void saveSaturationParams(const ActuateSaturationParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.type.load(std::memory_order_relaxed));
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
}

inline bool loadSaturationParams(ActuateSaturationParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0;
    if (!reader.readIndex(index, kSaturationTypeCount)) return false;
    params.type.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.amount.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncSaturationParamsToController(const ActuateSaturationParams& params,
                                             SetParamFunc setParam) {
    setParam(kSaturationTypeId, listIndexToNormalized(params.type.load(std::memory_order_relaxed), kSaturationTypeCount));
    setParam(kSaturationAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
}

} // namespace Actuate
