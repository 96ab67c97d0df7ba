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

struct ActuateReverbParams {
    std::atomic<int> model{0};            // ReverbModel
    std::atomic<float> amount{0.0f};      // 0-1
    std::atomic<float> size{0.5f};        // 0-1
    std::atomic<float> feedback{0.5f};    // 0-1
};

inline void handleReverbParamChange(
    ActuateReverbParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kReverbModelId:
            params.model.store(listIndexFromNormalized(value, kReverbModelCount),
                std::memory_order_relaxed); break;
        case kReverbAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kReverbSizeId:
            params.size.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kReverbFeedbackId:
            params.feedback.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerReverbParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(createDropdownParameter(STR16("Reverb Model"), kReverbModelId,
        kReverbModelStrings, kReverbModelCount));
    parameters.addParameter(STR16("Reverb Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kReverbAmountId);
    parameters.addParameter(STR16("Reverb Size"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kReverbSizeId);
    parameters.addParameter(STR16("Reverb Feedback"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kReverbFeedbackId);
}

inline void saveReverbParams(const ActuateReverbParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.model.load(std::memory_order_relaxed));
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.size.load(std::memory_order_relaxed));
    streamer.writeFloat(params.feedback.load(std::memory_order_relaxed));
}

inline bool loadReverbParams(ActuateReverbParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0;
    if (!reader.readIndex(index, kReverbModelCount)) return false;
    params.model.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.size.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.feedback.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncReverbParamsToController(const ActuateReverbParams& params, SetParamFunc setParam) {
    setParam(kReverbModelId, listIndexToNormalized(params.model.load(std::memory_order_relaxed), kReverbModelCount));
    setParam(kReverbAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kReverbSizeId, static_cast<double>(params.size.load(std::memory_order_relaxed)));
    setParam(kReverbFeedbackId, static_cast<double>(params.feedback.load(std::memory_order_relaxed)));
}

} // namespace Actuate
