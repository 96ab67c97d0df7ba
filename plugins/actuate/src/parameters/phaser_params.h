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

inline constexpr float kMinModFxRateHz = 0.01f;
inline constexpr float kMaxModFxRateHz = 10.0f;
inline constexpr float kMaxPhaserFeedback = 0.95f;

struct ActuatePhaserParams {
    std::atomic<float> amount{0.0f};     // 0-1
    std::atomic<float> depth{0.5f};      // 0-1
    std::atomic<float> rateHz{0.5f};     // 0.01-10 Hz
    std::atomic<float> feedback{0.5f};   // 0-0.95
};

inline void handlePhaserParamChange(
    ActuatePhaserParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kPhaserAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kPhaserDepthId:
            params.depth.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kPhaserRateId:
            params.rateHz.store(logFreqFromNormalized(value, kMinModFxRateHz, kMaxModFxRateHz),
                std::memory_order_relaxed); break;
        case kPhaserFeedbackId:
            params.feedback.store(linearFromNormalized(value, 0.0f, kMaxPhaserFeedback),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerPhaserParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Phaser Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kPhaserAmountId);
    parameters.addParameter(STR16("Phaser Depth"), STR16("%"), 0, 0.5,
        ParameterInfo::kCanAutomate, kPhaserDepthId);
    parameters.addParameter(STR16("Phaser Rate"), STR16("Hz"), 0,
        logFreqToNormalized(0.5f, kMinModFxRateHz, kMaxModFxRateHz),
        ParameterInfo::kCanAutomate, kPhaserRateId);
    parameters.addParameter(STR16("Phaser Feedback"), STR16("%"), 0,
        linearToNormalized(0.5f, 0.0f, kMaxPhaserFeedback),
        ParameterInfo::kCanAutomate, kPhaserFeedbackId);
}

inline void savePhaserParams(const ActuatePhaserParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.depth.load(std::memory_order_relaxed));
    streamer.writeFloat(params.rateHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.feedback.load(std::memory_order_relaxed));
}

inline bool loadPhaserParams(ActuatePhaserParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.depth.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, kMinModFxRateHz, kMaxModFxRateHz)) return false;
    params.rateHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxPhaserFeedback)) return false;
    params.feedback.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncPhaserParamsToController(const ActuatePhaserParams& params, SetParamFunc setParam) {
    setParam(kPhaserAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kPhaserDepthId, static_cast<double>(params.depth.load(std::memory_order_relaxed)));
    setParam(kPhaserRateId,
        logFreqToNormalized(params.rateHz.load(std::memory_order_relaxed), kMinModFxRateHz, kMaxModFxRateHz));
    setParam(kPhaserFeedbackId,
        linearToNormalized(params.feedback.load(std::memory_order_relaxed), 0.0f, kMaxPhaserFeedback));
}

} // namespace Actuate
