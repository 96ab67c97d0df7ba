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

inline constexpr float kMaxBufferModDepth = 0.99f;
inline constexpr float kMaxBufferModRateHz = 20.0f;
inline constexpr float kMinBufferModTiming = 6.0f;
inline constexpr float kMaxBufferModTiming = 30000.0f;

struct ActuateBufferModulatorParams {
    std::atomic<float> amount{0.0f};      // 0-1
    std::atomic<float> depth{0.5f};       // 0-0.99
    std::atomic<float> rateHz{1.0f};      // 0-20 Hz
    std::atomic<float> spread{0.0f};      // 0-1
    std::atomic<float> timing{3000.0f};   // 6-30000 samples
};

inline void handleBufferModulatorParamChange(
    ActuateBufferModulatorParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kBufferModAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kBufferModDepthId:
            params.depth.store(linearFromNormalized(value, 0.0f, kMaxBufferModDepth),
                std::memory_order_relaxed); break;
        case kBufferModRateId:
            params.rateHz.store(linearFromNormalized(value, 0.0f, kMaxBufferModRateHz),
                std::memory_order_relaxed); break;
        case kBufferModSpreadId:
            params.spread.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kBufferModTimingId:
            params.timing.store(
                linearFromNormalized(value, kMinBufferModTiming, kMaxBufferModTiming),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerBufferModulatorParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Buffer Mod Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kBufferModAmountId);
    parameters.addParameter(STR16("Buffer Mod Depth"), STR16("%"), 0,
        linearToNormalized(0.5f, 0.0f, kMaxBufferModDepth),
        ParameterInfo::kCanAutomate, kBufferModDepthId);
    parameters.addParameter(STR16("Buffer Mod Rate"), STR16("Hz"), 0,
        linearToNormalized(1.0f, 0.0f, kMaxBufferModRateHz),
        ParameterInfo::kCanAutomate, kBufferModRateId);
    parameters.addParameter(STR16("Buffer Mod Spread"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kBufferModSpreadId);
    parameters.addParameter(STR16("Buffer Mod Timing"), STR16("smp"), 0,
        linearToNormalized(3000.0f, kMinBufferModTiming, kMaxBufferModTiming),
        ParameterInfo::kCanAutomate, kBufferModTimingId);
}

inline void saveBufferModulatorParams(const ActuateBufferModulatorParams& params,
                                      Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.depth.load(std::memory_order_relaxed));
    streamer.writeFloat(params.rateHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.spread.load(std::memory_order_relaxed));
    streamer.writeFloat(params.timing.load(std::memory_order_relaxed));
}

inline bool loadBufferModulatorParams(ActuateBufferModulatorParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxBufferModDepth)) return false; params.depth.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxBufferModRateHz)) return false; params.rateHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.spread.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, kMinBufferModTiming, kMaxBufferModTiming)) return false;
    params.timing.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncBufferModulatorParamsToController(const ActuateBufferModulatorParams& params,
                                                  SetParamFunc setParam) {
    setParam(kBufferModAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kBufferModDepthId, linearToNormalized(params.depth.load(std::memory_order_relaxed), 0.0f, kMaxBufferModDepth));
    setParam(kBufferModRateId, linearToNormalized(params.rateHz.load(std::memory_order_relaxed), 0.0f, kMaxBufferModRateHz));
    setParam(kBufferModSpreadId, static_cast<double>(params.spread.load(std::memory_order_relaxed)));
    setParam(kBufferModTimingId,
        linearToNormalized(params.timing.load(std::memory_order_relaxed), kMinBufferModTiming, kMaxBufferModTiming));
}

} // namespace Actuate
