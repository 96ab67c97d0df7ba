#pragma once
#include "plugin_ids.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/effects/three_band_eq.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

inline constexpr float kEqMaxGainDb = 24.0f;

struct ActuateEqParams {
    std::atomic<float> lowFreqHz{800.0f};      // 20-2000 Hz
    std::atomic<float> midFreqHz{3000.0f};     // 100-10000 Hz
    std::atomic<float> highFreqHz{10000.0f};   // 1000-20000 Hz
    std::atomic<float> lowGainDb{0.0f};        // -24 to +24 dB
    std::atomic<float> midGainDb{0.0f};
    std::atomic<float> highGainDb{0.0f};
};

inline void handleEqParamChange(
    ActuateEqParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kEqLowFreqId:
            params.lowFreqHz.store(logFreqFromNormalized(value, 20.0f, 2000.0f),
                std::memory_order_relaxed); break;
        case kEqMidFreqId:
            params.midFreqHz.store(logFreqFromNormalized(value, 100.0f, 10000.0f),
                std::memory_order_relaxed); break;
        case kEqHighFreqId:
            params.highFreqHz.store(logFreqFromNormalized(value, 1000.0f, 20000.0f),
                std::memory_order_relaxed); break;
        case kEqLowGainId:
            params.lowGainDb.store(linearFromNormalized(value, -kEqMaxGainDb, kEqMaxGainDb),
                std::memory_order_relaxed); break;
        case kEqMidGainId:
            params.midGainDb.store(linearFromNormalized(value, -kEqMaxGainDb, kEqMaxGainDb),
                std::memory_order_relaxed); break;
        case kEqHighGainId:
            params.highGainDb.store(linearFromNormalized(value, -kEqMaxGainDb, kEqMaxGainDb),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerEqParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("EQ Low Freq"), STR16("Hz"), 0,
        logFreqToNormalized(800.0f, 20.0f, 2000.0f), ParameterInfo::kCanAutomate, kEqLowFreqId);
    parameters.addParameter(STR16("EQ Mid Freq"), STR16("Hz"), 0,
        logFreqToNormalized(3000.0f, 100.0f, 10000.0f), ParameterInfo::kCanAutomate, kEqMidFreqId);
    parameters.addParameter(STR16("EQ High Freq"), STR16("Hz"), 0,
        logFreqToNormalized(10000.0f, 1000.0f, 20000.0f), ParameterInfo::kCanAutomate, kEqHighFreqId);
    parameters.addParameter(STR16("EQ Low Gain"), STR16("dB"), 0, 0.5,
        ParameterInfo::kCanAutomate, kEqLowGainId);
    parameters.addParameter(STR16("EQ Mid Gain"), STR16("dB"), 0, 0.5,
        ParameterInfo::kCanAutomate, kEqMidGainId);
    parameters.addParameter(STR16("EQ High Gain"), STR16("dB"), 0, 0.5,
        ParameterInfo::kCanAutomate, kEqHighGainId);
}

inline void saveEqParams(const ActuateEqParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.lowFreqHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.midFreqHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.highFreqHz.load(std::memory_order_relaxed));
    streamer.writeFloat(params.lowGainDb.load(std::memory_order_relaxed));
    streamer.writeFloat(params.midGainDb.load(std::memory_order_relaxed));
    streamer.writeFloat(params.highGainDb.load(std::memory_order_relaxed));
}

inline bool loadEqParams(ActuateEqParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 20.0f, 2000.0f)) return false; params.lowFreqHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 100.0f, 10000.0f)) return false; params.midFreqHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 1000.0f, 20000.0f)) return false; params.highFreqHz.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -kEqMaxGainDb, kEqMaxGainDb)) return false; params.lowGainDb.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -kEqMaxGainDb, kEqMaxGainDb)) return false; params.midGainDb.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, -kEqMaxGainDb, kEqMaxGainDb)) return false; params.highGainDb.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncEqParamsToController(const ActuateEqParams& params, SetParamFunc setParam) {
    setParam(kEqLowFreqId, logFreqToNormalized(params.lowFreqHz.load(std::memory_order_relaxed), 20.0f, 2000.0f));
    setParam(kEqMidFreqId, logFreqToNormalized(params.midFreqHz.load(std::memory_order_relaxed), 100.0f, 10000.0f));
    setParam(kEqHighFreqId, logFreqToNormalized(params.highFreqHz.load(std::memory_order_relaxed), 1000.0f, 20000.0f));
    setParam(kEqLowGainId, linearToNormalized(params.lowGainDb.load(std::memory_order_relaxed), -kEqMaxGainDb, kEqMaxGainDb));
    setParam(kEqMidGainId, linearToNormalized(params.midGainDb.load(std::memory_order_relaxed), -kEqMaxGainDb, kEqMaxGainDb));
    setParam(kEqHighGainId, linearToNormalized(params.highGainDb.load(std::memory_order_relaxed), -kEqMaxGainDb, kEqMaxGainDb));
}

} // namespace Actuate
