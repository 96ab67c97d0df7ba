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

inline constexpr float kMaxCompressorDrive = 2.0f;

struct ActuateCompressorParams {
    std::atomic<float> amount{0.0f};    // 0-1
    std::atomic<float> attack{0.5f};    // 0-1
    std::atomic<float> release{0.5f};   // 0-1
    std::atomic<float> drive{1.0f};     // 0-2
};

inline void handleCompressorParamChange(
    ActuateCompressorParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kCompressorAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kCompressorAttackId:
            params.attack.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kCompressorReleaseId:
            params.release.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kCompressorDriveId:
            // 0-1 -> 0-2
            params.drive.store(linearFromNormalized(value, 0.0f, kMaxCompressorDrive),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerCompressorParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(STR16("Compressor Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kCompressorAmountId);
    parameters.addParameter(STR16("Compressor Attack"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kCompressorAttackId);
    parameters.addParameter(STR16("Compressor Release"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kCompressorReleaseId);
    parameters.addParameter(STR16("Compressor Drive"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kCompressorDriveId);
}

inline void saveCompressorParams(const ActuateCompressorParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeFloat(params.attack.load(std::memory_order_relaxed));
    streamer.writeFloat(params.release.load(std::memory_order_relaxed));
    streamer.writeFloat(params.drive.load(std::memory_order_relaxed));
}

inline bool loadCompressorParams(ActuateCompressorParams& params, StateReader& reader) {
    float fv = 0.0f;
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.attack.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.release.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxCompressorDrive)) return false; params.drive.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncCompressorParamsToController(const ActuateCompressorParams& params,
                                             SetParamFunc setParam) {
    setParam(kCompressorAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kCompressorAttackId, static_cast<double>(params.attack.load(std::memory_order_relaxed)));
    setParam(kCompressorReleaseId, static_cast<double>(params.release.load(std::memory_order_relaxed)));
    setParam(kCompressorDriveId,
        linearToNormalized(params.drive.load(std::memory_order_relaxed), 0.0f, kMaxCompressorDrive));
}

} // namespace Actuate
