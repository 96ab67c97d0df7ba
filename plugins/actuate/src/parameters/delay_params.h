#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/core/note_value.h>
#include <actuate/dsp/effects/tempo_delay.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

// Delay time choices, 1/1 down to 1/32 triplet
inline const Steinberg::Vst::TChar* const* const kDelaySnapStrings = kNoteSnapStrings + kDelaySnapOffset;

struct ActuateDelayParams {
    std::atomic<int> timeSnap{kDefaultDelaySnap};   // 0-17, Whole..ThirtySecond x modifier
    std::atomic<float> decay{0.5f};                 // 0-0.99
    std::atomic<float> amount{0.0f};                // 0-1
    std::atomic<int> mode{0};                       // DelayMode
};

/// @brief Delay snap index -> note value and modifier.
[[nodiscard]] inline DSP::NoteValueMapping delayNoteFromSnap(int snap) noexcept {
    return DSP::getNoteValueFromSnapIndex(std::clamp(snap, 0, kDelaySnapCount - 1) + kDelaySnapOffset);
}

inline void handleDelayParamChange(
    ActuateDelayParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kDelayTimeId:
            params.timeSnap.store(listIndexFromNormalized(value, kDelaySnapCount),
                std::memory_order_relaxed); break;
        case kDelayDecayId:
            params.decay.store(linearFromNormalized(value, 0.0f, DSP::kMaxDelayDecay),
                std::memory_order_relaxed); break;
        case kDelayAmountId:
            params.amount.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        case kDelayModeId:
            params.mode.store(listIndexFromNormalized(value, kDelayModeCount),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerDelayParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    parameters.addParameter(createDropdownParameter(STR16("Delay Time"), kDelayTimeId,
        kDelaySnapStrings, kDelaySnapCount, kDefaultDelaySnap));
    parameters.addParameter(STR16("Delay Decay"), STR16("%"), 0,
        linearToNormalized(0.5f, 0.0f, DSP::kMaxDelayDecay),
        ParameterInfo::kCanAutomate, kDelayDecayId);
    parameters.addParameter(STR16("Delay Amount"), STR16("%"), 0, 0.0,
        ParameterInfo::kCanAutomate, kDelayAmountId);
    parameters.addParameter(createDropdownParameter(STR16("Delay Mode"), kDelayModeId,
        kDelayModeStrings, kDelayModeCount));
}

inline void saveDelayParams(const ActuateDelayParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.timeSnap.load(std::memory_order_relaxed));
    streamer.writeFloat(params.decay.load(std::memory_order_relaxed));
    streamer.writeFloat(params.amount.load(std::memory_order_relaxed));
    streamer.writeInt32(params.mode.load(std::memory_order_relaxed));
}

inline bool loadDelayParams(ActuateDelayParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0;
    if (!reader.readIndex(index, kDelaySnapCount)) return false;
    params.timeSnap.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, DSP::kMaxDelayDecay)) return false;
    params.decay.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.amount.store(fv, std::memory_order_relaxed);
    if (!reader.readIndex(index, kDelayModeCount)) return false;
    params.mode.store(index, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncDelayParamsToController(const ActuateDelayParams& params, SetParamFunc setParam) {
    setParam(kDelayTimeId, listIndexToNormalized(params.timeSnap.load(std::memory_order_relaxed), kDelaySnapCount));
    setParam(kDelayDecayId, linearToNormalized(params.decay.load(std::memory_order_relaxed), 0.0f, DSP::kMaxDelayDecay));
    setParam(kDelayAmountId, static_cast<double>(params.amount.load(std::memory_order_relaxed)));
    setParam(kDelayModeId, listIndexToNormalized(params.mode.load(std::memory_order_relaxed), kDelayModeCount));
}

} // namespace Actuate
