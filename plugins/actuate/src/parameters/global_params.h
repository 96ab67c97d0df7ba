#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/core/pitch_utils.h>
#include <actuate/dsp/systems/voice_allocator.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

inline constexpr float kMaxMasterGain = 2.0f;
inline constexpr float kMaxMasterWidth = 2.0f;
inline constexpr int kMaxPitchBendRange = 24;
inline constexpr float kMinTuningHz = 400.0f;
inline constexpr float kMaxTuningHz = 480.0f;

struct GlobalParams {
    std::atomic<float> masterGain{1.0f};     // 0-2 linear
    std::atomic<float> masterWidth{1.0f};    // 0-2 (1 = unchanged)
    std::atomic<int> voiceCount{static_cast<int>(DSP::VoiceAllocator::kDefaultVoiceCount)};   // 1-32
    std::atomic<int> unisonCount{1};         // 1-9
    std::atomic<int> pitchBendRange{2};      // 0-24 semitones
    std::atomic<float> tuningHz{440.0f};     // A4 reference, 400-480 Hz
    std::atomic<int> filterRouting{0};       // FilterRouting
    std::atomic<bool> masterFx{true};
};

inline void handleGlobalParamChange(
    GlobalParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    switch (id) {
        case kMasterGainId:
            // 0-1 -> 0-2
            params.masterGain.store(
                linearFromNormalized(value, 0.0f, kMaxMasterGain),
                std::memory_order_relaxed);
            break;
        case kMasterWidthId:
            params.masterWidth.store(
                linearFromNormalized(value, 0.0f, kMaxMasterWidth),
                std::memory_order_relaxed);
            break;
        case kVoiceCountId:
            params.voiceCount.store(
                intFromNormalized(value, 1, static_cast<int>(DSP::VoiceAllocator::kMaxVoices)),
                std::memory_order_relaxed);
            break;
        case kUnisonCountId:
            params.unisonCount.store(
                intFromNormalized(value, 1, static_cast<int>(DSP::VoiceAllocator::kMaxUnisonCount)),
                std::memory_order_relaxed);
            break;
        case kPitchBendRangeId:
            params.pitchBendRange.store(
                intFromNormalized(value, 0, kMaxPitchBendRange),
                std::memory_order_relaxed);
            break;
        case kTuningId:
            params.tuningHz.store(
                linearFromNormalized(value, kMinTuningHz, kMaxTuningHz),
                std::memory_order_relaxed);
            break;
        case kFilterRoutingId:
            params.filterRouting.store(
                listIndexFromNormalized(value, kFilterRoutingCount),
                std::memory_order_relaxed);
            break;
        case kMasterFxId:
            params.masterFx.store(value >= 0.5, std::memory_order_relaxed);
            break;
        default: break;
    }
}

inline void registerGlobalParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    const int maxVoices = static_cast<int>(DSP::VoiceAllocator::kMaxVoices);
    const int maxUnison = static_cast<int>(DSP::VoiceAllocator::kMaxUnisonCount);

    // Master Gain: 0-2, default 1.0 (normalized 0.5)
    parameters.addParameter(STR16("Master Gain"), STR16(""), 0, 0.5,
        ParameterInfo::kCanAutomate, kMasterGainId);
    parameters.addParameter(STR16("Master Width"), STR16("%"), 0, 0.5,
        ParameterInfo::kCanAutomate, kMasterWidthId);
    parameters.addParameter(STR16("Voices"), STR16(""), maxVoices - 1,
        intToNormalized(static_cast<int>(DSP::VoiceAllocator::kDefaultVoiceCount), 1, maxVoices),
        ParameterInfo::kCanAutomate, kVoiceCountId);
    parameters.addParameter(STR16("Unison"), STR16(""), maxUnison - 1, 0.0,
        ParameterInfo::kCanAutomate, kUnisonCountId);
    parameters.addParameter(STR16("Pitch Bend Range"), STR16("st"), kMaxPitchBendRange,
        intToNormalized(2, 0, kMaxPitchBendRange),
        ParameterInfo::kCanAutomate, kPitchBendRangeId);
    parameters.addParameter(STR16("Tuning"), STR16("Hz"), 0,
        linearToNormalized(440.0f, kMinTuningHz, kMaxTuningHz),
        ParameterInfo::kCanAutomate, kTuningId);
    parameters.addParameter(createDropdownParameter(
        STR16("Filter Routing"), kFilterRoutingId, kFilterRoutingStrings, kFilterRoutingCount));
    parameters.addParameter(STR16("Master FX"), STR16(""), 1, 1.0,
        ParameterInfo::kCanAutomate, kMasterFxId);
}

inline void saveGlobalParams(const GlobalParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.masterGain.load(std::memory_order_relaxed));
    streamer.writeFloat(params.masterWidth.load(std::memory_order_relaxed));
    streamer.writeInt32(params.voiceCount.load(std::memory_order_relaxed));
    streamer.writeInt32(params.unisonCount.load(std::memory_order_relaxed));
    streamer.writeInt32(params.pitchBendRange.load(std::memory_order_relaxed));
    streamer.writeFloat(params.tuningHz.load(std::memory_order_relaxed));
    streamer.writeInt32(params.filterRouting.load(std::memory_order_relaxed));
    streamer.writeInt32(params.masterFx.load(std::memory_order_relaxed) ? 1 : 0);
}

inline bool loadGlobalParams(GlobalParams& params, StateReader& reader) {
    float fv = 0.0f; Steinberg::int32 iv = 0; int index = 0; bool bv = false;
    if (!reader.readFloat(fv, 0.0f, kMaxMasterGain)) return false;
    params.masterGain.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxMasterWidth)) return false;
    params.masterWidth.store(fv, std::memory_order_relaxed);
    if (!reader.readInt(iv, 1, static_cast<Steinberg::int32>(DSP::VoiceAllocator::kMaxVoices))) return false;
    params.voiceCount.store(iv, std::memory_order_relaxed);
    if (!reader.readInt(iv, 1, static_cast<Steinberg::int32>(DSP::VoiceAllocator::kMaxUnisonCount))) return false;
    params.unisonCount.store(iv, std::memory_order_relaxed);
    if (!reader.readInt(iv, 0, kMaxPitchBendRange)) return false;
    params.pitchBendRange.store(iv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, kMinTuningHz, kMaxTuningHz)) return false;
    params.tuningHz.store(fv, std::memory_order_relaxed);
    if (!reader.readIndex(index, kFilterRoutingCount)) return false;
    params.filterRouting.store(index, std::memory_order_relaxed);
    if (!reader.readBool(bv)) return false;
    params.masterFx.store(bv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncGlobalParamsToController(const GlobalParams& params, SetParamFunc setParam) {
    const int maxVoices = static_cast<int>(DSP::VoiceAllocator::kMaxVoices);
    const int maxUnison = static_cast<int>(DSP::VoiceAllocator::kMaxUnisonCount);

    setParam(kMasterGainId,
        linearToNormalized(params.masterGain.load(std::memory_order_relaxed), 0.0f, kMaxMasterGain));
    setParam(kMasterWidthId,
        linearToNormalized(params.masterWidth.load(std::memory_order_relaxed), 0.0f, kMaxMasterWidth));
    setParam(kVoiceCountId,
        intToNormalized(params.voiceCount.load(std::memory_order_relaxed), 1, maxVoices));
    setParam(kUnisonCountId,
        intToNormalized(params.unisonCount.load(std::memory_order_relaxed), 1, maxUnison));
    setParam(kPitchBendRangeId,
        intToNormalized(params.pitchBendRange.load(std::memory_order_relaxed), 0, kMaxPitchBendRange));
    setParam(kTuningId,
        linearToNormalized(params.tuningHz.load(std::memory_order_relaxed), kMinTuningHz, kMaxTuningHz));
    setParam(kFilterRoutingId,
        listIndexToNormalized(params.filterRouting.load(std::memory_order_relaxed), kFilterRoutingCount));
    setParam(kMasterFxId, params.masterFx.load(std::memory_order_relaxed) ? 1.0 : 0.0);
}

} // namespace Actuate
