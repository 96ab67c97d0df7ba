#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/primitives/lfo.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

inline constexpr int kLfoRetriggerCount = 2;

inline const Steinberg::Vst::TChar* const kLfoRetriggerStrings[] = {
    STR16("Free"),
    STR16("Note On"),
};

struct LfoParams {
    std::atomic<bool> enabled{false};
    std::atomic<int> waveform{0};             // LfoWaveform
    std::atomic<float> rateHz{1.0f};          // 0.01-20 Hz
    std::atomic<bool> sync{false};
    std::atomic<int> noteSnap{kDefaultLfoNoteSnap};   // NoteValue * 3 + NoteModifier
    std::atomic<int> retrigger{0};            // LfoRetrigger
    std::atomic<float> startPhase{0.0f};      // 0-1 cycle
};

inline void handleLfoParamChange(
    LfoParams& params, Steinberg::Vst::ParamID offset,
    Steinberg::Vst::ParamValue value) {
    switch (offset) {
        case kLfoEnabledOffset:
            params.enabled.store(value >= 0.5, std::memory_order_relaxed); break;
        case kLfoWaveformOffset:
            params.waveform.store(listIndexFromNormalized(value, kLfoWaveformCount),
                std::memory_order_relaxed); break;
        case kLfoRateOffset:
            // 0-1 -> 0.01-20 Hz (logarithmic)
            params.rateHz.store(
                logFreqFromNormalized(value, DSP::kMinLfoFrequency, DSP::kMaxLfoFrequency),
                std::memory_order_relaxed); break;
        case kLfoSyncOffset:
            params.sync.store(value >= 0.5, std::memory_order_relaxed); break;
        case kLfoNoteValueOffset:
            params.noteSnap.store(listIndexFromNormalized(value, kNoteSnapCount),
                std::memory_order_relaxed); break;
        case kLfoRetriggerOffset:
            params.retrigger.store(listIndexFromNormalized(value, kLfoRetriggerCount),
                std::memory_order_relaxed); break;
        case kLfoStartPhaseOffset:
            params.startPhase.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed); break;
        default: break;
    }
}

inline void registerLfoParams(Steinberg::Vst::ParameterContainer& parameters, int lfo) {
    using namespace Steinberg::Vst;
    const auto l = static_cast<ParamID>(lfo);
    const int number = lfo + 1;
    String128 title;

    makeIndexedTitle(title, "LFO", number, "On");
    parameters.addParameter(title, STR16(""), 1, 0.0,
        ParameterInfo::kCanAutomate, lfoParamId(l, kLfoEnabledOffset));
    makeIndexedTitle(title, "LFO", number, "Waveform");
    parameters.addParameter(createDropdownParameter(title, lfoParamId(l, kLfoWaveformOffset),
        kLfoWaveformStrings, kLfoWaveformCount));
    makeIndexedTitle(title, "LFO", number, "Rate");
    parameters.addParameter(title, STR16("Hz"), 0,
        logFreqToNormalized(1.0f, DSP::kMinLfoFrequency, DSP::kMaxLfoFrequency),
        ParameterInfo::kCanAutomate, lfoParamId(l, kLfoRateOffset));
    makeIndexedTitle(title, "LFO", number, "Sync");
    parameters.addParameter(title, STR16(""), 1, 0.0,
        ParameterInfo::kCanAutomate, lfoParamId(l, kLfoSyncOffset));
    makeIndexedTitle(title, "LFO", number, "Note Value");
    parameters.addParameter(createDropdownParameter(title, lfoParamId(l, kLfoNoteValueOffset),
        kNoteSnapStrings, kNoteSnapCount, kDefaultLfoNoteSnap));
    makeIndexedTitle(title, "LFO", number, "Retrigger");
    parameters.addParameter(createDropdownParameter(title, lfoParamId(l, kLfoRetriggerOffset),
        kLfoRetriggerStrings, kLfoRetriggerCount));
    makeIndexedTitle(title, "LFO", number, "Start Phase");
    parameters.addParameter(title, STR16(""), 0, 0.0,
        ParameterInfo::kCanAutomate, lfoParamId(l, kLfoStartPhaseOffset));
}

inline void saveLfoParams(const LfoParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeInt32(params.enabled.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeInt32(params.waveform.load(std::memory_order_relaxed));
    streamer.writeFloat(params.rateHz.load(std::memory_order_relaxed));
    streamer.writeInt32(params.sync.load(std::memory_order_relaxed) ? 1 : 0);
    streamer.writeInt32(params.noteSnap.load(std::memory_order_relaxed));
    streamer.writeInt32(params.retrigger.load(std::memory_order_relaxed));
    streamer.writeFloat(params.startPhase.load(std::memory_order_relaxed));
}

inline bool loadLfoParams(LfoParams& params, StateReader& reader) {
    float fv = 0.0f; int index = 0; bool bv = false;
    if (!reader.readBool(bv)) return false; params.enabled.store(bv, std::memory_order_relaxed);
    if (!reader.readIndex(index, kLfoWaveformCount)) return false;
    params.waveform.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, DSP::kMinLfoFrequency, DSP::kMaxLfoFrequency)) return false;
    params.rateHz.store(fv, std::memory_order_relaxed);
    if (!reader.readBool(bv)) return false; params.sync.store(bv, std::memory_order_relaxed);
    if (!reader.readIndex(index, kNoteSnapCount)) return false;
    params.noteSnap.store(index, std::memory_order_relaxed);
    if (!reader.readIndex(index, kLfoRetriggerCount)) return false;
    params.retrigger.store(index, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false;
    params.startPhase.store(fv, std::memory_order_relaxed);
    return true;
}

template<typename SetParamFunc>
inline void syncLfoParamsToController(const LfoParams& params, int lfo, SetParamFunc setParam) {
    const auto l = static_cast<Steinberg::Vst::ParamID>(lfo);
    setParam(lfoParamId(l, kLfoEnabledOffset), params.enabled.load(std::memory_order_relaxed) ? 1.0 : 0.0);
    setParam(lfoParamId(l, kLfoWaveformOffset),
        listIndexToNormalized(params.waveform.load(std::memory_order_relaxed), kLfoWaveformCount));
    setParam(lfoParamId(l, kLfoRateOffset),
        logFreqToNormalized(params.rateHz.load(std::memory_order_relaxed),
                            DSP::kMinLfoFrequency, DSP::kMaxLfoFrequency));
    setParam(lfoParamId(l, kLfoSyncOffset), params.sync.load(std::memory_order_relaxed) ? 1.0 : 0.0);
    setParam(lfoParamId(l, kLfoNoteValueOffset),
        listIndexToNormalized(params.noteSnap.load(std::memory_order_relaxed), kNoteSnapCount));
    setParam(lfoParamId(l, kLfoRetriggerOffset),
        listIndexToNormalized(params.retrigger.load(std::memory_order_relaxed), kLfoRetriggerCount));
    setParam(lfoParamId(l, kLfoStartPhaseOffset),
        static_cast<double>(params.startPhase.load(std::memory_order_relaxed)));
}

} // namespace Actuate
