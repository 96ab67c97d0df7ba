#pragma once
#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/processors/modulation_matrix.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>

namespace Actuate {

inline constexpr int kModPolarityCount = 2;

inline const Steinberg::Vst::TChar* const kModPolarityStrings[] = {
    STR16("Normal"),
    STR16("Inverted"),
};

struct ModMatrixSlot {
    std::atomic<int> source{0};       // ModSource
    std::atomic<int> dest{0};         // ModDestination
    std::atomic<float> depth{0.0f};   // -1 to +1
    std::atomic<int> polarity{0};     // ModPolarity
};

struct ModMatrixParams {
    std::array<ModMatrixSlot, DSP::kModSlotCount> slots;
};

inline void handleModMatrixParamChange(
    ModMatrixParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    // Determine slot index and sub-parameter
    if (id < kModMatrixBaseId) return;
    const auto offset = static_cast<size_t>(id - kModMatrixBaseId);
    const size_t slotIdx = offset / kModSlotParamStride;
    const size_t subParam = offset % kModSlotParamStride;
    if (slotIdx >= DSP::kModSlotCount) return;

    auto& slot = params.slots[slotIdx];
    switch (subParam) {
        case kModSlotSourceOffset:
            slot.source.store(listIndexFromNormalized(value, kModSourceCount),
                std::memory_order_relaxed);
            break;
        case kModSlotDestinationOffset:
            slot.dest.store(listIndexFromNormalized(value, kModDestinationCount),
                std::memory_order_relaxed);
            break;
        case kModSlotDepthOffset: // -1 to +1
            slot.depth.store(
                std::clamp(static_cast<float>(value * 2.0 - 1.0), -1.0f, 1.0f),
                std::memory_order_relaxed);
            break;
        case kModSlotPolarityOffset:
            slot.polarity.store(listIndexFromNormalized(value, kModPolarityCount),
                std::memory_order_relaxed);
            break;
        default: break;
    }
}

inline void registerModMatrixParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    for (int i = 0; i < static_cast<int>(DSP::kModSlotCount); ++i) {
        const auto slot = static_cast<ParamID>(i);
        String128 title;

        makeIndexedTitle(title, "Mod", i + 1, "Source");
        parameters.addParameter(createDropdownParameter(title,
            modSlotParamId(slot, kModSlotSourceOffset), kModSourceStrings, kModSourceCount));
        makeIndexedTitle(title, "Mod", i + 1, "Dest");
        parameters.addParameter(createDropdownParameter(title,
            modSlotParamId(slot, kModSlotDestinationOffset), kModDestinationStrings,
            kModDestinationCount));
        makeIndexedTitle(title, "Mod", i + 1, "Depth");
        parameters.addParameter(title, STR16("%"), 0, 0.5,
            ParameterInfo::kCanAutomate, modSlotParamId(slot, kModSlotDepthOffset));
        makeIndexedTitle(title, "Mod", i + 1, "Polarity");
        parameters.addParameter(createDropdownParameter(title,
            modSlotParamId(slot, kModSlotPolarityOffset), kModPolarityStrings, kModPolarityCount));
    }
}

inline void saveModMatrixParams(const ModMatrixParams& params, Steinberg::IBStreamer& streamer) {
    for (const auto& slot : params.slots) {
        streamer.writeInt32(slot.source.load(std::memory_order_relaxed));
        streamer.writeInt32(slot.dest.load(std::memory_order_relaxed));
        streamer.writeFloat(slot.depth.load(std::memory_order_relaxed));
        streamer.writeInt32(slot.polarity.load(std::memory_order_relaxed));
    }
}

inline bool loadModMatrixParams(ModMatrixParams& params, StateReader& reader) {
    for (auto& slot : params.slots) {
        float fv = 0.0f; int index = 0;
        if (!reader.readIndex(index, kModSourceCount)) return false;
        slot.source.store(index, std::memory_order_relaxed);
        if (!reader.readIndex(index, kModDestinationCount)) return false;
        slot.dest.store(index, std::memory_order_relaxed);
        if (!reader.readFloat(fv, -1.0f, 1.0f)) return false;
        slot.depth.store(fv, std::memory_order_relaxed);
        if (!reader.readIndex(index, kModPolarityCount)) return false;
        slot.polarity.store(index, std::memory_order_relaxed);
    }
    return true;
}

template<typename SetParamFunc>
inline void syncModMatrixParamsToController(const ModMatrixParams& params, SetParamFunc setParam) {
    for (size_t i = 0; i < DSP::kModSlotCount; ++i) {
        const auto& slot = params.slots[i];
        const auto s = static_cast<Steinberg::Vst::ParamID>(i);
        setParam(modSlotParamId(s, kModSlotSourceOffset),
            listIndexToNormalized(slot.source.load(std::memory_order_relaxed), kModSourceCount));
        setParam(modSlotParamId(s, kModSlotDestinationOffset),
            listIndexToNormalized(slot.dest.load(std::memory_order_relaxed), kModDestinationCount));
        setParam(modSlotParamId(s, kModSlotDepthOffset),
            (static_cast<double>(slot.depth.load(std::memory_order_relaxed)) + 1.0) * 0.5);
        setParam(modSlotParamId(s, kModSlotPolarityOffset),
            listIndexToNormalized(slot.polarity.load(std::memory_order_relaxed), kModPolarityCount));
    }
}

} // namespace Actuate
