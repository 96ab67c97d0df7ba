#pragma once

// ==============================================================================
// FX Enable and Order Parameters
// ==============================================================================
// One on/off switch per effect unit and one slot selector per chain position.
// Choosing a unit for a position swaps it with the position that held it, so
// the order is always a permutation of the eleven units.
// ==============================================================================

#include "plugin_ids.h"
#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include "actuate_types.h"
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <array>
#include <atomic>
#include <cstdio>

namespace Actuate {

struct FxEnableParams {
    std::array<std::atomic<bool>, DSP::kFxSlotCount> enabled{};
    std::array<std::atomic<int>, DSP::kFxSlotCount> order{};   // FxSlot per position

    FxEnableParams() noexcept {
        for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
            enabled[i].store(false, std::memory_order_relaxed);
            order[i].store(static_cast<int>(i), std::memory_order_relaxed);
        }
    }
};

/// @brief Put slot at position, moving whatever was there to the slot's old position.
inline void setFxOrderPosition(FxEnableParams& params, size_t position, int slot) {
    if (position >= DSP::kFxSlotCount || slot < 0 || slot >= kFxSlotCount) return;
    const int displaced = params.order[position].load(std::memory_order_relaxed);
    if (displaced == slot) return;
    for (auto& entry : params.order) {
        if (entry.load(std::memory_order_relaxed) == slot) {
            entry.store(displaced, std::memory_order_relaxed);
            break;
        }
    }
    params.order[position].store(slot, std::memory_order_relaxed);
}

inline void handleFxEnableParamChange(
    FxEnableParams& params, Steinberg::Vst::ParamID id,
    Steinberg::Vst::ParamValue value) {
    if (id >= kFxEnableBaseId && id < kFxEnableBaseId + DSP::kFxSlotCount) {
        params.enabled[id - kFxEnableBaseId].store(value >= 0.5, std::memory_order_relaxed);
        return;
    }
    if (id >= kFxOrderBaseId && id < kFxOrderBaseId + DSP::kFxSlotCount) {
        setFxOrderPosition(params, id - kFxOrderBaseId,
                           listIndexFromNormalized(value, kFxSlotCount));
    }
}

inline void registerFxEnableParams(Steinberg::Vst::ParameterContainer& parameters) {
    using namespace Steinberg::Vst;
    String128 title;
    char text[128];

    for (int i = 0; i < kFxSlotCount; ++i) {
        snprintf(text, sizeof(text), "%s Enabled", kFxSlotNames[i]);
        Steinberg::UString(title, 128).fromAscii(text);
        parameters.addParameter(title, STR16(""), 1, 0.0,
            ParameterInfo::kCanAutomate, kFxEnableBaseId + static_cast<ParamID>(i));
    }
    for (int i = 0; i < kFxSlotCount; ++i) {
        makeIndexedTitle(title, "FX", i + 1, "Slot");
        parameters.addParameter(createDropdownParameter(title,
            kFxOrderBaseId + static_cast<ParamID>(i), kFxSlotStrings, kFxSlotCount, i));
    }
}

inline void saveFxEnableParams(const FxEnableParams& params, Steinberg::IBStreamer& streamer) {
    for (const auto& e : params.enabled) {
        streamer.writeInt32(e.load(std::memory_order_relaxed) ? 1 : 0);
    }
    for (const auto& o : params.order) {
        streamer.writeInt32(o.load(std::memory_order_relaxed));
    }
}

inline bool loadFxEnableParams(FxEnableParams& params, StateReader& reader) {
    for (auto& e : params.enabled) {
        bool bv = false;
        if (!reader.readBool(bv)) return false;
        e.store(bv, std::memory_order_relaxed);
    }
    DSP::FxOrder order{};
    for (auto& slot : order) {
        int index = 0;
        if (!reader.readIndex(index, kFxSlotCount)) return false;
        slot = static_cast<DSP::FxSlot>(index);
    }
    if (!DSP::isPermutation(order)) {
        return reader.fail(DSP::ActuateError::ConfigError);
    }
    for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
        params.order[i].store(static_cast<int>(order[i]), std::memory_order_relaxed);
    }
    return true;
}

template<typename SetParamFunc>
inline void syncFxEnableParamsToController(const FxEnableParams& params, SetParamFunc setParam) {
    for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
        const auto slot = static_cast<Steinberg::Vst::ParamID>(i);
        setParam(kFxEnableBaseId + slot, params.enabled[i].load(std::memory_order_relaxed) ? 1.0 : 0.0);
        setParam(kFxOrderBaseId + slot,
            listIndexToNormalized(params.order[i].load(std::memory_order_relaxed), kFxSlotCount));
    }
}

} // namespace Actuate
