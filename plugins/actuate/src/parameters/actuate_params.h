#pragma once

// ==============================================================================
// Actuate Parameter Set
// ==============================================================================
// All parameter packs of the instrument, plus the routing, registration and
// state functions that walk them in a fixed order. The section order below is
// the preset section order; never reorder it.
// ==============================================================================

#include "plugin_ids.h"
#include "engine/synth_patch.h"
#include "parameters/abass_params.h"
#include "parameters/buffer_modulator_params.h"
#include "parameters/chorus_params.h"
#include "parameters/compressor_params.h"
#include "parameters/delay_params.h"
#include "parameters/eq_params.h"
#include "parameters/filter_params.h"
#include "parameters/flanger_params.h"
#include "parameters/fm_params.h"
#include "parameters/fx_enable_params.h"
#include "parameters/global_params.h"
#include "parameters/lfo_params.h"
#include "parameters/limiter_params.h"
#include "parameters/mod_matrix_params.h"
#include "parameters/module_params.h"
#include "parameters/phaser_params.h"
#include "parameters/pitch_env_params.h"
#include "parameters/reverb_params.h"
#include "parameters/saturation_params.h"
#include "parameters/state_reader.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <array>

namespace Actuate {

struct ActuateParams {
    GlobalParams global;
    std::array<ModuleParams, kNumModules> modules;
    std::array<FilterParams, kNumFilters> filters;
    FmParams fm;
    std::array<PitchEnvParams, kNumPitchEnvs> pitchEnvs;
    std::array<LfoParams, DSP::kNumLfos> lfos;
    ModMatrixParams modMatrix;
    FxEnableParams fxEnable;
    ActuateEqParams eq;
    ActuateCompressorParams compressor;
    ActuateABassParams abass;
    ActuateSaturationParams saturation;
    ActuateDelayParams delay;
    ActuateReverbParams reverb;
    ActuatePhaserParams phaser;
    ActuateChorusParams chorus;
    ActuateBufferModulatorParams bufferModulator;
    ActuateFlangerParams flanger;
    ActuateLimiterParams limiter;

    ActuateParams() noexcept {
        for (int m = 0; m < kNumModules; ++m) {
            modules[static_cast<size_t>(m)].type.store(defaultModuleType(m), std::memory_order_relaxed);
        }
    }
};

// =============================================================================
// Routing
// =============================================================================

/// @brief Apply one normalized host value to the pack that owns the ID.
inline void handleParamChange(ActuateParams& params, Steinberg::Vst::ParamID paramId,
                              Steinberg::Vst::ParamValue value) {
    if (paramId < kModuleBaseId) {
        handleGlobalParamChange(params.global, paramId, value);
    } else if (paramId <= kModuleEndId) {
        const auto rel = paramId - kModuleBaseId;
        handleModuleParamChange(params.modules[rel / kModuleParamStride],
                                rel % kModuleParamStride, value);
    } else if (paramId <= kFilterEndId) {
        const auto rel = paramId - kFilterBaseId;
        handleFilterParamChange(params.filters[rel / kFilterParamStride],
                                rel % kFilterParamStride, value);
    } else if (paramId <= kFmEndId) {
        handleFmParamChange(params.fm, paramId, value);
    } else if (paramId <= kPitchEnvEndId) {
        const auto rel = paramId - kPitchEnvBaseId;
        if (rel / kPitchEnvParamStride < static_cast<Steinberg::Vst::ParamID>(kNumPitchEnvs)) {
            handlePitchEnvParamChange(params.pitchEnvs[rel / kPitchEnvParamStride],
                                      rel % kPitchEnvParamStride, value);
        }
    } else if (paramId <= kLfoEndId) {
        const auto rel = paramId - kLfoBaseId;
        if (rel / kLfoParamStride < DSP::kNumLfos) {
            handleLfoParamChange(params.lfos[rel / kLfoParamStride], rel % kLfoParamStride, value);
        }
    } else if (paramId <= kModMatrixEndId) {
        handleModMatrixParamChange(params.modMatrix, paramId, value);
    } else if (paramId <= kFxEnableEndId) {
        handleFxEnableParamChange(params.fxEnable, paramId, value);
    } else if (paramId >= kEqLowFreqId && paramId <= kEqHighGainId) {
        handleEqParamChange(params.eq, paramId, value);
    } else if (paramId >= kCompressorAmountId && paramId <= kCompressorDriveId) {
        handleCompressorParamChange(params.compressor, paramId, value);
    } else if (paramId == kABassAmountId) {
        handleABassParamChange(params.abass, paramId, value);
    } else if (paramId >= kSaturationTypeId && paramId <= kSaturationAmountId) {
        handleSaturationParamChange(params.saturation, paramId, value);
    } else if (paramId >= kDelayTimeId && paramId <= kDelayModeId) {
        handleDelayParamChange(params.delay, paramId, value);
    } else if (paramId >= kReverbModelId && paramId <= kReverbFeedbackId) {
        handleReverbParamChange(params.reverb, paramId, value);
    } else if (paramId >= kPhaserAmountId && paramId <= kPhaserFeedbackId) {
        handlePhaserParamChange(params.phaser, paramId, value);
    } else if (paramId >= kChorusAmountId && paramId <= kChorusSpeedId) {
        handleChorusParamChange(params.chorus, paramId, value);
    } else if (paramId >= kBufferModAmountId && paramId <= kBufferModTimingId) {
        handleBufferModulatorParamChange(params.bufferModulator, paramId, value);
    } else if (paramId >= kFlangerAmountId && paramId <= kFlangerFeedbackId) {
        handleFlangerParamChange(params.flanger, paramId, value);
    } else if (paramId >= kLimiterThresholdId && paramId <= kLimiterKneeId) {
        handleLimiterParamChange(params.limiter, paramId, value);
    }
}

// =============================================================================
// Registration
// =============================================================================

inline void registerAllParams(Steinberg::Vst::ParameterContainer& parameters) {
    registerGlobalParams(parameters);
    for (int m = 0; m < kNumModules; ++m) registerModuleParams(parameters, m);
    for (int f = 0; f < kNumFilters; ++f) registerFilterParams(parameters, f);
    registerFmParams(parameters);
    for (int e = 0; e < kNumPitchEnvs; ++e) registerPitchEnvParams(parameters, e);
    for (int l = 0; l < static_cast<int>(DSP::kNumLfos); ++l) registerLfoParams(parameters, l);
    registerModMatrixParams(parameters);
    registerFxEnableParams(parameters);
    registerEqParams(parameters);
    registerCompressorParams(parameters);
    registerABassParams(parameters);
    registerSaturationParams(parameters);
    registerDelayParams(parameters);
    registerReverbParams(parameters);
    registerPhaserParams(parameters);
    registerChorusParams(parameters);
    registerBufferModulatorParams(parameters);
    registerFlangerParams(parameters);
    registerLimiterParams(parameters);
}

// =============================================================================
// State
// =============================================================================

inline void saveAllParams(const ActuateParams& params, Steinberg::IBStreamer& streamer) {
    saveGlobalParams(params.global, streamer);
    for (const auto& m : params.modules) saveModuleParams(m, streamer);
    for (const auto& f : params.filters) saveFilterParams(f, streamer);
    saveFmParams(params.fm, streamer);
    for (const auto& e : params.pitchEnvs) savePitchEnvParams(e, streamer);
    for (const auto& l : params.lfos) saveLfoParams(l, streamer);
    saveModMatrixParams(params.modMatrix, streamer);
    saveFxEnableParams(params.fxEnable, streamer);
    saveEqParams(params.eq, streamer);
    saveCompressorParams(params.compressor, streamer);
    saveABassParams(params.abass, streamer);
    saveSaturationParams(params.saturation, streamer);
    saveDelayParams(params.delay, streamer);
    saveReverbParams(params.reverb, streamer);
    savePhaserParams(params.phaser, streamer);
    saveChorusParams(params.chorus, streamer);
    saveBufferModulatorParams(params.bufferModulator, streamer);
    saveFlangerParams(params.flanger, streamer);
    saveLimiterParams(params.limiter, streamer);
}

/// @brief Push every plain value in params back to the host surface as a
/// normalized value, in preset section order.
template<typename SetParamFunc>
inline void syncAllParamsToController(const ActuateParams& params, SetParamFunc setParam) {
    syncGlobalParamsToController(params.global, setParam);
    for (int m = 0; m < kNumModules; ++m) {
        syncModuleParamsToController(params.modules[static_cast<size_t>(m)], m, setParam);
    }
    for (int f = 0; f < kNumFilters; ++f) {
        syncFilterParamsToController(params.filters[static_cast<size_t>(f)], f, setParam);
    }
    syncFmParamsToController(params.fm, setParam);
    for (int e = 0; e < kNumPitchEnvs; ++e) {
        syncPitchEnvParamsToController(params.pitchEnvs[static_cast<size_t>(e)], e, setParam);
    }
    for (int l = 0; l < static_cast<int>(DSP::kNumLfos); ++l) {
        syncLfoParamsToController(params.lfos[static_cast<size_t>(l)], l, setParam);
    }
    syncModMatrixParamsToController(params.modMatrix, setParam);
    syncFxEnableParamsToController(params.fxEnable, setParam);
    syncEqParamsToController(params.eq, setParam);
    syncCompressorParamsToController(params.compressor, setParam);
    syncABassParamsToController(params.abass, setParam);
    syncSaturationParamsToController(params.saturation, setParam);
    syncDelayParamsToController(params.delay, setParam);
    syncReverbParamsToController(params.reverb, setParam);
    syncPhaserParamsToController(params.phaser, setParam);
    syncChorusParamsToController(params.chorus, setParam);
    syncBufferModulatorParamsToController(params.bufferModulator, setParam);
    syncFlangerParamsToController(params.flanger, setParam);
    syncLimiterParamsToController(params.limiter, setParam);
}

/// @return false on the first failed section; reader.error() says why.
inline bool loadAllParams(ActuateParams& params, StateReader& reader) {
    if (!loadGlobalParams(params.global, reader)) return false;
    for (auto& m : params.modules) {
        if (!loadModuleParams(m, reader)) return false;
    }
    for (auto& f : params.filters) {
        if (!loadFilterParams(f, reader)) return false;
    }
    if (!loadFmParams(params.fm, reader)) return false;
    for (auto& e : params.pitchEnvs) {
        if (!loadPitchEnvParams(e, reader)) return false;
    }
    for (auto& l : params.lfos) {
        if (!loadLfoParams(l, reader)) return false;
    }
    if (!loadModMatrixParams(params.modMatrix, reader)) return false;
    if (!loadFxEnableParams(params.fxEnable, reader)) return false;
    if (!loadEqParams(params.eq, reader)) return false;
    if (!loadCompressorParams(params.compressor, reader)) return false;
    if (!loadABassParams(params.abass, reader)) return false;
    if (!loadSaturationParams(params.saturation, reader)) return false;
    if (!loadDelayParams(params.delay, reader)) return false;
    if (!loadReverbParams(params.reverb, reader)) return false;
    if (!loadPhaserParams(params.phaser, reader)) return false;
    if (!loadChorusParams(params.chorus, reader)) return false;
    if (!loadBufferModulatorParams(params.bufferModulator, reader)) return false;
    if (!loadFlangerParams(params.flanger, reader)) return false;
    return loadLimiterParams(params.limiter, reader);
}

} // namespace Actuate
