#pragma once

// ==============================================================================
// Parameter Identifiers
// ==============================================================================
// Every parameter the instrument exposes. Values travel normalized (0.0 to
// 1.0) through setParamNormalized() and are mapped to plain ranges by the
// handle*ParamChange() functions under parameters/.
//
// IMPORTANT: Presets store plain values section by section, not IDs, but the
// IDs are still what hosts automate. Once published, never renumber them.
// ==============================================================================

#include "pluginterfaces/vst/vsttypes.h"

namespace Actuate {

// ==============================================================================
// ID Range Allocation (100-ID gaps for future expansion):
//   0-99:      Global (Master Gain, Width, Polyphony, Unison, Tuning, ...)
//   100-199:   Audio Module 1 (Type, Shape, Tune, Amp Envelope, Sample, Grains, Partials)
//   200-299:   Audio Module 2
//   300-399:   Audio Module 3
//   400-499:   Filter 1 (Topology, Cutoff, Resonance, Mix, Envelope)
//   500-599:   Filter 2
//   600-699:   FM (Routes, Ratio, Envelope)
//   700-799:   Pitch Envelopes 1 and 2
//   800-899:   LFO 1-3
//   900-999:   Modulation Matrix (4 slots)
//   1000-1099: FX Enable and Order
//   1100-1299: FX Units
// ==============================================================================

enum ParameterIDs : Steinberg::Vst::ParamID {
    // ==========================================================================
    // Global Parameters (0-99)
    // ==========================================================================
    kMasterGainId = 0,
    kMasterWidthId = 1,
    kVoiceCountId = 2,          // 1-32
    kUnisonCountId = 3,         // 1-9
    kPitchBendRangeId = 4,      // 0-24 semitones
    kTuningId = 5,              // A4 400-480 Hz
    kFilterRoutingId = 6,       // Parallel, Series12, Series21
    kMasterFxId = 7,            // Whole effect chain on/off

    // ==========================================================================
    // Audio Modules (100-399)
    // ==========================================================================
    // Each module occupies 100 IDs starting at kModuleBaseId + index * 100.
    // Offsets within the block are ModuleParamOffset values.
    kModuleBaseId = 100,
    kModuleEndId = 399,

    // ==========================================================================
    // Filters (400-599)
    // ==========================================================================
    // Each filter occupies 100 IDs starting at kFilterBaseId + index * 100.
    kFilterBaseId = 400,
    kFilterEndId = 599,

    // ==========================================================================
    // FM (600-699)
    // ==========================================================================
    kFmBaseId = 600,
    kFmOneToTwoId = 600,
    kFmOneToThreeId = 601,
    kFmTwoToThreeId = 602,
    kFmRatioId = 603,           // 1-8
    kFmEnvAttackId = 604,
    kFmEnvDecayId = 605,
    kFmEnvSustainId = 606,
    kFmEnvReleaseId = 607,
    kFmEnvAttackCurveId = 608,
    kFmEnvDecayCurveId = 609,
    kFmEnvReleaseCurveId = 610,
    kFmEndId = 699,

    // ==========================================================================
    // Pitch Envelopes (700-799)
    // ==========================================================================
    // Each envelope occupies 50 IDs starting at kPitchEnvBaseId + index * 50.
    kPitchEnvBaseId = 700,
    kPitchEnvEndId = 799,

    // ==========================================================================
    // LFOs (800-899)
    // ==========================================================================
    // Each LFO occupies 30 IDs starting at kLfoBaseId + index * 30.
    kLfoBaseId = 800,
    kLfoEndId = 899,

    // ==========================================================================
    // Modulation Matrix (900-999)
    // ==========================================================================
    // Slot i: source 900+i*4, destination 901+i*4, depth 902+i*4, polarity 903+i*4
    kModMatrixBaseId = 900,
    kModMatrixEndId = 999,

    // ==========================================================================
    // FX Enable and Order (1000-1099)
    // ==========================================================================
    // Enable flags at kFxEnableBaseId + FxSlot, order positions at
    // kFxOrderBaseId + position (value is the FxSlot index).
    kFxEnableBaseId = 1000,
    kFxOrderBaseId = 1020,
    kFxEnableEndId = 1099,

    // ==========================================================================
    // FX Units (1100-1299)
    // ==========================================================================
    kEqLowFreqId = 1100,
    kEqMidFreqId = 1101,
    kEqHighFreqId = 1102,
    kEqLowGainId = 1103,
    kEqMidGainId = 1104,
    kEqHighGainId = 1105,

    kCompressorAmountId = 1110,
    kCompressorAttackId = 1111,
    kCompressorReleaseId = 1112,
    kCompressorDriveId = 1113,

    kABassAmountId = 1120,

    kSaturationTypeId = 1130,
    kSaturationAmountId = 1131,

    kDelayTimeId = 1140,        // Note value snap, Whole..ThirtySecond x modifiers
    kDelayDecayId = 1141,
    kDelayAmountId = 1142,
    kDelayModeId = 1143,

    kReverbModelId = 1150,
    kReverbAmountId = 1151,
    kReverbSizeId = 1152,
    kReverbFeedbackId = 1153,

    kPhaserAmountId = 1160,
    kPhaserDepthId = 1161,
    kPhaserRateId = 1162,
    kPhaserFeedbackId = 1163,

    kChorusAmountId = 1170,
    kChorusRangeId = 1171,
    kChorusSpeedId = 1172,

    kBufferModAmountId = 1180,
    kBufferModDepthId = 1181,
    kBufferModRateId = 1182,
    kBufferModSpreadId = 1183,
    kBufferModTimingId = 1184,

    kFlangerAmountId = 1190,
    kFlangerDepthId = 1191,
    kFlangerRateId = 1192,
    kFlangerFeedbackId = 1193,

    kLimiterThresholdId = 1200,
    kLimiterKneeId = 1201,

    kFxUnitsEndId = 1299,

    // ==========================================================================
    kNumParameters = 1300,
};

// ==============================================================================
// Audio Module Parameter Offsets
// ==============================================================================

enum ModuleParamOffset : Steinberg::Vst::ParamID {
    kModuleTypeOffset = 0,
    kModuleShapeOffset = 1,
    kModuleGainOffset = 2,
    kModulePanOffset = 3,
    kModuleOctaveOffset = 4,          // -2..+2
    kModuleSemitonesOffset = 5,       // -12..+12
    kModuleDetuneOffset = 6,          // -1..+1 semitone
    kModuleUniDetuneOffset = 7,       // 0..1 semitone spread
    kModuleStereoOffset = 8,
    kModuleStereoAlgorithmOffset = 9,
    kModuleRetriggerOffset = 10,
    kModuleFilterRoutingOffset = 11,
    kModuleAmpAttackOffset = 12,
    kModuleAmpDecayOffset = 13,
    kModuleAmpSustainOffset = 14,
    kModuleAmpReleaseOffset = 15,
    kModuleAmpAttackCurveOffset = 16,
    kModuleAmpDecayCurveOffset = 17,
    kModuleAmpReleaseCurveOffset = 18,
    kModuleStartOffset = 19,
    kModuleEndOffset = 20,
    kModuleLoopOffset = 21,
    kModuleRestretchOffset = 22,
    kModuleGrainHoldOffset = 23,
    kModuleGrainGapOffset = 24,
    kModuleGrainCrossfadeOffset = 25,
    kModulePartialLevelOffset = 26,
    kModulePartialAmpOffset = 30,     // 16 amplitudes, 30-45
    kModulePartialPhaseOffset = 50,   // 16 phases, 50-65
    kModuleParamStride = 100,
};

// ==============================================================================
// Filter Parameter Offsets
// ==============================================================================

enum FilterParamOffset : Steinberg::Vst::ParamID {
    kFilterTopologyOffset = 0,
    kFilterResonanceCurveOffset = 1,
    kFilterCutoffOffset = 2,
    kFilterResonanceOffset = 3,
    kFilterLowMixOffset = 4,
    kFilterBandMixOffset = 5,
    kFilterHighMixOffset = 6,
    kFilterWetOffset = 7,
    kFilterEnvPeakOffset = 8,
    kFilterEnvAttackOffset = 9,
    kFilterEnvDecayOffset = 10,
    kFilterEnvSustainOffset = 11,
    kFilterEnvReleaseOffset = 12,
    kFilterEnvAttackCurveOffset = 13,
    kFilterEnvDecayCurveOffset = 14,
    kFilterEnvReleaseCurveOffset = 15,
    kFilterParamStride = 100,
};

// ==============================================================================
// Pitch Envelope Parameter Offsets
// ==============================================================================

enum PitchEnvParamOffset : Steinberg::Vst::ParamID {
    kPitchEnvPeakOffset = 0,          // -48..+48 semitones
    kPitchEnvAttackOffset = 1,
    kPitchEnvDecayOffset = 2,
    kPitchEnvSustainOffset = 3,
    kPitchEnvReleaseOffset = 4,
    kPitchEnvAttackCurveOffset = 5,
    kPitchEnvDecayCurveOffset = 6,
    kPitchEnvReleaseCurveOffset = 7,
    kPitchEnvRoutingOffset = 8,
    kPitchEnvParamStride = 50,
};

// ==============================================================================
// LFO Parameter Offsets
// ==============================================================================

enum LfoParamOffset : Steinberg::Vst::ParamID {
    kLfoEnabledOffset = 0,
    kLfoWaveformOffset = 1,
    kLfoRateOffset = 2,               // 0.01-20 Hz
    kLfoSyncOffset = 3,
    kLfoNoteValueOffset = 4,          // Snap index, value * 3 + modifier
    kLfoRetriggerOffset = 5,
    kLfoStartPhaseOffset = 6,
    kLfoParamStride = 30,
};

// ==============================================================================
// Modulation Matrix Parameter Offsets
// ==============================================================================

enum ModSlotParamOffset : Steinberg::Vst::ParamID {
    kModSlotSourceOffset = 0,
    kModSlotDestinationOffset = 1,
    kModSlotDepthOffset = 2,
    kModSlotPolarityOffset = 3,
    kModSlotParamStride = 4,
};

[[nodiscard]] constexpr Steinberg::Vst::ParamID moduleParamId(
    Steinberg::Vst::ParamID module, Steinberg::Vst::ParamID offset) noexcept {
    return kModuleBaseId + module * kModuleParamStride + offset;
}

[[nodiscard]] constexpr Steinberg::Vst::ParamID filterParamId(
    Steinberg::Vst::ParamID filter, Steinberg::Vst::ParamID offset) noexcept {
    return kFilterBaseId + filter * kFilterParamStride + offset;
}

[[nodiscard]] constexpr Steinberg::Vst::ParamID pitchEnvParamId(
    Steinberg::Vst::ParamID env, Steinberg::Vst::ParamID offset) noexcept {
    return kPitchEnvBaseId + env * kPitchEnvParamStride + offset;
}

[[nodiscard]] constexpr Steinberg::Vst::ParamID lfoParamId(
    Steinberg::Vst::ParamID lfo, Steinberg::Vst::ParamID offset) noexcept {
    return kLfoBaseId + lfo * kLfoParamStride + offset;
}

[[nodiscard]] constexpr Steinberg::Vst::ParamID modSlotParamId(
    Steinberg::Vst::ParamID slot, Steinberg::Vst::ParamID offset) noexcept {
    return kModMatrixBaseId + slot * kModSlotParamStride + offset;
}

} // namespace Actuate
