#pragma once

// ==============================================================================
// Actuate Dropdown Mappings
// ==============================================================================
// Enum-to-string tables for every list parameter. Used by parameter
// registration; the order of each table matches its enum.
// ==============================================================================

#include "actuate_types.h"
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/core/note_value.h>
#include <actuate/dsp/core/stereo_utils.h>
#include <actuate/dsp/effects/reverb.h>
#include <actuate/dsp/effects/saturation.h>
#include <actuate/dsp/effects/tempo_delay.h>
#include <actuate/dsp/primitives/adsr_envelope.h>
#include <actuate/dsp/primitives/lfo.h>
#include <actuate/dsp/primitives/oscillator.h>
#include <actuate/dsp/processors/filter_bank.h>
#include <actuate/dsp/processors/modulation_matrix.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"

namespace Actuate {

// =============================================================================
// AudioModuleType dropdown (6 types, stepCount = 5)
// =============================================================================

inline constexpr int kModuleTypeCount = DSP::kAudioModuleTypeCount;

inline const Steinberg::Vst::TChar* const kModuleTypeStrings[] = {
    STR16("Off"),
    STR16("Osc"),
    STR16("Additive"),
    STR16("Sampler"),
    STR16("Granulizer"),
    STR16("Single Cycle"),
};

// =============================================================================
// OscShape dropdown (12 shapes)
// =============================================================================

inline constexpr int kOscShapeCount = static_cast<int>(DSP::kOscShapeCount);

inline const Steinberg::Vst::TChar* const kOscShapeStrings[] = {
    STR16("Sine"),
    STR16("Tri"),
    STR16("Saw"),
    STR16("RSaw"),
    STR16("WSaw"),
    STR16("SSaw"),
    STR16("RASaw"),
    STR16("Ramp"),
    STR16("Square"),
    STR16("RSquare"),
    STR16("Pulse"),
    STR16("Noise"),
};

inline constexpr int kStereoAlgorithmCount = DSP::kStereoAlgorithmCount;

inline const Steinberg::Vst::TChar* const kStereoAlgorithmStrings[] = {
    STR16("Original"),
    STR16("Cube Spread"),
    STR16("Exp Spread"),
};

inline constexpr int kOscRetriggerCount = DSP::kOscRetriggerCount;

inline const Steinberg::Vst::TChar* const kOscRetriggerStrings[] = {
    STR16("Free"),
    STR16("Retrigger"),
    STR16("Random"),
};

inline constexpr int kModuleFilterRoutingCount = DSP::kModuleFilterRoutingCount;

inline const Steinberg::Vst::TChar* const kModuleFilterRoutingStrings[] = {
    STR16("Bypass"),
    STR16("Filter 1"),
    STR16("Filter 2"),
    STR16("Both"),
};

inline constexpr int kEnvCurveCount = DSP::kEnvCurveCount;

inline const Steinberg::Vst::TChar* const kEnvCurveStrings[] = {
    STR16("Linear"),
    STR16("Log"),
    STR16("Exp"),
};

// =============================================================================
// Filters
// =============================================================================

inline constexpr int kFilterTopologyCount = static_cast<int>(DSP::kFilterTopologyCount);

inline const Steinberg::Vst::TChar* const kFilterTopologyStrings[] = {
    STR16("SVF"),
    STR16("Tilt"),
    STR16("VCF"),
    STR16("V4"),
    STR16("A4I"),
};

inline constexpr int kResonanceCurveCount = static_cast<int>(DSP::kResonanceCurveCount);

inline const Steinberg::Vst::TChar* const kResonanceCurveStrings[] = {
    STR16("Default"),
    STR16("Moog"),
    STR16("TB"),
    STR16("Arp"),
    STR16("Res"),
    STR16("Bump"),
    STR16("Powf"),
};

inline constexpr int kFilterRoutingCount = DSP::kFilterRoutingCount;

inline const Steinberg::Vst::TChar* const kFilterRoutingStrings[] = {
    STR16("Parallel"),
    STR16("Series 1>2"),
    STR16("Series 2>1"),
};

inline constexpr int kPitchEnvRoutingCount = DSP::kPitchEnvRoutingCount;

inline const Steinberg::Vst::TChar* const kPitchEnvRoutingStrings[] = {
    STR16("All"),
    STR16("Osc 1"),
    STR16("Osc 2"),
    STR16("Osc 3"),
    STR16("Osc 1+2"),
    STR16("Osc 1+3"),
    STR16("Osc 2+3"),
};

// =============================================================================
// LFO
// =============================================================================

inline constexpr int kLfoWaveformCount = static_cast<int>(DSP::kLfoWaveformCount);

inline const Steinberg::Vst::TChar* const kLfoWaveformStrings[] = {
    STR16("Sine"),
    STR16("Square"),
    STR16("Triangle"),
    STR16("Sawtooth"),
    STR16("Ramp"),
    STR16("Pulse 1/4"),
    STR16("Pulse 1/8"),
};

// Snap index = NoteValue * 3 + NoteModifier
inline constexpr int kNoteSnapCount = static_cast<int>(DSP::kNoteSnapCount);
inline constexpr int kDefaultLfoNoteSnap = 4 * 3;   // 1/4

inline const Steinberg::Vst::TChar* const kNoteSnapStrings[] = {
    STR16("4 Bars"), STR16("4 Bars D"), STR16("4 Bars T"),
    STR16("2 Bars"), STR16("2 Bars D"), STR16("2 Bars T"),
    STR16("1/1"),    STR16("1/1 D"),    STR16("1/1 T"),
    STR16("1/2"),    STR16("1/2 D"),    STR16("1/2 T"),
    STR16("1/4"),    STR16("1/4 D"),    STR16("1/4 T"),
    STR16("1/8"),    STR16("1/8 D"),    STR16("1/8 T"),
    STR16("1/16"),   STR16("1/16 D"),   STR16("1/16 T"),
    STR16("1/32"),   STR16("1/32 D"),   STR16("1/32 T"),
};

// The delay snaps from 1/1 down: skip the two bar-length values
inline constexpr int kDelaySnapOffset = 2 * 3;
inline constexpr int kDelaySnapCount = kNoteSnapCount - kDelaySnapOffset;
inline constexpr int kDefaultDelaySnap = 4 * 3 - kDelaySnapOffset;   // 1/4

// =============================================================================
// Modulation Matrix
// =============================================================================

inline constexpr int kModSourceCount = DSP::kModSourceCount;

inline const Steinberg::Vst::TChar* const kModSourceStrings[] = {
    STR16("None"),
    STR16("Velocity"),
    STR16("Aftertouch"),
    STR16("LFO 1"),
    STR16("LFO 2"),
    STR16("LFO 3"),
    STR16("Filter Env 1"),
    STR16("Filter Env 2"),
};

inline constexpr int kModDestinationCount = DSP::kModDestinationCount;

inline const Steinberg::Vst::TChar* const kModDestinationStrings[] = {
    STR16("None"),
    STR16("Cutoff 1"),
    STR16("Cutoff 2"),
    STR16("Resonance 1"),
    STR16("Resonance 2"),
    STR16("All Gain"),
    STR16("Osc 1 Gain"),
    STR16("Osc 2 Gain"),
    STR16("Osc 3 Gain"),
    STR16("All Detune"),
    STR16("Osc 1 Detune"),
    STR16("Osc 2 Detune"),
    STR16("Osc 3 Detune"),
    STR16("All Uni Detune"),
    STR16("Osc 1 Uni Detune"),
    STR16("Osc 2 Uni Detune"),
    STR16("Osc 3 Uni Detune"),
    STR16("Osc 1 Partials"),
    STR16("Osc 2 Partials"),
    STR16("Osc 3 Partials"),
};

// =============================================================================
// Effects
// =============================================================================

inline constexpr int kFxSlotCount = static_cast<int>(DSP::kFxSlotCount);

inline const Steinberg::Vst::TChar* const kFxSlotStrings[] = {
    STR16("EQ"),
    STR16("Compressor"),
    STR16("A-Bass"),
    STR16("Saturation"),
    STR16("Delay"),
    STR16("Reverb"),
    STR16("Phaser"),
    STR16("Chorus"),
    STR16("Buffer Mod"),
    STR16("Flanger"),
    STR16("Limiter"),
};

inline constexpr const char* kFxSlotNames[] = {
    "EQ", "Compressor", "A-Bass", "Saturation", "Delay", "Reverb",
    "Phaser", "Chorus", "Buffer Mod", "Flanger", "Limiter",
};

inline constexpr int kSaturationTypeCount = static_cast<int>(DSP::kSaturationTypeCount);

inline const Steinberg::Vst::TChar* const kSaturationTypeStrings[] = {
    STR16("Tape"),
    STR16("Clip"),
    STR16("SinPow"),
    STR16("Subtle"),
    STR16("Sine"),
};

inline constexpr int kDelayModeCount = static_cast<int>(DSP::kDelayModeCount);

inline const Steinberg::Vst::TChar* const kDelayModeStrings[] = {
    STR16("Stereo"),
    STR16("Ping Pong L"),
    STR16("Ping Pong R"),
};

inline constexpr int kReverbModelCount = static_cast<int>(DSP::kReverbModelCount);

inline const Steinberg::Vst::TChar* const kReverbModelStrings[] = {
    STR16("Default"),
    STR16("Galactic"),
    STR16("A Space"),
};

} // namespace Actuate
