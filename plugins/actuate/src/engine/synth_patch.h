// ==============================================================================
// Actuate Plugin - Synth Patch Snapshot
// ==============================================================================
// Plain-value snapshot of every sound parameter, assembled on the control
// side by buildPatch() and handed to the audio thread through PatchPublisher.
// Fixed-size members only: copying a patch never allocates.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/note_value.h>
#include <actuate/dsp/core/stereo_utils.h>
#include <actuate/dsp/effects/abass.h>
#include <actuate/dsp/effects/buffer_modulator.h>
#include <actuate/dsp/effects/chorus.h>
#include <actuate/dsp/effects/compressor.h>
#include <actuate/dsp/effects/flanger.h>
#include <actuate/dsp/effects/limiter.h>
#include <actuate/dsp/effects/phaser.h>
#include <actuate/dsp/effects/reverb.h>
#include <actuate/dsp/effects/saturation.h>
#include <actuate/dsp/effects/tempo_delay.h>
#include <actuate/dsp/effects/three_band_eq.h>
#include <actuate/dsp/primitives/adsr_envelope.h>
#include <actuate/dsp/primitives/lfo.h>
#include <actuate/dsp/primitives/oscillator.h>
#include <actuate/dsp/processors/additive_oscillator.h>
#include <actuate/dsp/processors/filter_bank.h>
#include <actuate/dsp/processors/fm_operator.h>
#include <actuate/dsp/processors/granulizer.h>
#include <actuate/dsp/processors/modulation_matrix.h>
#include <actuate/dsp/systems/voice_allocator.h>
#include "actuate_types.h"

#include <array>
#include <cstddef>
#include <type_traits>

namespace Actuate::DSP {

inline constexpr size_t kNumPitchEnvelopes = 2;
inline constexpr size_t kNumLfos = 3;
inline constexpr float kMaxPitchEnvSemitones = 48.0f;

/// @brief One audio module: source, tuning, amp envelope and sample region.
struct ModulePatch {
    AudioModuleType type = AudioModuleType::Off;
    OscShape shape = OscShape::Sine;
    float gain = 1.0f;                  ///< [0, 1]
    float pan = 0.0f;                   ///< [-1, +1]
    int octave = 0;                     ///< [-2, +2]
    int semitones = 0;                  ///< [-12, +12]
    float detune = 0.0f;                ///< Semitones [-1, +1]
    float uniDetune = 0.0f;             ///< Unison spread in semitones [0, 1]
    float stereo = 0.0f;                ///< Unison stereo width [0, 1]
    StereoAlgorithm stereoAlgorithm = StereoAlgorithm::Original;
    OscRetrigger retrigger = OscRetrigger::Retrigger;
    ModuleFilterRouting filterRouting = ModuleFilterRouting::Filter1;
    EnvelopeShape ampEnvelope{};
    float startPosition = 0.0f;         ///< Normalized sample region start
    float endPosition = 1.0f;           ///< Normalized sample region end
    bool loop = false;
    bool restretch = true;
    GrainSettings grains{};
    PartialTable partials = makeFundamentalTable();
    float partialLevel = 1.0f;
};

/// @brief Pitch envelope: peak bend in semitones and the modules it reaches.
struct PitchEnvPatch {
    float peakSemitones = 0.0f;         ///< [-48, +48]
    EnvelopeShape envelope{};
    PitchEnvRouting routing = PitchEnvRouting::All;
};

struct LfoPatch {
    bool enabled = false;
    LfoWaveform waveform = LfoWaveform::Sine;
    float rateHz = 1.0f;
    bool sync = false;
    NoteValue noteValue = NoteValue::Quarter;
    NoteModifier modifier = NoteModifier::None;
    LfoRetrigger retrigger = LfoRetrigger::None;
    float startPhase = 0.0f;
};

struct EffectsPatch {
    bool masterEnabled = true;
    std::array<bool, kFxSlotCount> enabled{};
    FxOrder order = defaultFxOrder();
    ThreeBandEqParams eq{};
    CompressorParams compressor{};
    ABassParams abass{};
    SaturationParams saturation{};
    TempoDelayParams delay{};
    ReverbParams reverb{};
    PhaserParams phaser{};
    ChorusParams chorus{};
    BufferModulatorParams bufferModulator{};
    FlangerParams flanger{};
    LimiterParams limiter{};
};

/// @brief Complete immutable sound description for one block.
struct SynthPatch {
    float masterGain = 1.0f;            ///< [0, 2]
    float masterWidth = 1.0f;           ///< Mid/side width [0, 2]
    size_t voiceCount = VoiceAllocator::kDefaultVoiceCount;
    size_t unisonCount = 1;
    float pitchBendRange = VoiceAllocator::kDefaultPitchBendRange;
    float tuningReference = kDefaultTuningReference;

    std::array<ModulePatch, kNumAudioModules> modules{};
    std::array<FilterSettings, kNumVoiceFilters> filters{};
    FilterRouting filterRouting = FilterRouting::Parallel;
    FmSettings fm{};
    std::array<PitchEnvPatch, kNumPitchEnvelopes> pitchEnvelopes{};
    std::array<LfoPatch, kNumLfos> lfos{};
    ModRouteTable modRoutes{};
    EffectsPatch effects{};
};

static_assert(std::is_trivially_copyable_v<SynthPatch>,
              "SynthPatch is copied on the audio thread and must not own memory");

} // namespace Actuate::DSP
