#pragma once

// ==============================================================================
// Patch Assembly
// ==============================================================================
// Reads every parameter pack once and produces the plain SynthPatch snapshot
// the engine consumes. Runs on the control side; the result is published to
// the audio thread through PatchPublisher.
// ==============================================================================

#include "parameters/actuate_params.h"
#include "engine/synth_patch.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

namespace detail {

inline float load(const std::atomic<float>& a) { return a.load(std::memory_order_relaxed); }
inline int load(const std::atomic<int>& a) { return a.load(std::memory_order_relaxed); }
inline bool load(const std::atomic<bool>& a) { return a.load(std::memory_order_relaxed); }

template <typename E>
E as(const std::atomic<int>& a) { return static_cast<E>(a.load(std::memory_order_relaxed)); }

} // namespace detail

[[nodiscard]] inline DSP::ModulePatch buildModulePatch(const ModuleParams& p) {
    using detail::load;
    using detail::as;
    DSP::ModulePatch m;
    m.type = as<DSP::AudioModuleType>(p.type);
    m.shape = as<DSP::OscShape>(p.shape);
    m.gain = load(p.gain);
    m.pan = load(p.pan);
    m.octave = load(p.octave);
    m.semitones = load(p.semitones);
    m.detune = load(p.detune);
    m.uniDetune = load(p.uniDetune);
    m.stereo = load(p.stereo);
    m.stereoAlgorithm = as<DSP::StereoAlgorithm>(p.stereoAlgorithm);
    m.retrigger = as<DSP::OscRetrigger>(p.retrigger);
    m.filterRouting = as<DSP::ModuleFilterRouting>(p.filterRouting);
    m.ampEnvelope = toEnvelopeShape(p.ampEnv);
    // Swapped bounds are reordered so that start <= end
    m.startPosition = std::min(load(p.startPosition), load(p.endPosition));
    m.endPosition = std::max(load(p.startPosition), load(p.endPosition));
    m.loop = load(p.loop);
    m.restretch = load(p.restretch);
    m.grains.hold = static_cast<uint32_t>(load(p.grainHold));
    m.grains.gap = static_cast<uint32_t>(load(p.grainGap));
    m.grains.crossfade = static_cast<uint32_t>(load(p.grainCrossfade));
    for (size_t k = 0; k < DSP::kNumPartials; ++k) {
        m.partials[k].amplitude = load(p.partialAmp[k]);
        m.partials[k].phase = load(p.partialPhase[k]);
    }
    m.partialLevel = load(p.partialLevel);
    return m;
}

[[nodiscard]] inline DSP::FilterSettings buildFilterSettings(const FilterParams& p) {
    using detail::load;
    using detail::as;
    DSP::FilterSettings f;
    f.topology = as<DSP::FilterTopology>(p.topology);
    f.resonanceCurve = as<DSP::ResonanceCurve>(p.resonanceCurve);
    f.cutoffHz = load(p.cutoffHz);
    f.resonance = load(p.resonance);
    f.lowMix = load(p.lowMix);
    f.bandMix = load(p.bandMix);
    f.highMix = load(p.highMix);
    f.wet = load(p.wet);
    f.envPeakHz = load(p.envPeakHz);
    f.envelope = toEnvelopeShape(p.envelope);
    return f;
}

[[nodiscard]] inline DSP::LfoPatch buildLfoPatch(const LfoParams& p) {
    using detail::load;
    using detail::as;
    DSP::LfoPatch l;
    l.enabled = load(p.enabled);
    l.waveform = as<DSP::LfoWaveform>(p.waveform);
    l.rateHz = load(p.rateHz);
    l.sync = load(p.sync);
    const auto note = DSP::getNoteValueFromSnapIndex(load(p.noteSnap));
    l.noteValue = note.note;
    l.modifier = note.modifier;
    l.retrigger = as<DSP::LfoRetrigger>(p.retrigger);
    l.startPhase = load(p.startPhase);
    return l;
}

[[nodiscard]] inline DSP::EffectsPatch buildEffectsPatch(const ActuateParams& p) {
    using detail::load;
    using detail::as;
    DSP::EffectsPatch fx;
    fx.masterEnabled = load(p.global.masterFx);
    for (size_t i = 0; i < DSP::kFxSlotCount; ++i) {
        fx.enabled[i] = load(p.fxEnable.enabled[i]);
        fx.order[i] = as<DSP::FxSlot>(p.fxEnable.order[i]);
    }

    fx.eq.lowFreqHz = load(p.eq.lowFreqHz);
    fx.eq.midFreqHz = load(p.eq.midFreqHz);
    fx.eq.highFreqHz = load(p.eq.highFreqHz);
    fx.eq.lowGainDb = load(p.eq.lowGainDb);
    fx.eq.midGainDb = load(p.eq.midGainDb);
    fx.eq.highGainDb = load(p.eq.highGainDb);

    fx.compressor.amount = load(p.compressor.amount);
    fx.compressor.attack = load(p.compressor.attack);
    fx.compressor.release = load(p.compressor.release);
    fx.compressor.drive = load(p.compressor.drive);

    fx.abass.amount = load(p.abass.amount);

    fx.saturation.type = as<DSP::SaturationType>(p.saturation.type);
    fx.saturation.amount = load(p.saturation.amount);

    const auto delayNote = delayNoteFromSnap(load(p.delay.timeSnap));
    fx.delay.time = delayNote.note;
    fx.delay.modifier = delayNote.modifier;
    fx.delay.decay = load(p.delay.decay);
    fx.delay.amount = load(p.delay.amount);
    fx.delay.mode = as<DSP::DelayMode>(p.delay.mode);

    fx.reverb.model = as<DSP::ReverbModel>(p.reverb.model);
    fx.reverb.amount = load(p.reverb.amount);
    fx.reverb.size = load(p.reverb.size);
    fx.reverb.feedback = load(p.reverb.feedback);

    fx.phaser.amount = load(p.phaser.amount);
    fx.phaser.depth = load(p.phaser.depth);
    fx.phaser.rateHz = load(p.phaser.rateHz);
    fx.phaser.feedback = load(p.phaser.feedback);

    fx.chorus.amount = load(p.chorus.amount);
    fx.chorus.range = load(p.chorus.range);
    fx.chorus.speed = load(p.chorus.speed);

    fx.bufferModulator.amount = load(p.bufferModulator.amount);
    fx.bufferModulator.depth = load(p.bufferModulator.depth);
    fx.bufferModulator.rateHz = load(p.bufferModulator.rateHz);
    fx.bufferModulator.spread = load(p.bufferModulator.spread);
    fx.bufferModulator.timing = load(p.bufferModulator.timing);

    fx.flanger.amount = load(p.flanger.amount);
    fx.flanger.depth = load(p.flanger.depth);
    fx.flanger.rateHz = load(p.flanger.rateHz);
    fx.flanger.feedback = load(p.flanger.feedback);

    fx.limiter.threshold = load(p.limiter.threshold);
    fx.limiter.knee = load(p.limiter.knee);
    return fx;
}

/// @brief Snapshot every parameter pack into one immutable patch.
[[nodiscard]] inline DSP::SynthPatch buildPatch(const ActuateParams& p) {
    using detail::load;
    using detail::as;
    DSP::SynthPatch patch;
    patch.masterGain = load(p.global.masterGain);
    patch.masterWidth = load(p.global.masterWidth);
    patch.voiceCount = static_cast<size_t>(load(p.global.voiceCount));
    patch.unisonCount = static_cast<size_t>(load(p.global.unisonCount));
    patch.pitchBendRange = static_cast<float>(load(p.global.pitchBendRange));
    patch.tuningReference = load(p.global.tuningHz);
    patch.filterRouting = as<DSP::FilterRouting>(p.global.filterRouting);

    for (size_t m = 0; m < DSP::kNumAudioModules; ++m) {
        patch.modules[m] = buildModulePatch(p.modules[m]);
    }
    for (size_t f = 0; f < DSP::kNumVoiceFilters; ++f) {
        patch.filters[f] = buildFilterSettings(p.filters[f]);
    }

    patch.fm.oneToTwo = load(p.fm.oneToTwo);
    patch.fm.oneToThree = load(p.fm.oneToThree);
    patch.fm.twoToThree = load(p.fm.twoToThree);
    patch.fm.ratio = load(p.fm.ratio);
    patch.fm.envelope = toEnvelopeShape(p.fm.envelope);

    for (size_t e = 0; e < DSP::kNumPitchEnvelopes; ++e) {
        patch.pitchEnvelopes[e].peakSemitones = load(p.pitchEnvs[e].peakSemitones);
        patch.pitchEnvelopes[e].envelope = toEnvelopeShape(p.pitchEnvs[e].envelope);
        patch.pitchEnvelopes[e].routing = as<DSP::PitchEnvRouting>(p.pitchEnvs[e].routing);
    }
    for (size_t l = 0; l < DSP::kNumLfos; ++l) {
        patch.lfos[l] = buildLfoPatch(p.lfos[l]);
    }
    for (size_t s = 0; s < DSP::kModSlotCount; ++s) {
        const auto& slot = p.modMatrix.slots[s];
        patch.modRoutes[s].source = as<DSP::ModSource>(slot.source);
        patch.modRoutes[s].destination = as<DSP::ModDestination>(slot.dest);
        patch.modRoutes[s].depth = load(slot.depth);
        patch.modRoutes[s].polarity = as<DSP::ModPolarity>(slot.polarity);
    }
    patch.effects = buildEffectsPatch(p);
    return patch;
}

} // namespace Actuate
