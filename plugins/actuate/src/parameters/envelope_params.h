#pragma once

// ==============================================================================
// Envelope Parameters
// ==============================================================================
// One ADSR with three curve selectors. Shared by the module amp envelopes, the
// filter envelopes, the FM envelope and the pitch envelopes; each owner passes
// the ID of its attack parameter and the seven IDs that follow are
// attack, decay, sustain, release, attack curve, decay curve, release curve.
// ==============================================================================

#include "parameters/dropdown_mappings.h"
#include "parameters/parameter_helpers.h"
#include "parameters/state_reader.h"
#include <actuate/dsp/primitives/adsr_envelope.h>
#include "pluginterfaces/base/ustring.h"
#include "public.sdk/source/vst/vstparameters.h"
#include "base/source/fstreamer.h"
#include <algorithm>
#include <atomic>

namespace Actuate {

enum EnvelopeParamOffset : Steinberg::Vst::ParamID {
    kEnvAttackOffset = 0,
    kEnvDecayOffset,
    kEnvSustainOffset,
    kEnvReleaseOffset,
    kEnvAttackCurveOffset,
    kEnvDecayCurveOffset,
    kEnvReleaseCurveOffset,
    kEnvParamCount
};

struct EnvelopeParams {
    std::atomic<float> attackMs{2.0f};     // 0-10000 ms
    std::atomic<float> decayMs{300.0f};    // 0-10000 ms
    std::atomic<float> sustain{1.0f};      // 0-1
    std::atomic<float> releaseMs{50.0f};   // 0-10000 ms
    std::atomic<int> attackCurve{0};       // EnvCurve
    std::atomic<int> decayCurve{0};
    std::atomic<int> releaseCurve{0};
};

/// @param offset ID relative to the owner's attack parameter
inline void handleEnvelopeParamChange(
    EnvelopeParams& params, Steinberg::Vst::ParamID offset,
    Steinberg::Vst::ParamValue value) {
    switch (offset) {
        case kEnvAttackOffset:
            params.attackMs.store(envTimeFromNormalized(value), std::memory_order_relaxed);
            break;
        case kEnvDecayOffset:
            params.decayMs.store(envTimeFromNormalized(value), std::memory_order_relaxed);
            break;
        case kEnvSustainOffset:
            params.sustain.store(std::clamp(static_cast<float>(value), 0.0f, 1.0f),
                std::memory_order_relaxed);
            break;
        case kEnvReleaseOffset:
            params.releaseMs.store(envTimeFromNormalized(value), std::memory_order_relaxed);
            break;
        case kEnvAttackCurveOffset:
            params.attackCurve.store(listIndexFromNormalized(value, kEnvCurveCount),
                std::memory_order_relaxed);
            break;
        case kEnvDecayCurveOffset:
            params.decayCurve.store(listIndexFromNormalized(value, kEnvCurveCount),
                std::memory_order_relaxed);
            break;
        case kEnvReleaseCurveOffset:
            params.releaseCurve.store(listIndexFromNormalized(value, kEnvCurveCount),
                std::memory_order_relaxed);
            break;
        default: break;
    }
}

/// @param prefix Title prefix, e.g. "Osc 1 Amp" or "Filter 2 Env"
inline void registerEnvelopeParams(Steinberg::Vst::ParameterContainer& parameters,
                                   const char* prefix, Steinberg::Vst::ParamID attackId,
                                   float defaultSustain = 1.0f) {
    using namespace Steinberg::Vst;
    const char* names[] = {"Attack", "Decay", "Sustain", "Release",
                           "Attack Curve", "Decay Curve", "Release Curve"};
    String128 titles[kEnvParamCount];
    for (int i = 0; i < kEnvParamCount; ++i) {
        char text[128];
        snprintf(text, sizeof(text), "%s %s", prefix, names[i]);
        Steinberg::UString(titles[i], 128).fromAscii(text);
    }

    // Default attack: 2ms -> cbrt(2/10000) ~ 0.058
    parameters.addParameter(titles[kEnvAttackOffset], STR16("ms"), 0, envTimeToNormalized(2.0f),
        ParameterInfo::kCanAutomate, attackId + kEnvAttackOffset);
    // Default decay: 300ms -> cbrt(300/10000) ~ 0.311
    parameters.addParameter(titles[kEnvDecayOffset], STR16("ms"), 0, envTimeToNormalized(300.0f),
        ParameterInfo::kCanAutomate, attackId + kEnvDecayOffset);
    parameters.addParameter(titles[kEnvSustainOffset], STR16("%"), 0, defaultSustain,
        ParameterInfo::kCanAutomate, attackId + kEnvSustainOffset);
    parameters.addParameter(titles[kEnvReleaseOffset], STR16("ms"), 0, envTimeToNormalized(50.0f),
        ParameterInfo::kCanAutomate, attackId + kEnvReleaseOffset);
    parameters.addParameter(createDropdownParameter(titles[kEnvAttackCurveOffset],
        attackId + kEnvAttackCurveOffset, kEnvCurveStrings, kEnvCurveCount));
    parameters.addParameter(createDropdownParameter(titles[kEnvDecayCurveOffset],
        attackId + kEnvDecayCurveOffset, kEnvCurveStrings, kEnvCurveCount));
    parameters.addParameter(createDropdownParameter(titles[kEnvReleaseCurveOffset],
        attackId + kEnvReleaseCurveOffset, kEnvCurveStrings, kEnvCurveCount));
}

inline void saveEnvelopeParams(const EnvelopeParams& params, Steinberg::IBStreamer& streamer) {
    streamer.writeFloat(params.attackMs.load(std::memory_order_relaxed));
    streamer.writeFloat(params.decayMs.load(std::memory_order_relaxed));
    streamer.writeFloat(params.sustain.load(std::memory_order_relaxed));
    streamer.writeFloat(params.releaseMs.load(std::memory_order_relaxed));
    streamer.writeInt32(params.attackCurve.load(std::memory_order_relaxed));
    streamer.writeInt32(params.decayCurve.load(std::memory_order_relaxed));
    streamer.writeInt32(params.releaseCurve.load(std::memory_order_relaxed));
}

inline bool loadEnvelopeParams(EnvelopeParams& params, StateReader& reader) {
    float fv = 0.0f; int iv = 0;
    if (!reader.readFloat(fv, 0.0f, kMaxEnvTimeMs)) return false; params.attackMs.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxEnvTimeMs)) return false; params.decayMs.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, 1.0f)) return false; params.sustain.store(fv, std::memory_order_relaxed);
    if (!reader.readFloat(fv, 0.0f, kMaxEnvTimeMs)) return false; params.releaseMs.store(fv, std::memory_order_relaxed);
    if (!reader.readIndex(iv, kEnvCurveCount)) return false; params.attackCurve.store(iv, std::memory_order_relaxed);
    if (!reader.readIndex(iv, kEnvCurveCount)) return false; params.decayCurve.store(iv, std::memory_order_relaxed);
    if (!reader.readIndex(iv, kEnvCurveCount)) return false; params.releaseCurve.store(iv, std::memory_order_relaxed);
    return true;
}

[[nodiscard]] inline DSP::EnvelopeShape toEnvelopeShape(const EnvelopeParams& params) {
    DSP::EnvelopeShape shape;
    shape.attackMs = params.attackMs.load(std::memory_order_relaxed);
    shape.decayMs = params.decayMs.load(std::memory_order_relaxed);
    shape.sustain = params.sustain.load(std::memory_order_relaxed);
    shape.releaseMs = params.releaseMs.load(std::memory_order_relaxed);
    shape.attackCurve = static_cast<DSP::EnvCurve>(params.attackCurve.load(std::memory_order_relaxed));
    shape.decayCurve = static_cast<DSP::EnvCurve>(params.decayCurve.load(std::memory_order_relaxed));
    shape.releaseCurve = static_cast<DSP::EnvCurve>(params.releaseCurve.load(std::memory_order_relaxed));
    return shape;
}

/// @param base ID of the owner's attack parameter
template<typename SetParamFunc>
inline void syncEnvelopeParamsToController(
    const EnvelopeParams& params, Steinberg::Vst::ParamID base, SetParamFunc setParam) {
    setParam(base + kEnvAttackOffset,
        envTimeToNormalized(params.attackMs.load(std::memory_order_relaxed)));
    setParam(base + kEnvDecayOffset,
        envTimeToNormalized(params.decayMs.load(std::memory_order_relaxed)));
    setParam(base + kEnvSustainOffset,
        static_cast<double>(params.sustain.load(std::memory_order_relaxed)));
    setParam(base + kEnvReleaseOffset,
        envTimeToNormalized(params.releaseMs.load(std::memory_order_relaxed)));
    setParam(base + kEnvAttackCurveOffset,
        listIndexToNormalized(params.attackCurve.load(std::memory_order_relaxed), kEnvCurveCount));
    setParam(base + kEnvDecayCurveOffset,
        listIndexToNormalized(params.decayCurve.load(std::memory_order_relaxed), kEnvCurveCount));
    setParam(base + kEnvReleaseCurveOffset,
        listIndexToNormalized(params.releaseCurve.load(std::memory_order_relaxed), kEnvCurveCount));
}

} // namespace Actuate
