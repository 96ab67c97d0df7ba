#pragma once

// ==============================================================================
// Parameter Helper Functions
// ==============================================================================
// Shared by every parameter pack: list parameters, indexed titles and the
// normalized <-> plain mappings used by more than one section.
//
// KEY INSIGHT: Basic Parameter::toPlain() returns normalized value unchanged!
// StringListParameter::toPlain() properly scales to integer indices.
// ==============================================================================

#include "public.sdk/source/vst/vstparameters.h"
#include "pluginterfaces/base/ustring.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>

namespace Actuate {

// ==============================================================================
// createDropdownParameter - For discrete list parameters
// ==============================================================================

inline Steinberg::Vst::StringListParameter* createDropdownParameter(
    const Steinberg::Vst::TChar* title,
    Steinberg::Vst::ParamID id,
    std::initializer_list<const Steinberg::Vst::TChar*> options,
    int defaultIndex = 0) {

    auto* param = new Steinberg::Vst::StringListParameter(
        title,
        id,
        nullptr,
        Steinberg::Vst::ParameterInfo::kCanAutomate |
        Steinberg::Vst::ParameterInfo::kIsList
    );

    for (const auto* option : options) {
        param->appendString(option);
    }

    if (defaultIndex > 0 && defaultIndex <= param->getInfo().stepCount) {
        param->setNormalized(param->toNormalized(static_cast<Steinberg::Vst::ParamValue>(defaultIndex)));
    }

    return param;
}

/// Same as above, for option tables shared between sections.
inline Steinberg::Vst::StringListParameter* createDropdownParameter(
    const Steinberg::Vst::TChar* title,
    Steinberg::Vst::ParamID id,
    const Steinberg::Vst::TChar* const* strings,
    int count,
    int defaultIndex = 0) {

    auto* param = new Steinberg::Vst::StringListParameter(
        title,
        id,
        nullptr,
        Steinberg::Vst::ParameterInfo::kCanAutomate |
        Steinberg::Vst::ParameterInfo::kIsList
    );

    for (int i = 0; i < count; ++i) {
        param->appendString(strings[i]);
    }

    if (defaultIndex > 0 && defaultIndex <= param->getInfo().stepCount) {
        param->setNormalized(param->toNormalized(static_cast<Steinberg::Vst::ParamValue>(defaultIndex)));
    }

    return param;
}

// ==============================================================================
// Indexed titles ("Osc 2 Gain", "LFO 3 Rate", ...)
// ==============================================================================

inline void makeIndexedTitle(Steinberg::Vst::String128 out, const char* prefix,
                             int index, const char* name) {
    char text[128];
    snprintf(text, sizeof(text), "%s %d %s", prefix, index, name);
    Steinberg::UString(out, 128).fromAscii(text);
}

// ==============================================================================
// Normalized <-> plain mappings
// ==============================================================================

/// 0-1 -> list index 0..count-1
inline int listIndexFromNormalized(double value, int count) {
    return std::clamp(static_cast<int>(value * (count - 1) + 0.5), 0, count - 1);
}

inline double listIndexToNormalized(int index, int count) {
    return count > 1 ? static_cast<double>(index) / (count - 1) : 0.0;
}

/// 0-1 -> integer range [min, max]
inline int intFromNormalized(double value, int min, int max) {
    return std::clamp(static_cast<int>(value * (max - min) + min + 0.5), min, max);
}

inline double intToNormalized(int plain, int min, int max) {
    return max > min ? static_cast<double>(plain - min) / (max - min) : 0.0;
}

/// 0-1 -> linear range [min, max]
inline float linearFromNormalized(double value, float min, float max) {
    return std::clamp(static_cast<float>(min + value * (max - min)), min, max);
}

inline double linearToNormalized(float plain, float min, float max) {
    return max > min ? std::clamp(static_cast<double>((plain - min) / (max - min)), 0.0, 1.0) : 0.0;
}

// Exponential time mapping: normalized 0-1 -> 0-10000 ms
// Using x^3 * 10000 for perceptually linear feel
inline constexpr float kMaxEnvTimeMs = 10000.0f;

inline float envTimeFromNormalized(double value) {
    float v = static_cast<float>(value);
    return std::clamp(v * v * v * kMaxEnvTimeMs, 0.0f, kMaxEnvTimeMs);
}

inline double envTimeToNormalized(float ms) {
    return std::clamp(static_cast<double>(std::cbrt(ms / kMaxEnvTimeMs)), 0.0, 1.0);
}

// Logarithmic frequency mapping: normalized 0-1 -> [min, max] Hz
inline float logFreqFromNormalized(double value, float minHz, float maxHz) {
    const double v = std::clamp(value, 0.0, 1.0);
    return std::clamp(static_cast<float>(minHz * std::pow(static_cast<double>(maxHz / minHz), v)),
                      minHz, maxHz);
}

inline double logFreqToNormalized(float hz, float minHz, float maxHz) {
    return std::clamp(std::log(static_cast<double>(hz / minHz)) /
                      std::log(static_cast<double>(maxHz / minHz)), 0.0, 1.0);
}

} // namespace Actuate
