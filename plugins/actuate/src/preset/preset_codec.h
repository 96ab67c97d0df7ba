#pragma once

// ==============================================================================
// Actuate Preset Codec
// ==============================================================================
// Binary preset layout (little-endian, written through IBStreamer):
//
//   char[4]   magic 'ACTP'
//   int32     schema version (kCurrentPresetVersion)
//   metadata  name, info (length-prefixed), category (int32), tags (int32 bits)
//   sections  every parameter pack in saveAllParams() order
//   samples   per audio module: int32 present flag, then when present
//             float64 sample rate, int32 channels, int32 frames and
//             frames * channels interleaved float32 values
//
// readPreset() fills caller-provided staging storage only. The caller commits
// it once the whole stream has been read and validated.
// ==============================================================================

#include "parameters/actuate_params.h"
#include <actuate/dsp/primitives/sample_buffer.h>
#include <actuate/dsp/systems/engine_diagnostics.h>
#include "pluginterfaces/base/ibstream.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace Actuate {

inline constexpr char kPresetMagic[4] = {'A', 'C', 'T', 'P'};
inline constexpr Steinberg::int32 kCurrentPresetVersion = 1;

inline constexpr size_t kMaxPresetNameLength = 256;
inline constexpr size_t kMaxPresetInfoLength = 4096;
inline constexpr Steinberg::int32 kMaxPresetSampleFrames = 1 << 25;

// =============================================================================
// Metadata
// =============================================================================

enum class PresetType : uint8_t {
    Select = 0,
    Atmosphere,
    Bass,
    FX,
    Keys,
    Lead,
    Pad,
    Percussion,
    Pluck,
    Synth,
    Other
};

inline constexpr int kPresetTypeCount = 11;

inline constexpr const char* kPresetTypeNames[] = {
    "Select", "Atmosphere", "Bass", "FX", "Keys", "Lead",
    "Pad", "Percussion", "Pluck", "Synth", "Other",
};

/// Tag bits; a preset carries any combination.
enum PresetTag : uint32_t {
    kTagAcid      = 1u << 0,
    kTagAnalog    = 1u << 1,
    kTagBright    = 1u << 2,
    kTagChord     = 1u << 3,
    kTagCrisp     = 1u << 4,
    kTagDeep      = 1u << 5,
    kTagDelicate  = 1u << 6,
    kTagHard      = 1u << 7,
    kTagHarsh     = 1u << 8,
    kTagLush      = 1u << 9,
    kTagMellow    = 1u << 10,
    kTagResonant  = 1u << 11,
    kTagRich      = 1u << 12,
    kTagSharp     = 1u << 13,
    kTagSilky     = 1u << 14,
    kTagSmooth    = 1u << 15,
    kTagSoft      = 1u << 16,
    kTagStab      = 1u << 17,
    kTagWarm      = 1u << 18,
};

inline constexpr int kPresetTagCount = 19;
inline constexpr uint32_t kPresetTagMask = (1u << kPresetTagCount) - 1u;

inline constexpr const char* kPresetTagNames[] = {
    "Acid", "Analog", "Bright", "Chord", "Crisp", "Deep", "Delicate",
    "Hard", "Harsh", "Lush", "Mellow", "Resonant", "Rich", "Sharp",
    "Silky", "Smooth", "Soft", "Stab", "Warm",
};

struct PresetMetadata {
    std::string name;
    std::string info;
    PresetType category = PresetType::Select;
    uint32_t tags = 0;

    [[nodiscard]] bool hasTag(PresetTag tag) const noexcept { return (tags & tag) != 0; }
};

// =============================================================================
// Status
// =============================================================================

/// @brief Outcome of a preset read or write.
struct [[nodiscard]] PresetStatus {
    DSP::ActuateError error = DSP::ActuateError::None;

    [[nodiscard]] bool ok() const noexcept { return error == DSP::ActuateError::None; }
    explicit operator bool() const noexcept { return ok(); }
};

/// Embedded sample data, one optional buffer per audio module.
using PresetSamples = std::array<std::shared_ptr<const DSP::SampleBuffer>, kNumModules>;

// =============================================================================
// API
// =============================================================================

/// @brief Serialize metadata, every parameter section and the module samples.
PresetStatus writePreset(Steinberg::IBStream* stream, const PresetMetadata& metadata,
                         const ActuateParams& params, const PresetSamples& samples);

/// @brief Read a preset into staging storage.
///
/// Nothing outside the three output arguments is touched. On failure their
/// contents are unspecified and must be discarded.
/// @return FormatError for a bad magic, unknown version or truncated stream;
///         ConfigError for a value outside its declared range or NaN
PresetStatus readPreset(Steinberg::IBStream* stream, PresetMetadata& metadata,
                        ActuateParams& params, PresetSamples& samples);

} // namespace Actuate
