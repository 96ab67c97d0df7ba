#pragma once

// ==============================================================================
// Actuate Instrument
// ==============================================================================
// Host-facing front of the synthesizer. Owns the parameter surface, the
// parameter packs, the module samples and the engine.
//
// Threading:
// - Control thread: setParamNormalized(), note/bend/aftertouch input,
//   loadSample(), savePreset()/loadPreset(), idle()
// - Audio thread:   process()
//
// Every parameter change rebuilds the SynthPatch snapshot and publishes it;
// the audio thread picks the newest one up at the start of its next block.
//
// Real-Time Safety:
// - process() never allocates, locks or frees memory
// - Sample banks are built here, on the control thread, and handed over
//   through SampleBankSlot
// ==============================================================================

#include "engine/actuate_engine.h"
#include "parameters/actuate_params.h"
#include "preset/preset_codec.h"

#include <actuate/dsp/primitives/sample_buffer.h>
#include <actuate/dsp/systems/engine_diagnostics.h>
#include <actuate/dsp/systems/sample_bank.h>

#include "pluginterfaces/base/ibstream.h"
#include "public.sdk/source/vst/vstparameters.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace Actuate {

class ActuateInstrument {
public:
    ActuateInstrument();

    ActuateInstrument(const ActuateInstrument&) = delete;
    ActuateInstrument& operator=(const ActuateInstrument&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Allocate the engine for the given rate and block size.
    /// Values outside 8 kHz..384 kHz and 1..8192 samples are clamped.
    void prepare(double sampleRate, size_t maxBlockSize);

    /// @brief Render numSamples of stereo output. Audio thread.
    void process(float* left, float* right, size_t numSamples) noexcept;

    // =========================================================================
    // Parameters
    // =========================================================================

    /// @brief Apply a normalized (0-1) host value and publish a new patch.
    void setParamNormalized(Steinberg::Vst::ParamID id, Steinberg::Vst::ParamValue value);

    [[nodiscard]] Steinberg::Vst::ParameterContainer& parameters() noexcept { return parameters_; }
    [[nodiscard]] const ActuateParams& params() const noexcept { return *params_; }

    // =========================================================================
    // Performance Input
    // =========================================================================

    bool noteOn(uint8_t note, uint8_t velocity, uint32_t sampleOffset = 0) noexcept;
    bool noteOff(uint8_t note, uint32_t sampleOffset = 0) noexcept;

    /// @param bend Normalized bend [-1, +1]; scaled by the pitch bend range
    bool pitchBend(float bend, uint32_t sampleOffset = 0) noexcept;

    /// @param pressure Channel pressure [0, 1]
    bool aftertouch(float pressure, uint32_t sampleOffset = 0) noexcept;

    void setTempo(double bpm) noexcept { engine_.setTempo(bpm); }

    // =========================================================================
    // Samples
    // =========================================================================

    /// @brief Load interleaved PCM into an audio module. Control thread.
    ///
    /// The data is resampled to the engine rate and built into a sample bank
    /// (restretched or pitch-shifted per the module's Restretch parameter).
    /// @param error Set to ConfigError for invalid arguments, None on success
    [[nodiscard]] bool loadSample(size_t module, const float* interleaved, size_t channels,
                                  size_t frames, double sampleRate, DSP::ActuateError& error);

    /// @brief Remove the sample of an audio module.
    void clearSample(size_t module);

    [[nodiscard]] bool hasSample(size_t module) const noexcept {
        return module < samples_.size() && samples_[module] != nullptr;
    }

    // =========================================================================
    // Presets
    // =========================================================================

    [[nodiscard]] PresetStatus savePreset(Steinberg::IBStream* stream) const;

    /// @brief Load a preset. On any error the current state is left untouched.
    /// On success the parameter surface shows the loaded values.
    [[nodiscard]] PresetStatus loadPreset(Steinberg::IBStream* stream);

    [[nodiscard]] const PresetMetadata& metadata() const noexcept { return metadata_; }
    void setMetadata(PresetMetadata metadata) { metadata_ = std::move(metadata); }

    // =========================================================================
    // Housekeeping
    // =========================================================================

    /// @brief Free retired sample banks and log pending diagnostics.
    /// @return Number of diagnostics written
    size_t idle();

    [[nodiscard]] DSP::ActuateEngine& engine() noexcept { return engine_; }
    [[nodiscard]] const DSP::ActuateEngine& engine() const noexcept { return engine_; }

private:
    void publishPatch();

    /// Set the host-surface value only; the parameter packs are not touched.
    void showParamValue(Steinberg::Vst::ParamID id, Steinberg::Vst::ParamValue value);

    /// Resample a buffer to the engine rate. Returns the input when it already matches.
    [[nodiscard]] std::shared_ptr<const DSP::SampleBuffer> toEngineRate(
        const std::shared_ptr<const DSP::SampleBuffer>& buffer) const;

    /// @return false if the bank could not be built
    bool rebuildBank(size_t module);

    Steinberg::Vst::ParameterContainer parameters_;
    std::unique_ptr<ActuateParams> params_;
    PresetMetadata metadata_;
    PresetSamples samples_{};
    std::array<bool, kNumModules> bankRestretch_{};
    DSP::SynthContext context_ = DSP::SynthContext::create(44100.0, 512);
    DSP::ActuateEngine engine_;
};

} // namespace Actuate
