// ==============================================================================
// Actuate Instrument
// ==============================================================================

#include "processor/instrument.h"
#include "parameters/build_patch.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace Actuate {

ActuateInstrument::ActuateInstrument()
    : params_(std::make_unique<ActuateParams>()) {
    registerAllParams(parameters_);
    for (size_t m = 0; m < kNumModules; ++m) {
        bankRestretch_[m] = params_->modules[m].restretch.load(std::memory_order_relaxed);
    }
    publishPatch();
}

// =============================================================================
// Lifecycle
// =============================================================================

void ActuateInstrument::prepare(double sampleRate, size_t maxBlockSize) {
    context_ = DSP::SynthContext::create(sampleRate, maxBlockSize);

    // Stored samples follow the engine rate
    for (size_t m = 0; m < kNumModules; ++m) {
        if (!samples_[m]) continue;
        auto resampled = toEngineRate(samples_[m]);
        if (!resampled) {
            ACTUATE_LOG("[actuate] module %u: sample could not be resampled, cleared\n",
                        static_cast<unsigned>(m));
            clearSample(m);
            continue;
        }
        samples_[m] = std::move(resampled);
        if (!rebuildBank(m)) {
            clearSample(m);
        }
    }

    engine_.prepare(context_);
}

void ActuateInstrument::process(float* left, float* right, size_t numSamples) noexcept {
    engine_.processBlock(left, right, numSamples);
}

// =============================================================================
// Parameters
// =============================================================================

void ActuateInstrument::setParamNormalized(Steinberg::Vst::ParamID id,
                                           Steinberg::Vst::ParamValue value) {
    value = std::clamp(value, 0.0, 1.0);
    handleParamChange(*params_, id, value);
    showParamValue(id, value);

    // An order change swaps two positions
    if (id >= kFxOrderBaseId && id < kFxOrderBaseId + DSP::kFxSlotCount) {
        syncFxEnableParamsToController(params_->fxEnable,
            [this](Steinberg::Vst::ParamID slotId, double normalized) {
                showParamValue(slotId, normalized);
            });
    }

    if (id >= kModuleBaseId && id <= kModuleEndId &&
        (id - kModuleBaseId) % kModuleParamStride == kModuleRestretchOffset) {
        const auto m = static_cast<size_t>((id - kModuleBaseId) / kModuleParamStride);
        if (m < kNumModules &&
            params_->modules[m].restretch.load(std::memory_order_relaxed) != bankRestretch_[m] &&
            samples_[m] && !rebuildBank(m)) {
            clearSample(m);
        }
    }

    publishPatch();
}

void ActuateInstrument::showParamValue(Steinberg::Vst::ParamID id,
                                       Steinberg::Vst::ParamValue value) {
    if (auto* parameter = parameters_.getParameter(id)) {
        parameter->setNormalized(value);
    }
}

void ActuateInstrument::publishPatch() {
    engine_.publishPatch(buildPatch(*params_));
}

// =============================================================================
// Performance Input
// =============================================================================

bool ActuateInstrument::noteOn(uint8_t note, uint8_t velocity, uint32_t sampleOffset) noexcept {
    DSP::NoteEvent event;
    event.type = DSP::NoteEvent::Type::NoteOn;
    event.sampleOffset = sampleOffset;
    event.note = std::min<uint8_t>(note, 127);
    event.velocity = std::min<uint8_t>(velocity, 127);
    return engine_.pushEvent(event);
}

bool ActuateInstrument::noteOff(uint8_t note, uint32_t sampleOffset) noexcept {
    DSP::NoteEvent event;
    event.type = DSP::NoteEvent::Type::NoteOff;
    event.sampleOffset = sampleOffset;
    event.note = std::min<uint8_t>(note, 127);
    return engine_.pushEvent(event);
}

bool ActuateInstrument::pitchBend(float bend, uint32_t sampleOffset) noexcept {
    if (DSP::detail::isNonFinite(bend)) return false;
    DSP::NoteEvent event;
    event.type = DSP::NoteEvent::Type::PitchBend;
    event.sampleOffset = sampleOffset;
    event.value = std::clamp(bend, -1.0f, 1.0f);
    return engine_.pushEvent(event);
}

bool ActuateInstrument::aftertouch(float pressure, uint32_t sampleOffset) noexcept {
    if (DSP::detail::isNonFinite(pressure)) return false;
    DSP::NoteEvent event;
    event.type = DSP::NoteEvent::Type::Aftertouch;
    event.sampleOffset = sampleOffset;
    event.value = std::clamp(pressure, 0.0f, 1.0f);
    return engine_.pushEvent(event);
}

// =============================================================================
// Samples
// =============================================================================

bool ActuateInstrument::loadSample(size_t module, const float* interleaved, size_t channels,
                                   size_t frames, double sampleRate, DSP::ActuateError& error) {
    error = DSP::ActuateError::ConfigError;
    if (module >= kNumModules || interleaved == nullptr || channels == 0 ||
        channels > DSP::kMaxSampleChannels || frames == 0 ||
        frames > static_cast<size_t>(kMaxPresetSampleFrames)) {
        return false;
    }
    if (!std::all_of(interleaved, interleaved + channels * frames,
                     [](float x) { return std::isfinite(x); })) {
        return false;
    }

    auto buffer = DSP::SampleBuffer::fromInterleaved(interleaved, channels, frames,
                                                     sampleRate, context_.sampleRate);
    if (!buffer) return false;

    const bool restretch = params_->modules[module].restretch.load(std::memory_order_relaxed);
    auto bank = DSP::SampleBank::build(buffer, {restretch});
    if (!bank) return false;

    samples_[module] = std::move(buffer);
    bankRestretch_[module] = restretch;
    engine_.setSampleBank(module, std::move(bank));
    error = DSP::ActuateError::None;
    return true;
}

void ActuateInstrument::clearSample(size_t module) {
    if (module >= kNumModules) return;
    samples_[module].reset();
    engine_.setSampleBank(module, nullptr);
}

std::shared_ptr<const DSP::SampleBuffer> ActuateInstrument::toEngineRate(
    const std::shared_ptr<const DSP::SampleBuffer>& buffer) const {
    if (!buffer || buffer->sampleRate() == context_.sampleRate) return buffer;

    const size_t channels = buffer->numChannels();
    const size_t frames = buffer->numFrames();
    std::vector<float> interleaved(channels * frames);
    for (size_t ch = 0; ch < channels; ++ch) {
        const float* data = buffer->channel(ch);
        for (size_t i = 0; i < frames; ++i) {
            interleaved[i * channels + ch] = data[i];
        }
    }
    return DSP::SampleBuffer::fromInterleaved(interleaved.data(), channels, frames,
                                              buffer->sampleRate(), context_.sampleRate);
}

bool ActuateInstrument::rebuildBank(size_t module) {
    const bool restretch = params_->modules[module].restretch.load(std::memory_order_relaxed);
    auto bank = DSP::SampleBank::build(samples_[module], {restretch});
    if (!bank) {
        ACTUATE_LOG("[actuate] module %u: sample bank build failed\n",
                    static_cast<unsigned>(module));
        return false;
    }
    bankRestretch_[module] = restretch;
    engine_.setSampleBank(module, std::move(bank));
    return true;
}

// =============================================================================
// Presets
// =============================================================================

PresetStatus ActuateInstrument::savePreset(Steinberg::IBStream* stream) const {
    return writePreset(stream, metadata_, *params_, samples_);
}

PresetStatus ActuateInstrument::loadPreset(Steinberg::IBStream* stream) {
    auto staged = std::make_unique<ActuateParams>();
    PresetMetadata stagedMetadata;
    PresetSamples stagedSamples{};

    if (auto status = readPreset(stream, stagedMetadata, *staged, stagedSamples); !status) {
        ACTUATE_LOG("[actuate] preset rejected: %s\n", DSP::errorName(status.error));
        return status;
    }

    std::array<std::shared_ptr<const DSP::SampleBank>, kNumModules> banks{};
    std::array<bool, kNumModules> restretch{};
    for (size_t m = 0; m < kNumModules; ++m) {
        restretch[m] = staged->modules[m].restretch.load(std::memory_order_relaxed);
        if (!stagedSamples[m]) continue;
        stagedSamples[m] = toEngineRate(stagedSamples[m]);
        if (stagedSamples[m]) {
            banks[m] = DSP::SampleBank::build(stagedSamples[m], {restretch[m]});
        }
        if (!banks[m]) {
            ACTUATE_LOG("[actuate] preset rejected: module %u sample unusable\n",
                        static_cast<unsigned>(m));
            return {DSP::ActuateError::ConfigError};
        }
    }

    // Commit
    params_ = std::move(staged);
    metadata_ = std::move(stagedMetadata);
    samples_ = std::move(stagedSamples);
    bankRestretch_ = restretch;
    for (size_t m = 0; m < kNumModules; ++m) {
        engine_.setSampleBank(m, std::move(banks[m]));
    }

    // The host surface follows the loaded values
    syncAllParamsToController(*params_, [this](Steinberg::Vst::ParamID id, double value) {
        showParamValue(id, value);
    });
    publishPatch();
    return {};
}

// =============================================================================
// Housekeeping
// =============================================================================

size_t ActuateInstrument::idle() {
    engine_.collectGarbage();
    return DSP::drainDiagnostics(engine_.diagnostics());
}

} // namespace Actuate
