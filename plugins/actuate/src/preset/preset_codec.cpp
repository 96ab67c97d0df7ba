// ==============================================================================
// Actuate Preset Codec
// ==============================================================================

#include "preset/preset_codec.h"
#include "parameters/state_reader.h"
#include "base/source/fstreamer.h"

#include <cmath>
#include <cstring>
#include <vector>

namespace Actuate {

namespace {

void writeMetadata(Steinberg::IBStreamer& streamer, const PresetMetadata& metadata) {
    writeString(streamer, metadata.name.substr(0, kMaxPresetNameLength));
    writeString(streamer, metadata.info.substr(0, kMaxPresetInfoLength));
    streamer.writeInt32(static_cast<Steinberg::int32>(metadata.category));
    streamer.writeInt32(static_cast<Steinberg::int32>(metadata.tags & kPresetTagMask));
}

bool readMetadata(StateReader& reader, PresetMetadata& metadata) {
    int category = 0;
    Steinberg::int32 tags = 0;
    if (!reader.readString(metadata.name, kMaxPresetNameLength)) return false;
    if (!reader.readString(metadata.info, kMaxPresetInfoLength)) return false;
    if (!reader.readIndex(category, kPresetTypeCount)) return false;
    if (!reader.readInt(tags, 0, static_cast<Steinberg::int32>(kPresetTagMask))) return false;
    metadata.category = static_cast<PresetType>(category);
    metadata.tags = static_cast<uint32_t>(tags);
    return true;
}

void writeSample(Steinberg::IBStreamer& streamer, const DSP::SampleBuffer* buffer) {
    if (buffer == nullptr) {
        streamer.writeInt32(0);
        return;
    }
    const size_t channels = buffer->numChannels();
    const size_t frames = buffer->numFrames();
    streamer.writeInt32(1);
    streamer.writeDouble(buffer->sampleRate());
    streamer.writeInt32(static_cast<Steinberg::int32>(channels));
    streamer.writeInt32(static_cast<Steinberg::int32>(frames));

    std::vector<float> interleaved(frames * channels);
    for (size_t ch = 0; ch < channels; ++ch) {
        const float* data = buffer->channel(ch);
        for (size_t i = 0; i < frames; ++i) {
            interleaved[i * channels + ch] = data[i];
        }
    }
    streamer.writeFloatArray(interleaved.data(), static_cast<Steinberg::int32>(interleaved.size()));
}

bool readSample(StateReader& reader, std::shared_ptr<const DSP::SampleBuffer>& out) {
    bool present = false;
    if (!reader.readBool(present)) return false;
    if (!present) {
        out.reset();
        return true;
    }

    double rate = 0.0;
    if (!reader.streamer().readDouble(rate)) return reader.fail(DSP::ActuateError::FormatError);
    if (!std::isfinite(rate) || rate < DSP::kMinSampleRate || rate > DSP::kMaxSampleRate) {
        return reader.fail(DSP::ActuateError::ConfigError);
    }

    Steinberg::int32 channels = 0;
    Steinberg::int32 frames = 0;
    if (!reader.readInt(channels, 1, static_cast<Steinberg::int32>(DSP::kMaxSampleChannels))) return false;
    if (!reader.readInt(frames, 1, kMaxPresetSampleFrames)) return false;

    std::vector<float> interleaved;
    const auto count = static_cast<size_t>(frames) * static_cast<size_t>(channels);
    if (!reader.readSamples(interleaved, count)) return false;

    // Stored at the rate the engine ran at; the instrument resamples on commit
    out = DSP::SampleBuffer::fromInterleaved(interleaved.data(), static_cast<size_t>(channels),
                                             static_cast<size_t>(frames), rate, rate);
    if (!out) return reader.fail(DSP::ActuateError::ConfigError);
    return true;
}

} // namespace

PresetStatus writePreset(Steinberg::IBStream* stream, const PresetMetadata& metadata,
                         const ActuateParams& params, const PresetSamples& samples) {
    if (stream == nullptr) return {DSP::ActuateError::FormatError};

    Steinberg::IBStreamer streamer(stream, kLittleEndian);
    if (streamer.writeRaw(kPresetMagic, sizeof(kPresetMagic)) != sizeof(kPresetMagic)) {
        return {DSP::ActuateError::FormatError};
    }
    streamer.writeInt32(kCurrentPresetVersion);
    writeMetadata(streamer, metadata);
    saveAllParams(params, streamer);
    for (const auto& sample : samples) {
        writeSample(streamer, sample.get());
    }
    return {};
}

PresetStatus readPreset(Steinberg::IBStream* stream, PresetMetadata& metadata,
                        ActuateParams& params, PresetSamples& samples) {
    if (stream == nullptr) return {DSP::ActuateError::FormatError};

    Steinberg::IBStreamer streamer(stream, kLittleEndian);
    char magic[sizeof(kPresetMagic)] = {};
    if (streamer.readRaw(magic, sizeof(magic)) != sizeof(magic) ||
        std::memcmp(magic, kPresetMagic, sizeof(magic)) != 0) {
        return {DSP::ActuateError::FormatError};
    }

    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version) || version < 1 || version > kCurrentPresetVersion) {
        return {DSP::ActuateError::FormatError};
    }

    StateReader reader(streamer);
    if (!readMetadata(reader, metadata) || !loadAllParams(params, reader)) {
        return {reader.error()};
    }
    for (auto& sample : samples) {
        if (!readSample(reader, sample)) return {reader.error()};
    }
    return {};
}

} // namespace Actuate
