#pragma once

// ==============================================================================
// State Reader
// ==============================================================================
// Thin wrapper over IBStreamer used by every load*Params() function. Each read
// names the declared range of the value it reads. A short read is a
// FormatError; a value outside its range (or NaN) is a ConfigError. The first
// failure is kept, and the caller abandons the load.
// ==============================================================================

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/systems/engine_diagnostics.h>
#include "base/source/fstreamer.h"

#include <cstddef>
#include <string>
#include <vector>

namespace Actuate {

class StateReader {
public:
    explicit StateReader(Steinberg::IBStreamer& streamer) noexcept : streamer_(streamer) {}

    [[nodiscard]] bool readFloat(float& out, float min, float max) {
        float v = 0.0f;
        if (!streamer_.readFloat(v)) return fail(DSP::ActuateError::FormatError);
        if (DSP::detail::isNonFinite(v) || v < min || v > max) {
            return fail(DSP::ActuateError::ConfigError);
        }
        out = v;
        return true;
    }

    [[nodiscard]] bool readInt(Steinberg::int32& out, Steinberg::int32 min, Steinberg::int32 max) {
        Steinberg::int32 v = 0;
        if (!streamer_.readInt32(v)) return fail(DSP::ActuateError::FormatError);
        if (v < min || v > max) return fail(DSP::ActuateError::ConfigError);
        out = v;
        return true;
    }

    /// Enumerations are stored as int32 indices into a list of count entries.
    [[nodiscard]] bool readIndex(int& out, int count) {
        Steinberg::int32 v = 0;
        if (!readInt(v, 0, count - 1)) return false;
        out = static_cast<int>(v);
        return true;
    }

    [[nodiscard]] bool readBool(bool& out) {
        Steinberg::int32 v = 0;
        if (!readInt(v, 0, 1)) return false;
        out = v != 0;
        return true;
    }

    /// Length-prefixed byte string of at most maxLength bytes.
    [[nodiscard]] bool readString(std::string& out, size_t maxLength) {
        Steinberg::int32 length = 0;
        if (!readInt(length, 0, static_cast<Steinberg::int32>(maxLength))) return false;
        std::string text(static_cast<size_t>(length), '\0');
        if (length > 0 && streamer_.readRaw(text.data(), length) != length) {
            return fail(DSP::ActuateError::FormatError);
        }
        out = std::move(text);
        return true;
    }

    /// count float32 values, each checked for NaN/Inf.
    [[nodiscard]] bool readSamples(std::vector<float>& out, size_t count) {
        std::vector<float> samples(count);
        if (count > 0 && !streamer_.readFloatArray(samples.data(), static_cast<Steinberg::int32>(count))) {
            return fail(DSP::ActuateError::FormatError);
        }
        for (const float s : samples) {
            if (DSP::detail::isNonFinite(s)) return fail(DSP::ActuateError::ConfigError);
        }
        out = std::move(samples);
        return true;
    }

    [[nodiscard]] DSP::ActuateError error() const noexcept { return error_; }
    [[nodiscard]] Steinberg::IBStreamer& streamer() noexcept { return streamer_; }

    bool fail(DSP::ActuateError error) noexcept {
        if (error_ == DSP::ActuateError::None) {
            error_ = error;
        }
        return false;
    }

private:
    Steinberg::IBStreamer& streamer_;
    DSP::ActuateError error_ = DSP::ActuateError::None;
};

inline void writeString(Steinberg::IBStreamer& streamer, const std::string& text) {
    streamer.writeInt32(static_cast<Steinberg::int32>(text.size()));
    if (!text.empty()) {
        streamer.writeRaw(text.data(), static_cast<Steinberg::int32>(text.size()));
    }
}

} // namespace Actuate
