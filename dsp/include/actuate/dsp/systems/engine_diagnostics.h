// ==============================================================================
// Layer 3: System Component - Engine Diagnostics
// ==============================================================================
// Error codes and the audio-to-control diagnostic channel.
//
// The audio thread never formats or prints. It pushes fixed-size Diagnostic
// records into a wait-free ring (dropped when full); the control thread
// drains them and writes each through ACTUATE_LOG.
//
// ACTUATE_ENGINE_DEBUG (compile-time, default 0) enables ACTUATE_TRACE,
// verbose engine tracing meant for the control thread and tests.
// ==============================================================================

#pragma once

#include <actuate/dsp/primitives/spsc_queue.h>

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#ifndef ACTUATE_ENGINE_DEBUG
#define ACTUATE_ENGINE_DEBUG 0
#endif

namespace Actuate {
namespace DSP {

enum class ActuateError : uint8_t {
    None = 0,
    ConfigError,      ///< Value out of its declared range, or NaN
    ResourceMissing,  ///< Sampler/granulizer triggered without a bank
    FormatError,      ///< Bad magic, truncated stream or unknown version
    Overrun           ///< Block larger than the prepared maximum
};

[[nodiscard]] constexpr const char* errorName(ActuateError error) noexcept {
    switch (error) {
        case ActuateError::None:            return "None";
        case ActuateError::ConfigError:     return "ConfigError";
        case ActuateError::ResourceMissing: return "ResourceMissing";
        case ActuateError::FormatError:     return "FormatError";
        case ActuateError::Overrun:         return "Overrun";
    }
    return "Unknown";
}

/// @brief One audio-thread report.
struct Diagnostic {
    ActuateError code = ActuateError::None;
    uint8_t module = 0;   ///< Audio module index, where relevant
    float value = 0.0f;   ///< Code-specific detail
};

inline constexpr size_t kDiagnosticQueueCapacity = 64;

using DiagnosticQueue = SpscQueue<Diagnostic, kDiagnosticQueueCapacity>;

/// @brief printf-style message to the debugger output (Windows) or stderr.
inline void logMessage(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
#else
    std::fprintf(stderr, "%s", buf);
#endif
}

/// @brief Control thread: format and log every pending diagnostic.
/// @return Number of records drained
inline size_t drainDiagnostics(DiagnosticQueue& queue) {
    size_t count = 0;
    Diagnostic d;
    while (queue.pop(d)) {
        logMessage("[actuate] %s (module %u, value %g)\n",
                   errorName(d.code), static_cast<unsigned>(d.module),
                   static_cast<double>(d.value));
        ++count;
    }
    return count;
}

} // namespace DSP
} // namespace Actuate

#define ACTUATE_LOG(...) ::Actuate::DSP::logMessage(__VA_ARGS__)

#if ACTUATE_ENGINE_DEBUG
#define ACTUATE_TRACE(...) ::Actuate::DSP::logMessage(__VA_ARGS__)
#else
#define ACTUATE_TRACE(...) ((void)0)
#endif
