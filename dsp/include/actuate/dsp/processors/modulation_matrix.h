// ==============================================================================
// Layer 2: DSP Processor - Modulation Matrix
// ==============================================================================
// Four routing slots from modulation sources to synth destinations.
//
// Source ranges:
// - Bipolar [-1, +1]: LFO1-3
// - Unipolar [0, +1]: Velocity, Aftertouch, FilterEnv1-2
//
// Per destination, every route contributes depth * source * polarity and the
// contributions add (no route overrides another). "All" destinations fan out
// to their per-module counterparts. The summed offset is scaled into the
// destination's units and the result clamped to the declared range:
//
//   Cutoff      base * 2^(raw * 48 / 12)   clamped to [20, 20000] Hz
//   others      base + raw * scale         clamped to [min, max]
//
// The route table is copied once per block in beginBlock(), so routing
// changes land on block boundaries.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

// =============================================================================
// Sources
// =============================================================================

enum class ModSource : uint8_t {
    None = 0,
    Velocity,
    Aftertouch,
    Lfo1,
    Lfo2,
    Lfo3,
    FilterEnv1,
    FilterEnv2
};

inline constexpr uint8_t kModSourceCount = 8;

// =============================================================================
// Destinations
// =============================================================================

enum class ModDestination : uint8_t {
    None = 0,
    Cutoff1,
    Cutoff2,
    Resonance1,
    Resonance2,
    AllGain,
    Osc1Gain,
    Osc2Gain,
    Osc3Gain,
    AllDetune,
    Osc1Detune,
    Osc2Detune,
    Osc3Detune,
    AllUniDetune,
    Osc1UniDetune,
    Osc2UniDetune,
    Osc3UniDetune,
    Osc1PartialLevel,
    Osc2PartialLevel,
    Osc3PartialLevel
};

inline constexpr uint8_t kModDestinationCount = 20;

enum class ModPolarity : uint8_t {
    Normal = 0,
    Inverted
};

/// @brief Declared range of a destination and how a raw offset maps into it.
struct ModDestinationRange {
    float min = 0.0f;
    float max = 1.0f;
    float scale = 1.0f;        ///< Units per unit of raw offset
    bool exponential = false;  ///< Scale is in semitones applied as a ratio
};

inline constexpr float kCutoffModRangeSemitones = 48.0f;
inline constexpr float kDetuneModRangeSemitones = 12.0f;
inline constexpr float kMaxModDetuneSemitones = 24.0f;
inline constexpr float kMaxModGain = 2.0f;

[[nodiscard]] constexpr ModDestinationRange destinationRange(ModDestination dest) noexcept {
    switch (dest) {
        case ModDestination::Cutoff1:
        case ModDestination::Cutoff2:
            return {kMinFilterCutoffHz, kMaxFilterCutoffHz, kCutoffModRangeSemitones, true};
        case ModDestination::AllGain:
        case ModDestination::Osc1Gain:
        case ModDestination::Osc2Gain:
        case ModDestination::Osc3Gain:
            return {0.0f, kMaxModGain, 1.0f, false};
        case ModDestination::AllDetune:
        case ModDestination::Osc1Detune:
        case ModDestination::Osc2Detune:
        case ModDestination::Osc3Detune:
            return {-kMaxModDetuneSemitones, kMaxModDetuneSemitones, kDetuneModRangeSemitones, false};
        case ModDestination::None:
        case ModDestination::Resonance1:
        case ModDestination::Resonance2:
        case ModDestination::AllUniDetune:
        case ModDestination::Osc1UniDetune:
        case ModDestination::Osc2UniDetune:
        case ModDestination::Osc3UniDetune:
        case ModDestination::Osc1PartialLevel:
        case ModDestination::Osc2PartialLevel:
        case ModDestination::Osc3PartialLevel:
            break;
    }
    return {0.0f, 1.0f, 1.0f, false};
}

/// @brief The "All" destination that also feeds a per-module one, or None.
[[nodiscard]] constexpr ModDestination fanOutParent(ModDestination dest) noexcept {
    switch (dest) {
        case ModDestination::Osc1Gain:
        case ModDestination::Osc2Gain:
        case ModDestination::Osc3Gain:
            return ModDestination::AllGain;
        case ModDestination::Osc1Detune:
        case ModDestination::Osc2Detune:
        case ModDestination::Osc3Detune:
            return ModDestination::AllDetune;
        case ModDestination::Osc1UniDetune:
        case ModDestination::Osc2UniDetune:
        case ModDestination::Osc3UniDetune:
            return ModDestination::AllUniDetune;
        default:
            return ModDestination::None;
    }
}

/// @brief Per-module destination for module index 0..2.
[[nodiscard]] constexpr ModDestination moduleDestination(ModDestination first, size_t module) noexcept {
    return static_cast<ModDestination>(static_cast<uint8_t>(first) + static_cast<uint8_t>(module));
}

// =============================================================================
// Routing
// =============================================================================

struct ModRoute {
    ModSource source = ModSource::None;
    ModDestination destination = ModDestination::None;
    float depth = 0.0f;                          ///< [-1, +1]
    ModPolarity polarity = ModPolarity::Normal;
};

inline constexpr size_t kModSlotCount = 4;

using ModRouteTable = std::array<ModRoute, kModSlotCount>;

// =============================================================================
// ModulationMatrix
// =============================================================================

class ModulationMatrix {
public:
    /// @brief Snapshot the route table for this block.
    void beginBlock(const ModRouteTable& routes) noexcept {
        for (size_t i = 0; i < kModSlotCount; ++i) {
            ModRoute r = routes[i];
            r.depth = std::clamp(detail::sanitize(r.depth), -1.0f, 1.0f);
            routes_[i] = r;
        }
    }

    /// @brief Current value of a source. Non-finite values read as 0.
    void setSourceValue(ModSource source, float value) noexcept {
        const auto index = static_cast<size_t>(source);
        if (index == 0 || index >= kModSourceCount) return;
        sources_[index] = detail::sanitize(value);
    }

    [[nodiscard]] float sourceValue(ModSource source) const noexcept {
        const auto index = static_cast<size_t>(source);
        return index < kModSourceCount ? sources_[index] : 0.0f;
    }

    /// @brief Sum of depth * source * polarity over routes targeting dest,
    /// including routes to its "All" parent.
    [[nodiscard]] float rawSum(ModDestination dest) const noexcept {
        if (dest == ModDestination::None) {
            return 0.0f;
        }
        const ModDestination parent = fanOutParent(dest);
        float sum = 0.0f;
        for (const auto& route : routes_) {
            if (route.source == ModSource::None) continue;
            if (route.destination != dest &&
                (parent == ModDestination::None || route.destination != parent)) {
                continue;
            }
            const float sign = (route.polarity == ModPolarity::Inverted) ? -1.0f : 1.0f;
            sum += route.depth * sourceValue(route.source) * sign;
        }
        return sum;
    }

    /// @brief Base value with all routes applied, clamped to the range of dest.
    [[nodiscard]] float resolve(ModDestination dest, float base) const noexcept {
        const ModDestinationRange range = destinationRange(dest);
        const float raw = rawSum(dest);
        float value = range.exponential
            ? base * std::exp2(raw * range.scale / 12.0f)
            : base + raw * range.scale;
        if (detail::isNonFinite(value)) {
            value = base;
        }
        return std::clamp(value, range.min, range.max);
    }

    /// @brief True when any active route targets dest (or its parent).
    [[nodiscard]] bool isModulated(ModDestination dest) const noexcept {
        const ModDestination parent = fanOutParent(dest);
        for (const auto& route : routes_) {
            if (route.source == ModSource::None) continue;
            if (route.destination == dest ||
                (parent != ModDestination::None && route.destination == parent)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] const ModRouteTable& routes() const noexcept { return routes_; }

private:
    ModRouteTable routes_{};
    std::array<float, kModSourceCount> sources_{};
};

} // namespace DSP
} // namespace Actuate
