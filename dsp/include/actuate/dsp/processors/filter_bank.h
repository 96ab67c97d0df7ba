// ==============================================================================
// Layer 2: DSP Processor - Voice Filter Bank
// ==============================================================================
// Two stereo filters per voice, each with its own cutoff envelope.
//
// Every filter carries all five topologies for both channels and dispatches
// through a switch on the selected one; only the active topology runs. The
// filter output is a mix of its low, band and high responses, then blended
// with the dry input by the wet amount.
//
// The three audio modules reach the filters through a per-module routing
// (Bypass, Filter1, Filter2, Both). The filters themselves are combined by
// the bank routing:
//   Parallel   out = F1(in1) + F2(in2) + bypass
//   Series12   out = F2(F1(in1) + in2) + bypass
//   Series21   out = F1(F2(in2) + in1) + bypass
//
// Envelope-driven cutoff is updated every kFilterControlInterval samples.
// ==============================================================================

#pragma once

#include <actuate/dsp/core/db_utils.h>
#include <actuate/dsp/core/filter_types.h>
#include <actuate/dsp/primitives/a4i_filter.h>
#include <actuate/dsp/primitives/adsr_envelope.h>
#include <actuate/dsp/primitives/sample_buffer.h>
#include <actuate/dsp/primitives/svf_filter.h>
#include <actuate/dsp/primitives/tilt_filter.h>
#include <actuate/dsp/primitives/v4_filter.h>
#include <actuate/dsp/primitives/vcf_filter.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace Actuate {
namespace DSP {

inline constexpr size_t kNumVoiceFilters = 2;
inline constexpr size_t kNumAudioModules = 3;
inline constexpr size_t kFilterControlInterval = 16;
inline constexpr float kMaxFilterEnvPeakHz = 10000.0f;

enum class FilterRouting : uint8_t {
    Parallel = 0,
    Series12,
    Series21
};

inline constexpr uint8_t kFilterRoutingCount = 3;

enum class ModuleFilterRouting : uint8_t {
    Bypass = 0,
    Filter1,
    Filter2,
    Both
};

inline constexpr uint8_t kModuleFilterRoutingCount = 4;

/// @brief One filter's settings, as carried in a patch snapshot.
struct FilterSettings {
    FilterTopology topology = FilterTopology::SVF;
    ResonanceCurve resonanceCurve = ResonanceCurve::Default;
    float cutoffHz = 20000.0f;
    float resonance = 0.0f;
    float lowMix = 1.0f;
    float bandMix = 0.0f;
    float highMix = 0.0f;
    float wet = 1.0f;
    float envPeakHz = 0.0f;   ///< Cutoff offset at envelope peak, [-10000, 10000]
    EnvelopeShape envelope{};
};

// =============================================================================
// VoiceFilter
// =============================================================================

/// @brief One stereo filter with LP/BP/HP mix and wet blend.
class VoiceFilter {
public:
    void prepare(double sampleRate) noexcept {
        for (auto& ch : channels_) {
            ch.svf.prepare(sampleRate);
            ch.tilt.prepare(sampleRate);
            ch.vcf.prepare(sampleRate);
            ch.v4.prepare(sampleRate);
            ch.a4i.prepare(sampleRate);
        }
        applyCutoff();
        applyResonance();
    }

    void reset() noexcept {
        for (auto& ch : channels_) {
            ch.svf.reset();
            ch.tilt.reset();
            ch.vcf.reset();
            ch.v4.reset();
            ch.a4i.reset();
        }
    }

    void setTopology(FilterTopology topology) noexcept {
        if (topology == topology_) return;
        topology_ = topology;
        // The incoming topology may hold state from an earlier selection
        reset();
        applyCutoff();
        applyResonance();
    }

    void setResonanceCurve(ResonanceCurve curve) noexcept {
        for (auto& ch : channels_) {
            ch.svf.setResonanceCurve(curve);
        }
    }

    void setCutoff(float hz) noexcept {
        hz = std::clamp(detail::isNonFinite(hz) ? kMaxFilterCutoffHz : hz,
                        kMinFilterCutoffHz, kMaxFilterCutoffHz);
        if (hz == cutoff_) return;
        cutoff_ = hz;
        applyCutoff();
    }

    void setResonance(float amount) noexcept {
        amount = std::clamp(detail::sanitize(amount), 0.0f, 1.0f);
        if (amount == resonance_) return;
        resonance_ = amount;
        applyResonance();
    }

    void setMix(float low, float band, float high, float wet) noexcept {
        lowMix_ = std::clamp(detail::sanitize(low), 0.0f, 1.0f);
        bandMix_ = std::clamp(detail::sanitize(band), 0.0f, 1.0f);
        highMix_ = std::clamp(detail::sanitize(high), 0.0f, 1.0f);
        wet_ = std::clamp(detail::sanitize(wet), 0.0f, 1.0f);
    }

    [[nodiscard]] FilterTopology topology() const noexcept { return topology_; }
    [[nodiscard]] float cutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float resonance() const noexcept { return resonance_; }

    [[nodiscard]] StereoFrame process(StereoFrame input) noexcept {
        return {processChannel(channels_[0], input.left),
                processChannel(channels_[1], input.right)};
    }

private:
    struct Channel {
        SvfFilter svf;
        TiltFilter tilt;
        VcfFilter vcf;
        V4Filter v4;
        A4iFilter a4i;
    };

    [[nodiscard]] float processChannel(Channel& ch, float input) noexcept {
        FilterOutputs out{};
        switch (topology_) {
            case FilterTopology::SVF:  out = ch.svf.processSample(input); break;
            case FilterTopology::Tilt: out = ch.tilt.processSample(input); break;
            case FilterTopology::VCF:  out = ch.vcf.processSample(input); break;
            case FilterTopology::V4:   out = ch.v4.processSample(input); break;
            case FilterTopology::A4I:  out = ch.a4i.processSample(input); break;
        }
        const float filtered = lowMix_ * out.low + bandMix_ * out.band + highMix_ * out.high;
        return wet_ * filtered + (1.0f - wet_) * input;
    }

    void applyCutoff() noexcept {
        for (auto& ch : channels_) {
            switch (topology_) {
                case FilterTopology::SVF:  ch.svf.setCutoff(cutoff_); break;
                case FilterTopology::Tilt: ch.tilt.setCutoff(cutoff_); break;
                case FilterTopology::VCF:  ch.vcf.setCutoff(cutoff_); break;
                case FilterTopology::V4:   ch.v4.setCutoff(cutoff_); break;
                case FilterTopology::A4I:  ch.a4i.setCutoff(cutoff_); break;
            }
        }
    }

    void applyResonance() noexcept {
        for (auto& ch : channels_) {
            switch (topology_) {
                case FilterTopology::SVF:  ch.svf.setResonance(resonance_); break;
                case FilterTopology::Tilt: ch.tilt.setResonance(resonance_); break;
                case FilterTopology::VCF:  ch.vcf.setResonance(resonance_); break;
                case FilterTopology::V4:   ch.v4.setResonance(resonance_); break;
                case FilterTopology::A4I:  ch.a4i.setResonance(resonance_); break;
            }
        }
    }

    std::array<Channel, 2> channels_{};
    FilterTopology topology_ = FilterTopology::SVF;
    float cutoff_ = kMaxFilterCutoffHz;
    float resonance_ = 0.0f;
    float lowMix_ = 1.0f;
    float bandMix_ = 0.0f;
    float highMix_ = 0.0f;
    float wet_ = 1.0f;
};

// =============================================================================
// FilterBank
// =============================================================================

class FilterBank {
public:
    void prepare(double sampleRate) noexcept {
        for (size_t i = 0; i < kNumVoiceFilters; ++i) {
            filters_[i].prepare(sampleRate);
            envelopes_[i].prepare(static_cast<float>(sampleRate));
        }
        reset();
    }

    void reset() noexcept {
        for (size_t i = 0; i < kNumVoiceFilters; ++i) {
            filters_[i].reset();
            envelopes_[i].reset();
        }
        controlCounter_ = 0;
    }

    /// @brief Apply everything except cutoff and resonance, which arrive
    /// modulated through setTargets().
    void setSettings(size_t index, const FilterSettings& settings) noexcept {
        if (index >= kNumVoiceFilters) return;
        auto& filter = filters_[index];
        filter.setTopology(settings.topology);
        filter.setResonanceCurve(settings.resonanceCurve);
        filter.setMix(settings.lowMix, settings.bandMix, settings.highMix, settings.wet);
        envelopes_[index].setShape(settings.envelope);
        envPeakHz_[index] = std::clamp(detail::sanitize(settings.envPeakHz),
                                       -kMaxFilterEnvPeakHz, kMaxFilterEnvPeakHz);
    }

    /// @brief Modulated cutoff (Hz) and resonance for this block.
    void setTargets(size_t index, float cutoffHz, float resonance) noexcept {
        if (index >= kNumVoiceFilters) return;
        baseCutoff_[index] = cutoffHz;
        filters_[index].setResonance(resonance);
    }

    void setRouting(FilterRouting routing) noexcept { routing_ = routing; }

    void gate(bool on) noexcept {
        for (auto& env : envelopes_) {
            env.gate(on);
        }
        // Force a cutoff update on the next sample
        controlCounter_ = 0;
    }

    [[nodiscard]] float envelopeLevel(size_t index) const noexcept {
        return index < kNumVoiceFilters ? envelopes_[index].getOutput() : 0.0f;
    }

    [[nodiscard]] const VoiceFilter& filter(size_t index) const noexcept { return filters_[index]; }

    /// @brief Filter one frame of the three module outputs.
    [[nodiscard]] StereoFrame process(
        const std::array<StereoFrame, kNumAudioModules>& modules,
        const std::array<ModuleFilterRouting, kNumAudioModules>& routing) noexcept {
        for (auto& env : envelopes_) {
            (void)env.process();
        }
        if (controlCounter_ == 0) {
            updateCutoffs();
        }
        controlCounter_ = (controlCounter_ + 1) % kFilterControlInterval;

        StereoFrame in1{};
        StereoFrame in2{};
        StereoFrame bypass{};
        for (size_t m = 0; m < kNumAudioModules; ++m) {
            const StereoFrame& s = modules[m];
            switch (routing[m]) {
                case ModuleFilterRouting::Bypass:
                    bypass = add(bypass, s);
                    break;
                case ModuleFilterRouting::Filter1:
                    in1 = add(in1, s);
                    break;
                case ModuleFilterRouting::Filter2:
                    in2 = add(in2, s);
                    break;
                case ModuleFilterRouting::Both:
                    in1 = add(in1, s);
                    in2 = add(in2, s);
                    break;
            }
        }

        StereoFrame out{};
        switch (routing_) {
            case FilterRouting::Parallel:
                out = add(filters_[0].process(in1), filters_[1].process(in2));
                break;
            case FilterRouting::Series12:
                out = filters_[1].process(add(filters_[0].process(in1), in2));
                break;
            case FilterRouting::Series21:
                out = filters_[0].process(add(filters_[1].process(in2), in1));
                break;
        }
        return add(out, bypass);
    }

private:
    [[nodiscard]] static StereoFrame add(StereoFrame a, StereoFrame b) noexcept {
        return {a.left + b.left, a.right + b.right};
    }

    void updateCutoffs() noexcept {
        for (size_t i = 0; i < kNumVoiceFilters; ++i) {
            filters_[i].setCutoff(baseCutoff_[i] + envPeakHz_[i] * envelopes_[i].getOutput());
        }
    }

    std::array<VoiceFilter, kNumVoiceFilters> filters_{};
    std::array<ADSREnvelope, kNumVoiceFilters> envelopes_{};
    std::array<float, kNumVoiceFilters> baseCutoff_{kMaxFilterCutoffHz, kMaxFilterCutoffHz};
    std::array<float, kNumVoiceFilters> envPeakHz_{};
    FilterRouting routing_ = FilterRouting::Parallel;
    size_t controlCounter_ = 0;
};

} // namespace DSP
} // namespace Actuate
