// ==============================================================================
// Actuate Plugin - Effects Chain
// ==============================================================================
// Master stereo effects chain: eleven units processed in a user-defined order,
// each with its own enable flag, plus a master switch that bypasses the whole
// chain.
//
//   Voice Sum -> order[0] -> order[1] -> ... -> order[10] -> Output
//
// Disabled units are skipped entirely. A unit is reset when it is switched
// on, so it never replays state from before it was bypassed. The order is
// validated as a permutation by setPatch(); an invalid order falls back to
// the default.
// ==============================================================================

#pragma once

#include <actuate/dsp/effects/abass.h>
#include <actuate/dsp/effects/buffer_modulator.h>
#include <actuate/dsp/effects/chorus.h>
#include <actuate/dsp/effects/compressor.h>
#include <actuate/dsp/effects/flanger.h>
#include <actuate/dsp/effects/limiter.h>
#include <actuate/dsp/effects/phaser.h>
#include <actuate/dsp/effects/reverb.h>
#include <actuate/dsp/effects/saturation.h>
#include <actuate/dsp/effects/tempo_delay.h>
#include <actuate/dsp/effects/three_band_eq.h>
#include "actuate_types.h"
#include "synth_patch.h"

#include <array>
#include <cstddef>

namespace Actuate::DSP {

class ActuateEffectsChain {
public:
    ActuateEffectsChain() noexcept = default;

    ActuateEffectsChain(const ActuateEffectsChain&) = delete;
    ActuateEffectsChain& operator=(const ActuateEffectsChain&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Prepare every unit. Allocates delay memory; not real-time safe.
    void prepare(double sampleRate) noexcept {
        eq_.prepare(sampleRate);
        compressor_.prepare(sampleRate);
        abass_.prepare(sampleRate);
        saturation_.prepare(sampleRate);
        delay_.prepare(sampleRate);
        reverb_.prepare(sampleRate);
        phaser_.prepare(sampleRate);
        chorus_.prepare(sampleRate);
        bufferModulator_.prepare(sampleRate);
        flanger_.prepare(sampleRate);
        limiter_.prepare(sampleRate);
        prepared_ = true;
    }

    void reset() noexcept {
        for (size_t i = 0; i < kFxSlotCount; ++i) {
            resetSlot(static_cast<FxSlot>(i));
        }
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setPatch(const EffectsPatch& patch) noexcept {
        masterEnabled_ = patch.masterEnabled;
        order_ = isPermutation(patch.order) ? patch.order : defaultFxOrder();
        for (size_t i = 0; i < kFxSlotCount; ++i) {
            if (patch.enabled[i] && !enabled_[i]) {
                resetSlot(static_cast<FxSlot>(i));
            }
            enabled_[i] = patch.enabled[i];
        }

        eq_.setParams(patch.eq);
        compressor_.setParams(patch.compressor);
        abass_.setParams(patch.abass);
        saturation_.setParams(patch.saturation);
        delay_.setParams(patch.delay);
        reverb_.setParams(patch.reverb);
        phaser_.setParams(patch.phaser);
        chorus_.setParams(patch.chorus);
        bufferModulator_.setParams(patch.bufferModulator);
        flanger_.setParams(patch.flanger);
        limiter_.setParams(patch.limiter);
    }

    /// @brief Host tempo for the tempo-synced delay.
    void setTempo(double bpm) noexcept { delay_.setTempo(bpm); }

    [[nodiscard]] bool isEnabled(FxSlot slot) const noexcept {
        return enabled_[static_cast<size_t>(slot)];
    }
    [[nodiscard]] bool isMasterEnabled() const noexcept { return masterEnabled_; }
    [[nodiscard]] const FxOrder& order() const noexcept { return order_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Process a stereo block in place.
    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        if (!prepared_ || !masterEnabled_ || numSamples == 0) {
            return;
        }
        for (const FxSlot slot : order_) {
            if (!enabled_[static_cast<size_t>(slot)]) continue;
            processSlot(slot, left, right, numSamples);
        }
    }

private:
    void processSlot(FxSlot slot, float* left, float* right, size_t numSamples) noexcept {
        switch (slot) {
            case FxSlot::Eq:              eq_.processBlock(left, right, numSamples); break;
            case FxSlot::Compressor:      compressor_.processBlock(left, right, numSamples); break;
            case FxSlot::ABass:           abass_.processBlock(left, right, numSamples); break;
            case FxSlot::Saturation:      saturation_.processBlock(left, right, numSamples); break;
            case FxSlot::Delay:           delay_.processBlock(left, right, numSamples); break;
            case FxSlot::Reverb:          reverb_.processBlock(left, right, numSamples); break;
            case FxSlot::Phaser:          phaser_.processBlock(left, right, numSamples); break;
            case FxSlot::Chorus:          chorus_.processBlock(left, right, numSamples); break;
            case FxSlot::BufferModulator: bufferModulator_.processBlock(left, right, numSamples); break;
            case FxSlot::Flanger:         flanger_.processBlock(left, right, numSamples); break;
            case FxSlot::Limiter:         limiter_.processBlock(left, right, numSamples); break;
        }
    }

    void resetSlot(FxSlot slot) noexcept {
        switch (slot) {
            case FxSlot::Eq:              eq_.reset(); break;
            case FxSlot::Compressor:      compressor_.reset(); break;
            case FxSlot::ABass:           abass_.reset(); break;
            case FxSlot::Saturation:      saturation_.reset(); break;
            case FxSlot::Delay:           delay_.reset(); break;
            case FxSlot::Reverb:          reverb_.reset(); break;
            case FxSlot::Phaser:          phaser_.reset(); break;
            case FxSlot::Chorus:          chorus_.reset(); break;
            case FxSlot::BufferModulator: bufferModulator_.reset(); break;
            case FxSlot::Flanger:         flanger_.reset(); break;
            case FxSlot::Limiter:         limiter_.reset(); break;
        }
    }

    ThreeBandEq eq_;
    Compressor compressor_;
    ABass abass_;
    Saturation saturation_;
    TempoDelay delay_;
    Reverb reverb_;
    Phaser phaser_;
    Chorus chorus_;
    BufferModulator bufferModulator_;
    Flanger flanger_;
    Limiter limiter_;

    FxOrder order_ = defaultFxOrder();
    std::array<bool, kFxSlotCount> enabled_{};
    bool masterEnabled_ = true;
    bool prepared_ = false;
};

} // namespace Actuate::DSP
