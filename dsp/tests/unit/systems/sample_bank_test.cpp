// ==============================================================================
// Layer 3: System Component - SampleBank Tests
// ==============================================================================
// Bank construction in both playback modes and the lifetime rules of the
// slot that hands banks to the audio thread.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/systems/sample_bank.h>

#include <cmath>
#include <memory>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

std::shared_ptr<const SampleBuffer> makeSine(float frequency, size_t frames, double rate = 44100.0) {
    std::vector<float> data(frames);
    for (size_t i = 0; i < frames; ++i) {
        data[i] = 0.5f * std::sin(6.283185307f * frequency * static_cast<float>(i)
                                  / static_cast<float>(rate));
    }
    return SampleBuffer::fromChannels(std::move(data), {}, rate);
}

} // namespace

TEST_CASE("SampleBank build rejects a missing source", "[sample_bank]") {
    REQUIRE(SampleBank::build(nullptr, {}) == nullptr);
}

TEST_CASE("Restretch bank plays the source at the note ratio", "[sample_bank]") {
    auto bank = SampleBank::build(makeSine(440.0f, 4096), {true});
    REQUIRE(bank != nullptr);
    REQUIRE(bank->restretch());
    REQUIRE(bank->shiftedCount() == 0);

    const auto root = bank->select(static_cast<float>(kSampleRootNote));
    REQUIRE(root.buffer == &bank->source());
    REQUIRE(root.rate == Approx(1.0));

    REQUIRE(bank->select(72.0f).rate == Approx(2.0));
    REQUIRE(bank->select(48.0f).rate == Approx(0.5));
}

TEST_CASE("Pitch-shift bank keeps one buffer per note", "[sample_bank][pitch_shift]") {
    SampleBankOptions options;
    options.restretch = false;
    options.lowNote = 58;
    options.highNote = 62;
    auto source = makeSine(440.0f, 8192);
    auto bank = SampleBank::build(source, options);

    REQUIRE(bank != nullptr);
    REQUIRE(bank->shiftedCount() == 5);

    SECTION("each note plays its own buffer at unity rate") {
        const auto sel = bank->select(61.0f);
        REQUIRE(sel.buffer != &bank->source());
        REQUIRE(sel.rate == Approx(1.0));
        REQUIRE(sel.buffer->numFrames() == source->numFrames());
    }

    SECTION("fractional notes bend the nearest buffer") {
        const auto sel = bank->select(60.5f);
        REQUIRE(sel.rate == Approx(std::exp2(-0.5 / 12.0)).epsilon(1e-4));
    }

    SECTION("notes outside the range use the edge buffer") {
        const auto sel = bank->select(70.0f);
        REQUIRE(sel.buffer == bank->select(62.0f).buffer);
        REQUIRE(sel.rate == Approx(std::exp2(8.0 / 12.0)).epsilon(1e-4));
    }
}

TEST_CASE("Single-cycle selection spans the buffer once per period", "[sample_bank]") {
    auto bank = SampleBank::build(makeSine(440.0f, 441), {true});
    const auto sel = bank->selectSingleCycle(100.0f);
    REQUIRE(sel.rate == Approx(1.0));
}

TEST_CASE("SampleBankSlot publishes and retires banks", "[sample_bank][slot]") {
    SampleBankSlot slot;
    REQUIRE(slot.acquire() == nullptr);

    auto first = SampleBank::build(makeSine(440.0f, 1024), {true});
    std::weak_ptr<const SampleBank> firstWeak = first;
    slot.publish(first);
    first.reset();
    REQUIRE(slot.acquire() == slot.current().get());

    SECTION("a replaced bank stays alive until the audio side moves on") {
        slot.publish(SampleBank::build(makeSine(220.0f, 1024), {true}));
        REQUIRE(slot.retiredCount() == 1);
        slot.collect();
        REQUIRE_FALSE(firstWeak.expired());

        (void)slot.acquire();
        slot.collect();
        REQUIRE(slot.retiredCount() == 0);
        REQUIRE(firstWeak.expired());
    }

    SECTION("publishing nullptr clears the slot") {
        slot.publish(nullptr);
        REQUIRE(slot.acquire() == nullptr);
        slot.collect();
        REQUIRE(firstWeak.expired());
    }
}
