// ==============================================================================
// Unit Test: Audio Thread Allocation Safety
// ==============================================================================
// Replaces the global operator new for this executable and verifies that the
// engine's processBlock() never reaches the heap, including while notes,
// patches, sample banks and effect changes are picked up.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "engine/actuate_engine.h"
#include "allocation_detector.h"

#include <cmath>
#include <cstdlib>
#include <new>
#include <vector>

using namespace Actuate::DSP;
using TestHelpers::AllocationDetector;
using TestHelpers::AllocationScope;

// Override global operator new for allocation tracking
void* operator new(std::size_t size) {
    AllocationDetector::instance().recordAllocation();
    void* p = std::malloc(size);
    if (!p) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept {
    std::free(p);
}

void operator delete(void* p, [[maybe_unused]] std::size_t size) noexcept {
    std::free(p);
}

namespace {

constexpr double kSampleRate = 44100.0;
constexpr size_t kBlockSize = 256;

NoteEvent makeNote(NoteEvent::Type type, uint8_t note, uint32_t offset) {
    NoteEvent e;
    e.type = type;
    e.note = note;
    e.velocity = 100;
    e.sampleOffset = offset;
    return e;
}

SynthPatch busyPatch() {
    SynthPatch patch;
    patch.unisonCount = 3;
    patch.modules[0].type = AudioModuleType::Oscillator;
    patch.modules[0].shape = OscShape::Saw;
    patch.modules[1].type = AudioModuleType::Additive;
    patch.modules[2].type = AudioModuleType::Granulizer;
    patch.modules[2].loop = true;
    patch.fm.oneToTwo = 0.5f;
    patch.lfos[0].enabled = true;
    patch.modRoutes[0] = {ModSource::Lfo1, ModDestination::Cutoff1, 0.5f, ModPolarity::Normal};
    patch.filters[0].resonance = 0.6f;
    patch.filters[0].cutoffHz = 1200.0f;
    for (auto& enabled : patch.effects.enabled) {
        enabled = true;
    }
    patch.effects.reverb.amount = 0.5f;
    patch.effects.delay.amount = 0.5f;
    return patch;
}

} // anonymous namespace

TEST_CASE("processBlock performs no heap allocation", "[engine][realtime]") {
    ActuateEngine engine;
    engine.publishPatch(busyPatch());
    engine.prepare(SynthContext::create(kSampleRate, kBlockSize));

    std::vector<float> pcm(4096);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = std::sin(kTwoPi * 220.0f * static_cast<float>(i) / static_cast<float>(kSampleRate));
    }
    auto buffer = SampleBuffer::fromInterleaved(pcm.data(), 1, pcm.size(), kSampleRate, kSampleRate);
    engine.setSampleBank(2, SampleBank::build(buffer, {true}));

    std::vector<float> left(kBlockSize);
    std::vector<float> right(kBlockSize);

    // Warm-up block outside the tracked scope
    engine.processBlock(left.data(), right.data(), kBlockSize);

    for (uint8_t n = 0; n < 12; ++n) {
        REQUIRE(engine.pushEvent(makeNote(NoteEvent::Type::NoteOn, static_cast<uint8_t>(48 + n),
                                          static_cast<uint32_t>(n * 16))));
    }
    auto changed = busyPatch();
    changed.masterWidth = 1.5f;
    changed.effects.order[0] = FxSlot::Limiter;
    changed.effects.order[10] = FxSlot::Eq;
    engine.publishPatch(changed);

    AllocationScope scope;
    for (int block = 0; block < 200; ++block) {
        if (block == 100) {
            for (uint8_t n = 0; n < 12; ++n) {
                (void)engine.pushEvent(makeNote(NoteEvent::Type::NoteOff,
                                                static_cast<uint8_t>(48 + n), 0));
            }
        }
        engine.processBlock(left.data(), right.data(), kBlockSize);
    }
    const size_t allocations = scope.stop();

    INFO("processBlock caused " << allocations << " allocations");
    REQUIRE(allocations == 0);
    REQUIRE(engine.getActiveVoiceCount() <= ActuateEngine::kMaxPolyphony);
}
