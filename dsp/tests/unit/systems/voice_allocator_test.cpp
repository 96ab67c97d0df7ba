// ==============================================================================
// Layer 3: System Component - VoiceAllocator Tests
// ==============================================================================
// Note-on/off bookkeeping, oldest-voice stealing, unison groups, and
// polyphony changes.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/systems/voice_allocator.h>

#include <algorithm>
#include <span>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

size_t countType(std::span<const VoiceEvent> events, VoiceEvent::Type type) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [type](const VoiceEvent& e) { return e.type == type; }));
}

std::vector<VoiceEvent> copy(std::span<const VoiceEvent> events) {
    return {events.begin(), events.end()};
}

} // namespace

TEST_CASE("VoiceAllocator constants", "[voice_allocator]") {
    REQUIRE(VoiceAllocator::kMaxVoices == 32);
    REQUIRE(VoiceAllocator::kDefaultVoiceCount == 16);
    REQUIRE(VoiceAllocator::kMaxUnisonCount == 9);
}

TEST_CASE("Note-on claims an idle voice with the note frequency", "[voice_allocator]") {
    VoiceAllocator alloc;
    const auto events = copy(alloc.noteOn(69, 100));

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == VoiceEvent::Type::NoteOn);
    REQUIRE(events[0].note == 69);
    REQUIRE(events[0].velocity == 100);
    REQUIRE(events[0].frequency == Approx(440.0f));
    REQUIRE(alloc.getActiveVoiceCount() == 1);
    REQUIRE(alloc.getVoiceNote(events[0].voiceIndex) == 69);
}

TEST_CASE("Note-off releases, voiceFinished returns to the pool", "[voice_allocator]") {
    VoiceAllocator alloc;
    const auto on = copy(alloc.noteOn(60, 90));
    const size_t v = on[0].voiceIndex;

    const auto off = copy(alloc.noteOff(60));
    REQUIRE(off.size() == 1);
    REQUIRE(off[0].type == VoiceEvent::Type::NoteOff);
    REQUIRE(alloc.getVoiceState(v) == VoiceState::Releasing);
    REQUIRE(alloc.getActiveVoiceCount() == 1);

    alloc.voiceFinished(v);
    REQUIRE(alloc.getVoiceState(v) == VoiceState::Idle);
    REQUIRE(alloc.getActiveVoiceCount() == 0);
    REQUIRE(alloc.getVoiceNote(v) == -1);
}

TEST_CASE("Velocity 0 note-on is a note-off", "[voice_allocator]") {
    VoiceAllocator alloc;
    (void)alloc.noteOn(64, 100);
    const auto events = copy(alloc.noteOn(64, 0));
    REQUIRE(countType(events, VoiceEvent::Type::NoteOff) == 1);
}

TEST_CASE("Unknown note-off yields no events", "[voice_allocator]") {
    VoiceAllocator alloc;
    REQUIRE(alloc.noteOff(42).empty());
}

TEST_CASE("N+1 notes steal the oldest voice", "[voice_allocator][stealing]") {
    VoiceAllocator alloc;
    (void)alloc.setVoiceCount(4);

    std::vector<size_t> voices;
    for (uint8_t note = 60; note < 64; ++note) {
        voices.push_back(alloc.noteOn(note, 100)[0].voiceIndex);
    }
    REQUIRE(alloc.getActiveVoiceCount() == 4);

    const auto events = copy(alloc.noteOn(72, 100));
    REQUIRE(countType(events, VoiceEvent::Type::Steal) == 1);
    REQUIRE(countType(events, VoiceEvent::Type::NoteOn) == 1);

    const auto steal = *std::find_if(events.begin(), events.end(),
        [](const VoiceEvent& e) { return e.type == VoiceEvent::Type::Steal; });
    REQUIRE(steal.voiceIndex == voices[0]);
    REQUIRE(steal.note == 60);

    REQUIRE(alloc.getActiveVoiceCount() == 4);
    REQUIRE(alloc.getVoiceNote(voices[0]) == 72);
}

TEST_CASE("Releasing voices are stolen before held ones", "[voice_allocator][stealing]") {
    VoiceAllocator alloc;
    (void)alloc.setVoiceCount(3);
    const size_t first = alloc.noteOn(60, 100)[0].voiceIndex;
    const size_t second = alloc.noteOn(62, 100)[0].voiceIndex;
    (void)alloc.noteOn(64, 100);
    (void)alloc.noteOff(62);

    const auto events = copy(alloc.noteOn(67, 100));
    const auto steal = *std::find_if(events.begin(), events.end(),
        [](const VoiceEvent& e) { return e.type == VoiceEvent::Type::Steal; });
    REQUIRE(steal.voiceIndex == second);
    REQUIRE(alloc.getVoiceNote(first) == 60);
}

TEST_CASE("Re-striking a held note reuses its voice", "[voice_allocator]") {
    VoiceAllocator alloc;
    const size_t v = alloc.noteOn(60, 100)[0].voiceIndex;
    const auto events = copy(alloc.noteOn(60, 50));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == VoiceEvent::Type::NoteOn);
    REQUIRE(events[0].voiceIndex == v);
    REQUIRE(alloc.getActiveVoiceCount() == 1);
}

TEST_CASE("Unison allocates a group per note", "[voice_allocator][unison]") {
    VoiceAllocator alloc;
    (void)alloc.setVoiceCount(8);
    alloc.setUnisonCount(3);

    const auto events = copy(alloc.noteOn(60, 100));
    REQUIRE(events.size() == 3);
    for (size_t i = 0; i < events.size(); ++i) {
        REQUIRE(events[i].unisonIndex == i);
        REQUIRE(events[i].unisonCount == 3);
    }

    SECTION("a note-off releases the whole group") {
        REQUIRE(countType(alloc.noteOff(60), VoiceEvent::Type::NoteOff) == 3);
    }

    SECTION("stealing takes the whole oldest group") {
        (void)alloc.noteOn(62, 100);
        const auto stolen = copy(alloc.noteOn(64, 100));
        REQUIRE(countType(stolen, VoiceEvent::Type::Steal) == 3);
        REQUIRE(countType(stolen, VoiceEvent::Type::NoteOn) == 3);
        REQUIRE(alloc.getActiveVoiceCount() == 6);
    }
}

TEST_CASE("Unison count is limited by the voice count", "[voice_allocator][unison]") {
    VoiceAllocator alloc;
    (void)alloc.setVoiceCount(2);
    alloc.setUnisonCount(9);
    REQUIRE(alloc.noteOn(60, 100).size() == 2);
}

TEST_CASE("Reducing polyphony releases voices above the new count", "[voice_allocator]") {
    VoiceAllocator alloc;
    for (uint8_t note = 60; note < 68; ++note) {
        (void)alloc.noteOn(note, 100);
    }
    const auto events = copy(alloc.setVoiceCount(4));
    REQUIRE(countType(events, VoiceEvent::Type::NoteOff) == 4);
    for (const auto& e : events) {
        REQUIRE(e.voiceIndex >= 4);
    }
    REQUIRE(alloc.getVoiceCount() == 4);

    (void)alloc.setVoiceCount(0);
    REQUIRE(alloc.getVoiceCount() == 1);
    (void)alloc.setVoiceCount(100);
    REQUIRE(alloc.getVoiceCount() == VoiceAllocator::kMaxVoices);
}

TEST_CASE("Pitch bend and tuning shift the note frequency", "[voice_allocator]") {
    VoiceAllocator alloc;
    alloc.setPitchBend(12.0f);
    REQUIRE(alloc.noteFrequency(69) == Approx(880.0f));

    alloc.setPitchBend(0.0f);
    alloc.setTuningReference(432.0f);
    REQUIRE(alloc.noteFrequency(69) == Approx(432.0f));

    alloc.setTuningReference(-1.0f);
    REQUIRE(alloc.noteFrequency(69) == Approx(432.0f));
}

TEST_CASE("allNotesOff releases every held voice", "[voice_allocator]") {
    VoiceAllocator alloc;
    (void)alloc.noteOn(60, 100);
    (void)alloc.noteOn(64, 100);
    (void)alloc.noteOn(67, 100);
    REQUIRE(countType(alloc.allNotesOff(), VoiceEvent::Type::NoteOff) == 3);
    REQUIRE(alloc.getActiveVoiceCount() == 3);
}
