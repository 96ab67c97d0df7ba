// ==============================================================================
// Unit Test: Engine Plumbing
// ==============================================================================
// PatchPublisher triple buffer and NoteEventQueue block draining.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/note_event_queue.h"
#include "engine/patch_publisher.h"

#include <memory>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

NoteEvent noteOnAt(uint8_t note, uint32_t offset) {
    NoteEvent e;
    e.type = NoteEvent::Type::NoteOn;
    e.note = note;
    e.velocity = 100;
    e.sampleOffset = offset;
    return e;
}

} // anonymous namespace

TEST_CASE("PatchPublisher hands over the latest snapshot", "[engine][publisher]") {
    auto publisher = std::make_unique<PatchPublisher>();

    SECTION("nothing published reports unchanged defaults") {
        bool changed = true;
        const auto& patch = publisher->acquire(changed);
        REQUIRE_FALSE(changed);
        REQUIRE(patch.masterGain == Approx(1.0f));
    }

    SECTION("a publish is seen exactly once") {
        SynthPatch patch;
        patch.masterGain = 0.25f;
        publisher->publish(patch);

        bool changed = false;
        REQUIRE(publisher->acquire(changed).masterGain == Approx(0.25f));
        REQUIRE(changed);

        REQUIRE(publisher->acquire(changed).masterGain == Approx(0.25f));
        REQUIRE_FALSE(changed);
    }

    SECTION("intermediate publishes are skipped") {
        SynthPatch patch;
        for (int i = 1; i <= 5; ++i) {
            patch.masterGain = 0.1f * static_cast<float>(i);
            publisher->publish(patch);
        }
        bool changed = false;
        REQUIRE(publisher->acquire(changed).masterGain == Approx(0.5f));
        REQUIRE(changed);
        REQUIRE(publisher->publishCount() == 5);
    }

    SECTION("alternating publish and acquire never returns a stale patch") {
        SynthPatch patch;
        for (int i = 0; i < 20; ++i) {
            patch.voiceCount = static_cast<size_t>(1 + i % 32);
            publisher->publish(patch);
            bool changed = false;
            INFO("iteration " << i);
            REQUIRE(publisher->acquire(changed).voiceCount == patch.voiceCount);
            REQUIRE(changed);
        }
    }
}

TEST_CASE("NoteEventQueue drains sorted by offset", "[engine][events]") {
    auto queue = std::make_unique<NoteEventQueue>();

    SECTION("events pushed out of order come back sorted") {
        REQUIRE(queue->push(noteOnAt(60, 200)));
        REQUIRE(queue->push(noteOnAt(62, 10)));
        REQUIRE(queue->push(noteOnAt(64, 100)));

        REQUIRE(queue->drain(256) == 3);
        REQUIRE(queue->event(0).note == 62);
        REQUIRE(queue->event(1).note == 64);
        REQUIRE(queue->event(2).note == 60);
    }

    SECTION("equal offsets keep arrival order") {
        REQUIRE(queue->push(noteOnAt(60, 5)));
        REQUIRE(queue->push(noteOnAt(61, 5)));
        REQUIRE(queue->push(noteOnAt(62, 0)));

        REQUIRE(queue->drain(64) == 3);
        REQUIRE(queue->event(0).note == 62);
        REQUIRE(queue->event(1).note == 60);
        REQUIRE(queue->event(2).note == 61);
    }

    SECTION("offsets past the block clamp to its last sample") {
        REQUIRE(queue->push(noteOnAt(60, 5000)));
        REQUIRE(queue->drain(128) == 1);
        REQUIRE(queue->event(0).sampleOffset == 127);
    }

    SECTION("drain empties the queue") {
        REQUIRE(queue->push(noteOnAt(60, 0)));
        REQUIRE(queue->drain(64) == 1);
        REQUIRE(queue->drain(64) == 0);
        REQUIRE(queue->size() == 0);
    }

    SECTION("full queue refuses new events") {
        size_t accepted = 0;
        while (queue->push(noteOnAt(60, 0))) {
            ++accepted;
            REQUIRE(accepted < 2 * kNoteEventQueueCapacity);
        }
        REQUIRE(accepted == kNoteEventQueueCapacity - 1);
    }

    SECTION("clear discards pending events") {
        REQUIRE(queue->push(noteOnAt(60, 0)));
        queue->clear();
        REQUIRE(queue->drain(64) == 0);
    }
}
