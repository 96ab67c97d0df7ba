// ==============================================================================
// Unit Test: Actuate Engine
// ==============================================================================
// Drives ActuateEngine directly with hand-built patches: pitch, level,
// polyphony limits, sample-accurate events and diagnostics.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/actuate_engine.h"
#include "signal_metrics.h"

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;
namespace Metrics = Actuate::DSP::TestUtils::SignalMetrics;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr size_t kBlockSize = 512;

SynthPatch sinePatch() {
    SynthPatch patch;
    patch.modules[0].type = AudioModuleType::Oscillator;
    patch.modules[0].shape = OscShape::Sine;
    return patch;
}

NoteEvent noteOn(uint8_t note, uint8_t velocity = 100, uint32_t offset = 0) {
    NoteEvent e;
    e.type = NoteEvent::Type::NoteOn;
    e.note = note;
    e.velocity = velocity;
    e.sampleOffset = offset;
    return e;
}

NoteEvent noteOff(uint8_t note, uint32_t offset = 0) {
    NoteEvent e;
    e.type = NoteEvent::Type::NoteOff;
    e.note = note;
    e.sampleOffset = offset;
    return e;
}

struct Render {
    std::vector<float> left;
    std::vector<float> right;
};

Render render(ActuateEngine& engine, size_t numSamples, size_t blockSize = kBlockSize) {
    Render out{std::vector<float>(numSamples), std::vector<float>(numSamples)};
    for (size_t pos = 0; pos < numSamples; pos += blockSize) {
        const size_t n = std::min(blockSize, numSamples - pos);
        engine.processBlock(out.left.data() + pos, out.right.data() + pos, n);
    }
    return out;
}

void prepareEngine(ActuateEngine& engine, const SynthPatch& patch,
                   size_t maxBlock = kBlockSize) {
    engine.publishPatch(patch);
    engine.prepare(SynthContext::create(kSampleRate, maxBlock));
}

size_t countDiagnostics(ActuateEngine& engine, ActuateError code) {
    size_t count = 0;
    Diagnostic d;
    while (engine.diagnostics().pop(d)) {
        if (d.code == code) ++count;
    }
    return count;
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("Unprepared engine renders silence", "[engine]") {
    ActuateEngine engine;
    REQUIRE_FALSE(engine.isPrepared());
    std::vector<float> l(kBlockSize, 1.0f);
    std::vector<float> r(kBlockSize, 1.0f);
    REQUIRE(engine.pushEvent(noteOn(60)));
    engine.processBlock(l.data(), r.data(), kBlockSize);
    REQUIRE(Metrics::isSilent(l.data(), l.size(), 0.0f));
    REQUIRE(Metrics::isSilent(r.data(), r.size(), 0.0f));
}

TEST_CASE("Engine is silent without notes", "[engine]") {
    ActuateEngine engine;
    prepareEngine(engine, sinePatch());
    REQUIRE(engine.isPrepared());
    const auto out = render(engine, 4096);
    REQUIRE(Metrics::isSilent(out.left.data(), out.left.size(), 0.0f));
    REQUIRE(engine.getActiveVoiceCount() == 0);
}

// =============================================================================
// Pitch and Level
// =============================================================================

TEST_CASE("Middle C renders at 261.63 Hz through the output stage", "[engine][e2e]") {
    ActuateEngine engine;
    prepareEngine(engine, sinePatch());
    REQUIRE(engine.pushEvent(noteOn(60)));

    const auto out = render(engine, 44100);
    const float* tail = out.left.data() + 22050;
    REQUIRE(Metrics::allFinite(out.left.data(), out.left.size()));
    REQUIRE(Metrics::dominantFrequency(tail, 22050, kSampleRate, 240.0, 280.0, 0.25)
            == Approx(261.63).margin(1.0));

    // Sustain 1.0, centre pan -3 dB per side, master gain 1.0
    const float expected = 1.0f * 0.70710678f * 1.0f;
    REQUIRE(Metrics::peak(tail, 22050) == Approx(expected).margin(0.005));
    REQUIRE(Metrics::peak(out.right.data() + 22050, 22050) == Approx(expected).margin(0.005));

    // The output stage leaves a single voice undistorted
    const double h1 = Metrics::goertzelMagnitude(tail, 22050, 261.63, kSampleRate);
    const double h3 = Metrics::goertzelMagnitude(tail, 22050, 3.0 * 261.63, kSampleRate);
    REQUIRE(h1 == Approx(expected).margin(0.01));
    REQUIRE(h3 < 0.005 * h1);
}

TEST_CASE("Soft limit is transparent below the knee and bounded above it", "[engine][output]") {
    for (float x : {0.0f, 0.25f, -0.5f, 0.7071f, -0.9f}) {
        INFO("x = " << x);
        REQUIRE(ActuateEngine::softLimit(x) == x);
    }
    float previous = ActuateEngine::softLimit(0.9f);
    for (float x = 0.95f; x < 20.0f; x += 0.05f) {
        const float y = ActuateEngine::softLimit(x);
        REQUIRE(y >= previous);
        REQUIRE(y < 1.0f + 1e-6f);
        REQUIRE(ActuateEngine::softLimit(-x) == -y);
        previous = y;
    }
}

TEST_CASE("Master gain scales the output linearly below the knee", "[engine][output]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.masterGain = 0.5f;
    prepareEngine(engine, patch);
    REQUIRE(engine.pushEvent(noteOn(60)));

    const auto out = render(engine, 44100);
    REQUIRE(Metrics::peak(out.left.data() + 22050, 22050)
            == Approx(0.5f * 0.70710678f).margin(0.005));
}

TEST_CASE("Pitch bend retunes sounding voices", "[engine][e2e]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.pitchBendRange = 2.0f;
    prepareEngine(engine, patch);
    REQUIRE(engine.pushEvent(noteOn(69)));

    NoteEvent bend;
    bend.type = NoteEvent::Type::PitchBend;
    bend.value = 1.0f;
    REQUIRE(engine.pushEvent(bend));

    const auto out = render(engine, 44100);
    REQUIRE(Metrics::dominantFrequency(out.left.data() + 22050, 22050, kSampleRate,
                                       450.0, 520.0, 0.25)
            == Approx(440.0 * std::pow(2.0, 2.0 / 12.0)).margin(1.5));
}

TEST_CASE("Master gain of zero silences the output", "[engine]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.masterGain = 0.0f;
    prepareEngine(engine, patch);
    REQUIRE(engine.pushEvent(noteOn(60)));
    const auto out = render(engine, 8192);
    REQUIRE(Metrics::isSilent(out.left.data(), out.left.size(), 0.0f));
}

TEST_CASE("Output never exceeds unity", "[engine][safety]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.masterGain = 2.0f;
    patch.modules[0].shape = OscShape::Square;
    patch.modules[1] = patch.modules[0];
    patch.modules[2] = patch.modules[0];
    prepareEngine(engine, patch);
    for (uint8_t n = 48; n < 60; ++n) {
        REQUIRE(engine.pushEvent(noteOn(n)));
    }
    const auto out = render(engine, 22050);
    REQUIRE(Metrics::peak(out.left) <= 1.0f);
    REQUIRE(Metrics::peak(out.right) <= 1.0f);
    REQUIRE(Metrics::allFinite(out.left.data(), out.left.size()));
}

// =============================================================================
// Voice Management
// =============================================================================

TEST_CASE("Notes beyond the voice count steal the oldest voice", "[engine][voices]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.voiceCount = 2;
    prepareEngine(engine, patch);

    REQUIRE(engine.pushEvent(noteOn(60)));
    REQUIRE(engine.pushEvent(noteOn(64, 100, 10)));
    REQUIRE(engine.pushEvent(noteOn(67, 100, 20)));
    (void)render(engine, kBlockSize);

    REQUIRE(engine.getActiveVoiceCount() == 2);
    bool has60 = false;
    bool has64 = false;
    bool has67 = false;
    for (size_t v = 0; v < ActuateEngine::kMaxPolyphony; ++v) {
        if (!engine.voice(v).isActive()) continue;
        has60 = has60 || engine.voice(v).note() == 60;
        has64 = has64 || engine.voice(v).note() == 64;
        has67 = has67 || engine.voice(v).note() == 67;
    }
    REQUIRE_FALSE(has60);
    REQUIRE(has64);
    REQUIRE(has67);
}

TEST_CASE("Released voices free up after their release", "[engine][voices]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.modules[0].ampEnvelope.releaseMs = 10.0f;
    prepareEngine(engine, patch);

    REQUIRE(engine.pushEvent(noteOn(60)));
    (void)render(engine, 4096);
    REQUIRE(engine.getActiveVoiceCount() == 1);

    REQUIRE(engine.pushEvent(noteOff(60)));
    (void)render(engine, 22050);
    REQUIRE(engine.getActiveVoiceCount() == 0);
}

TEST_CASE("Note-on with velocity zero releases the note", "[engine][voices]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.modules[0].ampEnvelope.releaseMs = 5.0f;
    prepareEngine(engine, patch);

    REQUIRE(engine.pushEvent(noteOn(60)));
    (void)render(engine, 1024);
    REQUIRE(engine.pushEvent(noteOn(60, 0)));
    (void)render(engine, 22050);
    REQUIRE(engine.getActiveVoiceCount() == 0);
}

TEST_CASE("Released voice survives silent stretches of its own output", "[engine][voices]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.modules[0].ampEnvelope.releaseMs = 2000.0f;
    // Square LFO gates module 1 between gain 0 and gain 2 every 250 ms
    patch.lfos[0].enabled = true;
    patch.lfos[0].waveform = LfoWaveform::Square;
    patch.lfos[0].rateHz = 2.0f;
    patch.modRoutes[0] = {ModSource::Lfo1, ModDestination::Osc1Gain, -1.0f, ModPolarity::Normal};
    prepareEngine(engine, patch);

    REQUIRE(engine.pushEvent(noteOn(60)));
    (void)render(engine, 22050);
    REQUIRE(engine.pushEvent(noteOff(60)));

    SECTION("the voice stays through the release") {
        // Each half second spans one silent and one loud LFO half-cycle
        for (int half = 0; half < 3; ++half) {
            const auto out = render(engine, 22050);
            INFO("half second " << half << " after note-off");
            REQUIRE(engine.getActiveVoiceCount() == 1);
            REQUIRE(Metrics::peak(out.left) > 0.05f);
        }
    }

    SECTION("the voice retires once the release has run out") {
        (void)render(engine, 110250);
        REQUIRE(engine.getActiveVoiceCount() == 0);
    }
}

TEST_CASE("Granulizer keeps sounding through its release", "[engine][voices][samples]") {
    ActuateEngine engine;
    SynthPatch patch;
    patch.modules[0].type = AudioModuleType::Granulizer;
    patch.modules[0].loop = true;
    patch.modules[0].grains = {1024, 0, 128};
    patch.modules[0].ampEnvelope.releaseMs = 1000.0f;
    prepareEngine(engine, patch);

    std::vector<float> pcm(44100);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = 0.5f * std::sin(kTwoPi * 261.63f * static_cast<float>(i) / 44100.0f);
    }
    auto buffer = SampleBuffer::fromInterleaved(pcm.data(), 1, pcm.size(), kSampleRate, kSampleRate);
    REQUIRE(buffer != nullptr);
    engine.setSampleBank(0, SampleBank::build(buffer, {true}));

    REQUIRE(engine.pushEvent(noteOn(60)));
    (void)render(engine, 11025);
    REQUIRE(engine.pushEvent(noteOff(60)));

    // Release runs from full level over 1000 ms; 0.8 s in, it is still audible
    for (int tenth = 0; tenth < 8; ++tenth) {
        const auto out = render(engine, 4410);
        INFO("tenth of a second " << tenth << " after note-off");
        REQUIRE(engine.getActiveVoiceCount() == 1);
        REQUIRE(Metrics::rms(out.left) > 0.005f);
    }

    (void)render(engine, 22050);
    REQUIRE(engine.getActiveVoiceCount() == 0);
}

TEST_CASE("Unison stacks voices per note", "[engine][voices]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.unisonCount = 3;
    prepareEngine(engine, patch);
    REQUIRE(engine.pushEvent(noteOn(60)));
    (void)render(engine, kBlockSize);
    REQUIRE(engine.getActiveVoiceCount() == 3);
}

// =============================================================================
// Events
// =============================================================================

TEST_CASE("Note-on is sample accurate", "[engine][events]") {
    ActuateEngine engine;
    auto patch = sinePatch();
    patch.modules[0].shape = OscShape::Square;
    prepareEngine(engine, patch);

    REQUIRE(engine.pushEvent(noteOn(60, 100, 300)));
    const auto out = render(engine, kBlockSize);
    REQUIRE(Metrics::isSilent(out.left.data(), 300, 0.0f));
    REQUIRE_FALSE(Metrics::isSilent(out.left.data() + 300, kBlockSize - 300));
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_CASE("Oversized blocks render in pieces and report an overrun", "[engine][diagnostics]") {
    ActuateEngine engine;
    prepareEngine(engine, sinePatch(), 256);
    REQUIRE(engine.pushEvent(noteOn(60)));

    std::vector<float> l(1024);
    std::vector<float> r(1024);
    engine.processBlock(l.data(), r.data(), l.size());
    REQUIRE(Metrics::allFinite(l.data(), l.size()));
    REQUIRE_FALSE(Metrics::isSilent(l.data() + 768, 256));
    REQUIRE(countDiagnostics(engine, ActuateError::Overrun) == 1);
}

TEST_CASE("Sampler without a bank reports a missing resource", "[engine][diagnostics]") {
    ActuateEngine engine;
    SynthPatch patch;
    patch.modules[1].type = AudioModuleType::Sampler;
    prepareEngine(engine, patch);
    REQUIRE(engine.sampleBank(1) == nullptr);

    REQUIRE(engine.pushEvent(noteOn(60)));
    const auto out = render(engine, kBlockSize);
    REQUIRE(Metrics::isSilent(out.left.data(), out.left.size(), 0.0f));
    REQUIRE(countDiagnostics(engine, ActuateError::ResourceMissing) == 1);
}

TEST_CASE("Missing-resource reports wait for room in a full queue", "[engine][diagnostics]") {
    ActuateEngine engine;
    SynthPatch patch;
    patch.voiceCount = 32;
    patch.modules[1].type = AudioModuleType::Sampler;
    prepareEngine(engine, patch);

    // One report per note-on, more than the queue can hold
    constexpr size_t kNotes = kDiagnosticQueueCapacity + 10;
    for (size_t i = 0; i < kNotes; ++i) {
        REQUIRE(engine.pushEvent(noteOn(static_cast<uint8_t>(20 + i))));
    }
    (void)render(engine, kBlockSize);

    const size_t first = countDiagnostics(engine, ActuateError::ResourceMissing);
    REQUIRE(first == kDiagnosticQueueCapacity - 1);
    REQUIRE(engine.pendingDiagnosticCount() == kNotes - first);

    (void)render(engine, kBlockSize);
    REQUIRE(countDiagnostics(engine, ActuateError::ResourceMissing) == kNotes - first);
    REQUIRE(engine.pendingDiagnosticCount() == 0);
    REQUIRE(engine.droppedDiagnosticCount() == 0);
}

TEST_CASE("Sampler plays an installed bank", "[engine][samples]") {
    ActuateEngine engine;
    SynthPatch patch;
    patch.modules[0].type = AudioModuleType::Sampler;
    patch.modules[0].loop = true;
    prepareEngine(engine, patch);

    std::vector<float> pcm(44100);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = 0.5f * std::sin(kTwoPi * 261.63f * static_cast<float>(i) / 44100.0f);
    }
    auto buffer = SampleBuffer::fromInterleaved(pcm.data(), 1, pcm.size(), kSampleRate, kSampleRate);
    REQUIRE(buffer != nullptr);
    engine.setSampleBank(0, SampleBank::build(buffer, {true}));

    REQUIRE(engine.pushEvent(noteOn(60)));
    const auto out = render(engine, 22050);
    REQUIRE(Metrics::dominantFrequency(out.left.data() + 11025, 11025, kSampleRate,
                                       240.0, 280.0, 0.5)
            == Approx(261.63).margin(2.0));
    REQUIRE(countDiagnostics(engine, ActuateError::ResourceMissing) == 0);
}
