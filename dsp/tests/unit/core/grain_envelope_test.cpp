// ==============================================================================
// Layer 0: Core Utility - Grain Envelope Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/core/grain_envelope.h>

using Catch::Approx;
using namespace Actuate::DSP;

TEST_CASE("Raised-cosine fades are complementary over the overlap", "[grain_envelope]") {
    constexpr size_t kLength = 400;
    constexpr size_t kFade = 64;
    for (size_t i = 0; i < kFade; ++i) {
        const float out = GrainEnvelope::gainAt(kLength - kFade + i, kLength, kFade);
        const float in = GrainEnvelope::gainAt(i, kLength, kFade);
        REQUIRE(out + in == Approx(1.0f).margin(1e-6));
    }
}

TEST_CASE("Grain window is flat between the fades", "[grain_envelope]") {
    for (size_t i = 32; i < 368; ++i) {
        REQUIRE(GrainEnvelope::gainAt(i, 400, 32) == 1.0f);
    }
}

TEST_CASE("Grain window is zero outside the grain", "[grain_envelope]") {
    REQUIRE(GrainEnvelope::gainAt(400, 400, 32) == 0.0f);
    REQUIRE(GrainEnvelope::gainAt(0, 0, 0) == 0.0f);
}

TEST_CASE("Fade length is limited to half the grain", "[grain_envelope]") {
    // A 100-sample grain fades over 50 samples at most, so the edges meet in the middle
    REQUIRE(GrainEnvelope::gainAt(49, 100, 1000) == Approx(1.0f).margin(0.001f));
    REQUIRE(GrainEnvelope::gainAt(50, 100, 1000) == Approx(1.0f).margin(0.001f));
    REQUIRE(GrainEnvelope::gainAt(0, 100, 1000) < 0.01f);
}

TEST_CASE("Zero fade gives a rectangular grain", "[grain_envelope]") {
    REQUIRE(GrainEnvelope::gainAt(0, 100, 0) == 1.0f);
    REQUIRE(GrainEnvelope::gainAt(99, 100, 0) == 1.0f);
}
