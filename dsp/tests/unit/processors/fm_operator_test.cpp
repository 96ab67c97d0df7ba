// ==============================================================================
// Layer 2: DSP Processor - FM Operator Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/processors/fm_operator.h>

#include <algorithm>
#include <cmath>

using Catch::Approx;
using namespace Actuate::DSP;

namespace {

constexpr double kSampleRate = 44100.0;

FmOperator makeOperator(float oneToTwo, float oneToThree, float twoToThree, int ratio = 1) {
    FmOperator op;
    op.prepare(kSampleRate);
    FmSettings settings;
    settings.oneToTwo = oneToTwo;
    settings.oneToThree = oneToThree;
    settings.twoToThree = twoToThree;
    settings.ratio = ratio;
    settings.envelope.attackMs = 0.1f;
    op.setSettings(settings);
    op.setSourceFrequencies(220.0f, 330.0f);
    return op;
}

} // namespace

TEST_CASE("FM operator is inactive with all routes at zero", "[fm]") {
    auto op = makeOperator(0.0f, 0.0f, 0.0f);
    REQUIRE_FALSE(op.isActive());
    op.gate(true);
    for (int i = 0; i < 1000; ++i) {
        const auto offsets = op.process();
        REQUIRE(offsets.module2 == 0.0f);
        REQUIRE(offsets.module3 == 0.0f);
    }
}

TEST_CASE("FM depth peaks at the maximum index", "[fm]") {
    auto op = makeOperator(1.0f, 0.0f, 0.0f);
    REQUIRE(op.isActive());
    op.gate(true);

    float maxOffset = 0.0f;
    for (int i = 0; i < 44100; ++i) {
        const auto offsets = op.process();
        maxOffset = std::max(maxOffset, std::abs(offsets.module2));
        REQUIRE(offsets.module3 == 0.0f);
    }
    REQUIRE(maxOffset <= kMaxFmIndex + 1e-4f);
    REQUIRE(maxOffset == Approx(kMaxFmIndex).margin(0.05));
}

TEST_CASE("Module 3 sums both of its routes", "[fm]") {
    auto op = makeOperator(0.0f, 0.5f, 0.5f);
    op.gate(true);
    float maxOffset = 0.0f;
    for (int i = 0; i < 44100; ++i) {
        const auto offsets = op.process();
        REQUIRE(offsets.module2 == 0.0f);
        maxOffset = std::max(maxOffset, std::abs(offsets.module3));
    }
    REQUIRE(maxOffset > 0.5f * kMaxFmIndex);
    REQUIRE(maxOffset <= kMaxFmIndex + 1e-4f);
}

TEST_CASE("FM envelope gates the modulation", "[fm]") {
    auto op = makeOperator(1.0f, 1.0f, 1.0f);
    for (int i = 0; i < 100; ++i) {
        const auto offsets = op.process();
        REQUIRE(offsets.module2 == 0.0f);
        REQUIRE(offsets.module3 == 0.0f);
    }
    op.gate(true);
    for (int i = 0; i < 1000; ++i) (void)op.process();
    REQUIRE(op.envelopeLevel() == Approx(1.0f));
}

TEST_CASE("FM settings are clamped", "[fm][safety]") {
    auto op = makeOperator(std::nanf(""), -1.0f, 0.0f, 99);
    REQUIRE_FALSE(op.isActive());
    op.gate(true);
    for (int i = 0; i < 1000; ++i) {
        const auto offsets = op.process();
        REQUIRE(std::isfinite(offsets.module2));
        REQUIRE(std::isfinite(offsets.module3));
    }
}
