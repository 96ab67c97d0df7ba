// ==============================================================================
// Layer 1: DSP Primitive - SampleBuffer Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <actuate/dsp/primitives/sample_buffer.h>

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Actuate::DSP;

TEST_CASE("fromInterleaved de-interleaves stereo data", "[sample_buffer]") {
    const std::vector<float> data = {0.1f, -0.1f, 0.2f, -0.2f, 0.3f, -0.3f};
    auto buffer = SampleBuffer::fromInterleaved(data.data(), 2, 3, 48000.0, 48000.0);

    REQUIRE(buffer != nullptr);
    REQUIRE(buffer->numChannels() == 2);
    REQUIRE(buffer->numFrames() == 3);
    REQUIRE(buffer->sampleRate() == 48000.0);
    REQUIRE(buffer->channel(0)[2] == 0.3f);
    REQUIRE(buffer->channel(1)[1] == -0.2f);
}

TEST_CASE("fromInterleaved rejects invalid arguments", "[sample_buffer]") {
    const std::vector<float> data(16, 0.5f);

    REQUIRE(SampleBuffer::fromInterleaved(nullptr, 1, 16, 44100.0, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromInterleaved(data.data(), 0, 16, 44100.0, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromInterleaved(data.data(), 3, 5, 44100.0, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromInterleaved(data.data(), 1, 0, 44100.0, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromInterleaved(data.data(), 1, 16, 1000.0, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromInterleaved(data.data(), 1, 16, 44100.0, 1e6) == nullptr);
}

TEST_CASE("Non-finite input samples become silence", "[sample_buffer]") {
    const std::vector<float> data = {0.5f, std::numeric_limits<float>::quiet_NaN(),
                                     std::numeric_limits<float>::infinity(), -0.5f};
    auto buffer = SampleBuffer::fromInterleaved(data.data(), 1, 4, 44100.0, 44100.0);
    REQUIRE(buffer != nullptr);
    REQUIRE(buffer->channel(0)[1] == 0.0f);
    REQUIRE(buffer->channel(0)[2] == 0.0f);
    REQUIRE(buffer->channel(0)[3] == -0.5f);
}

TEST_CASE("Resampling scales the length by the rate ratio", "[sample_buffer]") {
    constexpr size_t kFrames = 48000;
    std::vector<float> data(kFrames);
    for (size_t i = 0; i < kFrames; ++i) {
        data[i] = std::sin(6.283185307f * 1000.0f * static_cast<float>(i) / 48000.0f);
    }
    auto buffer = SampleBuffer::fromInterleaved(data.data(), 1, kFrames, 48000.0, 44100.0);

    REQUIRE(buffer != nullptr);
    REQUIRE(buffer->sampleRate() == 44100.0);
    REQUIRE(static_cast<double>(buffer->numFrames()) == Approx(44100.0).margin(2.0));

    // One 1 kHz cycle is 44.1 samples at the new rate
    const float* out = buffer->channel(0);
    const float expected = std::sin(6.283185307f * 1000.0f * 441.0f / 44100.0f);
    REQUIRE(out[441] == Approx(expected).margin(0.01));
}

TEST_CASE("Mono buffers read the same value on both sides", "[sample_buffer]") {
    auto buffer = SampleBuffer::fromChannels({0.25f, 0.75f}, {}, 44100.0);
    REQUIRE(buffer->numChannels() == 1);

    const StereoFrame f = buffer->frameAt(0.5);
    REQUIRE(f.left == Approx(0.5f));
    REQUIRE(f.right == Approx(0.5f));
}

TEST_CASE("frameAt handles the buffer edges", "[sample_buffer]") {
    auto buffer = SampleBuffer::fromChannels({1.0f, 2.0f, 3.0f}, {}, 44100.0);

    REQUIRE(buffer->frameAt(-1.0).left == 0.0f);
    REQUIRE(buffer->frameAt(3.0).left == 0.0f);
    REQUIRE(buffer->frameAt(2.5).left == Approx(3.0f));
    REQUIRE(buffer->frameAt(2.5, true).left == Approx(2.0f));
}

TEST_CASE("fromChannels rejects mismatched channel lengths", "[sample_buffer]") {
    REQUIRE(SampleBuffer::fromChannels({1.0f, 2.0f}, {1.0f}, 44100.0) == nullptr);
    REQUIRE(SampleBuffer::fromChannels({}, {}, 44100.0) == nullptr);
}
