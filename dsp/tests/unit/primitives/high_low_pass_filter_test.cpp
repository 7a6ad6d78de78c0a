// ==============================================================================
// Layer 1: DSP Primitive Tests - Cascaded Low/High-Pass Filter
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <sfxr/dsp/primitives/high_low_pass_filter.h>

#include <algorithm>
#include <array>
#include <cmath>

using namespace Sfxr::DSP;
using Catch::Approx;

namespace {

/// Peak output for an alternating +/-1 input after the filter settles.
float nyquistPeak(HighLowPassFilter& filter) {
    float peak = 0.0f;
    for (int i = 0; i < 4000; ++i) {
        const float out = filter.process((i % 2 == 0) ? 1.0f : -1.0f);
        if (i >= 2000) {
            peak = std::max(peak, std::abs(out));
        }
    }
    return peak;
}

} // anonymous namespace

TEST_CASE("HighLowPassFilter coefficients follow the parameter curves", "[filter]") {
    HighLowPassFilter filter;

    filter.reset(0.0f, 1.0f, 0.0f, 1.0f, 0.0f);
    CHECK(filter.lowPassCutoff() == Approx(0.1f));
    CHECK(filter.highPassCutoff() == Approx(0.1f));
    CHECK(filter.lowPassDamping() == Approx(0.55f));

    filter.reset(0.0f, 0.5f, 0.0f, 0.5f, 0.0f);
    CHECK(filter.lowPassCutoff() == Approx(0.0125f));
    CHECK(filter.highPassCutoff() == Approx(0.025f));
}

TEST_CASE("HighLowPassFilter resonance lowers damping", "[filter]") {
    HighLowPassFilter dull;
    HighLowPassFilter resonant;
    dull.reset(0.0f, 0.8f, 0.0f, 0.0f, 0.0f);
    resonant.reset(1.0f, 0.8f, 0.0f, 0.0f, 0.0f);

    CHECK(resonant.lowPassDamping() < dull.lowPassDamping());
    CHECK(dull.lowPassDamping() <= kLowPassMaxDamping);
    CHECK(resonant.lowPassDamping() >= 0.0f);
}

TEST_CASE("HighLowPassFilter zero cutoff bypasses the low-pass", "[filter][edge]") {
    HighLowPassFilter filter;
    filter.reset(0.0f, 0.0f, 0.0f, 0.0f, 0.0f);

    const std::array<float, 6> input = {0.5f, -0.25f, 1.0f, 0.0f, -1.0f, 0.125f};
    for (float x : input) {
        (void)filter.process(x);
        REQUIRE(filter.lowPassOutput() == x);
    }
}

TEST_CASE("HighLowPassFilter passes DC with the high-pass off", "[filter]") {
    HighLowPassFilter filter;
    filter.reset(0.0f, 1.0f, 0.0f, 0.0f, 0.0f);

    float out = 0.0f;
    for (int i = 0; i < 1000; ++i) {
        out = filter.process(1.0f);
    }

    // Only the minimum high-pass leak remains
    CHECK(filter.lowPassOutput() == Approx(1.0f).margin(1e-3f));
    CHECK(out > 0.95f);
    CHECK(out <= 1.0f);
}

TEST_CASE("HighLowPassFilter high-pass removes DC", "[filter]") {
    HighLowPassFilter filter;
    filter.reset(0.0f, 1.0f, 0.0f, 1.0f, 0.0f);

    float out = 1.0f;
    for (int i = 0; i < 2000; ++i) {
        out = filter.process(1.0f);
    }
    CHECK(std::abs(out) < 1e-6f);
}

TEST_CASE("HighLowPassFilter low-pass attenuates high frequencies", "[filter]") {
    HighLowPassFilter open;
    HighLowPassFilter closed;
    open.reset(0.0f, 0.0f, 0.0f, 0.0f, 0.0f);
    closed.reset(0.0f, 0.5f, 0.0f, 0.0f, 0.0f);

    const float openPeak = nyquistPeak(open);
    const float closedPeak = nyquistPeak(closed);

    CHECK(openPeak > 0.9f);
    CHECK(closedPeak < 0.1f);
}

TEST_CASE("HighLowPassFilter cutoff ramps are clamped", "[filter][ramp]") {
    SECTION("low-pass ramp up saturates at the maximum cutoff") {
        HighLowPassFilter filter;
        filter.reset(0.0f, 0.5f, 1.0f, 0.0f, 0.0f);
        for (int i = 0; i < 30000; ++i) {
            (void)filter.process(0.0f);
            REQUIRE(filter.lowPassCutoff() <= kLowPassMaxCutoff);
        }
        CHECK(filter.lowPassCutoff() == kLowPassMaxCutoff);
    }

    SECTION("low-pass ramp down closes the filter") {
        HighLowPassFilter filter;
        filter.reset(0.0f, 1.0f, -1.0f, 0.0f, 0.0f);
        float previous = filter.lowPassCutoff();
        for (int i = 0; i < 1000; ++i) {
            (void)filter.process(0.0f);
            REQUIRE(filter.lowPassCutoff() < previous);
            previous = filter.lowPassCutoff();
        }
        CHECK(previous >= 0.0f);
    }

    SECTION("high-pass ramp starts from the minimum cutoff") {
        HighLowPassFilter filter;
        filter.reset(0.0f, 1.0f, 0.0f, 0.0f, 1.0f);

        (void)filter.process(0.0f);
        CHECK(filter.highPassCutoff() == kHighPassMinCutoff);

        for (int i = 0; i < 50000; ++i) {
            (void)filter.process(0.0f);
            REQUIRE(filter.highPassCutoff() <= kHighPassMaxCutoff);
        }
        CHECK(filter.highPassCutoff() == kHighPassMaxCutoff);
    }
}

TEST_CASE("HighLowPassFilter reset clears state", "[filter]") {
    HighLowPassFilter filter;
    filter.reset(1.0f, 0.3f, 0.0f, 0.0f, 0.0f);
    for (int i = 0; i < 100; ++i) {
        (void)filter.process(1.0f);
    }
    REQUIRE(filter.lowPassOutput() != 0.0f);

    filter.reset(1.0f, 0.3f, 0.0f, 0.0f, 0.0f);
    CHECK(filter.lowPassOutput() == 0.0f);
    CHECK(filter.process(0.0f) == 0.0f);
}
