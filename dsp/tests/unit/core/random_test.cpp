// Tests for Xorshift32 PRNG
// Layer 0: Core Utilities

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <sfxr/dsp/core/random.h>

#include <algorithm>
#include <array>
#include <cmath>

using Catch::Approx;
using namespace Sfxr::DSP;

TEST_CASE("Xorshift32 same seed produces same sequence", "[random]") {
    Xorshift32 rng1(99999);
    Xorshift32 rng2(99999);

    for (int i = 0; i < 100; ++i) {
        REQUIRE(rng1.next() == rng2.next());
    }
}

TEST_CASE("Xorshift32 different seeds produce different sequences", "[random]") {
    Xorshift32 rng1(12345);
    Xorshift32 rng2(54321);

    bool allSame = true;
    for (int i = 0; i < 100; ++i) {
        if (rng1.next() != rng2.next()) {
            allSame = false;
            break;
        }
    }
    REQUIRE_FALSE(allSame);
}

TEST_CASE("Xorshift32 seed of 0 is handled safely", "[random][edge]") {
    Xorshift32 rng(0);

    REQUIRE(rng.state() != 0);
    bool hasNonZero = false;
    for (int i = 0; i < 100; ++i) {
        if (rng.next() != 0) {
            hasNonZero = true;
            break;
        }
    }
    REQUIRE(hasNonZero);
}

TEST_CASE("Xorshift32 nextFloat() returns values in [-1.0, 1.0] range", "[random]") {
    Xorshift32 rng(42);

    float minVal = 1.0f;
    float maxVal = -1.0f;

    for (int i = 0; i < 10000; ++i) {
        float value = rng.nextFloat();
        REQUIRE(value >= -1.0f);
        REQUIRE(value <= 1.0f);

        minVal = std::min(minVal, value);
        maxVal = std::max(maxVal, value);
    }

    REQUIRE(minVal < -0.9f);
    REQUIRE(maxVal > 0.9f);
}

TEST_CASE("Xorshift32 seed() restarts the sequence", "[random]") {
    Xorshift32 rng(777);

    std::array<uint32_t, 16> first{};
    for (auto& v : first) {
        v = rng.next();
    }

    rng.seed(777);
    for (auto v : first) {
        REQUIRE(rng.next() == v);
    }
}

TEST_CASE("Xorshift32 nextInRange() stays between the bounds", "[random]") {
    Xorshift32 rng(2024);

    SECTION("ascending bounds") {
        for (int i = 0; i < 5000; ++i) {
            float v = rng.nextInRange(0.3f, 0.9f);
            REQUIRE(v >= 0.3f);
            REQUIRE(v <= 0.9f);
        }
    }

    SECTION("descending bounds") {
        for (int i = 0; i < 5000; ++i) {
            float v = rng.nextInRange(-0.35f, -0.65f);
            REQUIRE(v <= -0.35f);
            REQUIRE(v >= -0.65f);
        }
    }

    SECTION("empty range returns the bound") {
        REQUIRE(rng.nextInRange(0.25f, 0.25f) == Approx(0.25f));
    }
}

TEST_CASE("Xorshift32 chance() follows the odds", "[random]") {
    Xorshift32 rng(31337);
    constexpr int kTrials = 20000;

    int oneToOne = 0;
    int oneToFour = 0;
    for (int i = 0; i < kTrials; ++i) {
        if (rng.chance(1, 1)) ++oneToOne;
        if (rng.chance(1, 4)) ++oneToFour;
    }

    CHECK(static_cast<float>(oneToOne) / kTrials == Approx(0.5f).margin(0.03f));
    CHECK(static_cast<float>(oneToFour) / kTrials == Approx(0.2f).margin(0.03f));
}

TEST_CASE("Xorshift32 nextIndex() covers every slot", "[random]") {
    Xorshift32 rng(5);
    std::array<int, 5> hits{};

    for (int i = 0; i < 1000; ++i) {
        const auto index = rng.nextIndex(5);
        REQUIRE(index < 5);
        ++hits[index];
    }

    for (int count : hits) {
        CHECK(count > 0);
    }
}
