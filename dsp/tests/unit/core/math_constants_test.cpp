// ==============================================================================
// Math Constants - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/dspi/dsp/core/math_constants.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <dspi/dsp/core/math_constants.h>

#include <cmath>
#include <numbers>

using namespace Dspi::DSP;
using Catch::Approx;

TEST_CASE("kPi has correct value", "[dsp][core][math_constants]") {

    SECTION("kPi matches std::numbers::pi_v<float>") {
        REQUIRE(kPi == Approx(std::numbers::pi_v<float>));
    }

    SECTION("sin(kPi) is approximately zero") {
        REQUIRE(std::sin(kPi) == Approx(0.0f).margin(1e-6f));
    }
}

TEST_CASE("kTwoPi is a full circle", "[dsp][core][math_constants]") {
    REQUIRE(kTwoPi == Approx(2.0f * std::numbers::pi_v<float>));
    REQUIRE(std::cos(kTwoPi) == Approx(1.0f).margin(1e-6f));
}

TEST_CASE("Device sample rate is 48 kHz", "[dsp][core][math_constants]") {
    static_assert(kDeviceSampleRate == 48000.0f);
    REQUIRE(kDeviceSampleRate / 2.0f == 24000.0f);
}
