// ==============================================================================
// dB Utilities - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/dspi/dsp/core/db_utils.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <dspi/dsp/core/db_utils.h>

#include <cmath>

using namespace Dspi::DSP;
using Catch::Approx;

TEST_CASE("powerToDb is 10*log10 of a squared magnitude", "[dsp][core][db]") {
    CHECK(powerToDb(1.0f) == 0.0f);
    CHECK(powerToDb(100.0f) == Approx(20.0f));
    CHECK(powerToDb(0.25f) == Approx(-6.0206f).margin(1e-3f));

    SECTION("Matches 20*log10 of the magnitude") {
        const float magnitude = 0.37f;
        CHECK(powerToDb(magnitude * magnitude) == Approx(20.0f * std::log10(magnitude)).margin(1e-4f));
    }

    SECTION("Per-section powers add in dB when multiplied") {
        CHECK(powerToDb(2.0f * 3.0f) == Approx(powerToDb(2.0f) + powerToDb(3.0f)).margin(1e-5f));
    }
}
