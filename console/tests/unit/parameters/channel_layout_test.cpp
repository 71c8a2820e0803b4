// =============================================================================
// Channel Layout Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "parameters/channel_layout.h"

#include <string>

using namespace Dspi::Console;

TEST_CASE("Inputs and outputs are split at index 2", "[channels]") {
    CHECK(isInput(Channel::MasterLeft));
    CHECK(isInput(Channel::MasterRight));
    CHECK(isOutput(Channel::OutLeft));
    CHECK(isOutput(Channel::OutRight));
    CHECK(isOutput(Channel::Sub));
}

TEST_CASE("Band count follows the channel role", "[channels]") {
    CHECK(bandCount(Channel::MasterLeft) == 10);
    CHECK(bandCount(Channel::MasterRight) == 10);
    CHECK(bandCount(Channel::OutLeft) == 2);
    CHECK(bandCount(Channel::Sub) == 2);
}

TEST_CASE("Names and descriptors", "[channels]") {
    CHECK(std::string(channelName(Channel::MasterLeft)) == "Master L");
    CHECK(std::string(channelName(Channel::Sub)) == "Sub");
    CHECK(std::string(channelShortName(Channel::OutRight)) == "OR");
    CHECK(std::string(channelDescriptor(Channel::MasterRight)) == "USB");
    CHECK(std::string(channelDescriptor(Channel::OutLeft)) == "SPDIF");
    CHECK(std::string(channelDescriptor(Channel::Sub)) == "PDM (Pin 10)");
}

TEST_CASE("parseChannel accepts indices and short names", "[channels]") {
    CHECK(parseChannel("0") == Channel::MasterLeft);
    CHECK(parseChannel("4") == Channel::Sub);
    CHECK(parseChannel("ol") == Channel::OutLeft);
    CHECK(parseChannel("Sub") == Channel::Sub);
    CHECK(parseChannel("MR") == Channel::MasterRight);

    CHECK_FALSE(parseChannel("5").has_value());
    CHECK_FALSE(parseChannel("left").has_value());
    CHECK_FALSE(parseChannel("").has_value());
}

TEST_CASE("channelFromIndex covers exactly the five channels", "[channels]") {
    for (size_t i = 0; i < kNumChannels; ++i) {
        REQUIRE(channelFromIndex(i).has_value());
        CHECK(channelIndex(*channelFromIndex(i)) == i);
    }
    CHECK_FALSE(channelFromIndex(kNumChannels).has_value());
}
