// =============================================================================
// FlashResult Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "persistence/flash_result.h"

#include <string>

using namespace Dspi::Console;

TEST_CASE("Raw result codes", "[flash]") {
    CHECK(flashResultFromRaw(0) == FlashResult::Ok);
    CHECK(flashResultFromRaw(1) == FlashResult::WriteError);
    CHECK(flashResultFromRaw(2) == FlashResult::NoData);
    CHECK(flashResultFromRaw(3) == FlashResult::CrcError);
    CHECK(flashResultFromRaw(4) == FlashResult::WriteError);
    CHECK(flashResultFromRaw(0xFF) == FlashResult::WriteError);
}

TEST_CASE("Success messages name the command", "[flash]") {
    auto save = describeFlashResult(FlashCommand::Save, FlashResult::Ok);
    auto load = describeFlashResult(FlashCommand::Load, FlashResult::Ok);
    auto reset = describeFlashResult(FlashCommand::FactoryReset, FlashResult::Ok);

    CHECK(save.outcome == FlashOutcome::Success);
    CHECK(std::string(save.message) == "Parameters saved successfully");
    CHECK(std::string(load.message) == "Parameters reverted successfully");
    CHECK(std::string(reset.message) == "Factory reset complete");
}

TEST_CASE("Missing and corrupt data are distinguished", "[flash]") {
    auto noData = describeFlashResult(FlashCommand::Load, FlashResult::NoData);
    CHECK(noData.outcome == FlashOutcome::Informational);
    CHECK(std::string(noData.message) == "No saved parameters found. The device is using factory defaults.");

    auto crc = describeFlashResult(FlashCommand::Load, FlashResult::CrcError);
    CHECK(crc.outcome == FlashOutcome::Critical);
    CHECK(std::string(crc.message) == "Saved data is corrupted");
}

TEST_CASE("Write errors report a per-command failure", "[flash]") {
    CHECK(std::string(describeFlashResult(FlashCommand::Save, FlashResult::WriteError).message)
          == "Failed to save parameters");
    CHECK(std::string(describeFlashResult(FlashCommand::Load, FlashResult::WriteError).message)
          == "Failed to load parameters");
    CHECK(std::string(describeFlashResult(FlashCommand::FactoryReset, FlashResult::WriteError).message)
          == "Failed to reset parameters");
    CHECK(describeFlashResult(FlashCommand::Save, FlashResult::WriteError).outcome == FlashOutcome::Failure);
}
