#pragma once

// ==============================================================================
// Flash Command Results
// ==============================================================================
// The one-byte result returned by save / load / factory-reset, and how each
// is presented to the user.
// ==============================================================================

#include <cstdint>

namespace Dspi::Console {

enum class FlashResult : uint8_t {
    Ok = 0,
    WriteError = 1,
    NoData = 2,
    CrcError = 3
};

enum class FlashCommand : uint8_t {
    Save,
    Load,
    FactoryReset
};

/// How a result should be surfaced
enum class FlashOutcome : uint8_t {
    Success,
    Failure,
    Informational,   // nothing saved, device runs on factory defaults
    Critical         // saved data failed its integrity check
};

struct FlashResultDescription {
    FlashOutcome outcome = FlashOutcome::Failure;
    const char* message = "";
};

/// Unknown codes are reported as WriteError
[[nodiscard]] constexpr FlashResult flashResultFromRaw(uint8_t raw) noexcept {
    return raw <= static_cast<uint8_t>(FlashResult::CrcError)
        ? static_cast<FlashResult>(raw)
        : FlashResult::WriteError;
}

[[nodiscard]] constexpr const char* flashCommandName(FlashCommand command) noexcept {
    switch (command) {
        case FlashCommand::Save:         return "save";
        case FlashCommand::Load:         return "load";
        case FlashCommand::FactoryReset: return "factory-reset";
    }
    return "?";
}

[[nodiscard]] constexpr FlashResultDescription describeFlashResult(FlashCommand command, FlashResult result) noexcept {
    switch (result) {
        case FlashResult::Ok:
            switch (command) {
                case FlashCommand::Save:         return {FlashOutcome::Success, "Parameters saved successfully"};
                case FlashCommand::Load:         return {FlashOutcome::Success, "Parameters reverted successfully"};
                case FlashCommand::FactoryReset: return {FlashOutcome::Success, "Factory reset complete"};
            }
            break;
        case FlashResult::NoData:
            return {FlashOutcome::Informational,
                    "No saved parameters found. The device is using factory defaults."};
        case FlashResult::CrcError:
            return {FlashOutcome::Critical, "Saved data is corrupted"};
        case FlashResult::WriteError:
            break;
    }

    switch (command) {
        case FlashCommand::Save:         return {FlashOutcome::Failure, "Failed to save parameters"};
        case FlashCommand::Load:         return {FlashOutcome::Failure, "Failed to load parameters"};
        case FlashCommand::FactoryReset: return {FlashOutcome::Failure, "Failed to reset parameters"};
    }
    return {FlashOutcome::Failure, "Flash command failed"};
}

} // namespace Dspi::Console
