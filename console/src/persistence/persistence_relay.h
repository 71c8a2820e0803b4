#pragma once

// ==============================================================================
// PersistenceRelay - Flash Save / Load / Factory Reset
// ==============================================================================
// Each command is one device-to-host request whose single response byte is
// the FlashResult. A successful load or factory reset changes the device state
// behind the store's back, so it is followed by exactly one fetchAll().
// While disconnected every command reports WriteError without a transfer.
// ==============================================================================

#include "flash_result.h"

#include <cstdint>
#include <string>

namespace Dspi::Console {

class DeviceSession;
class ParameterStore;

class PersistenceRelay {
public:
    /// Both references are non-owning and must outlive the relay
    PersistenceRelay(DeviceSession& session, ParameterStore& store);

    FlashResult save();
    FlashResult load();
    FlashResult factoryReset();

    /// Run one command by name
    FlashResult run(FlashCommand command);

    /// Message for the most recent command, as given by describeFlashResult()
    std::string getLastMessage() const { return lastMessage_; }

    FlashOutcome lastOutcome() const { return lastOutcome_; }

private:
    FlashResult execute(FlashCommand command, uint8_t opcode, bool resyncOnSuccess);

    DeviceSession& session_;
    ParameterStore& store_;
    std::string lastMessage_;
    FlashOutcome lastOutcome_ = FlashOutcome::Success;
};

} // namespace Dspi::Console
