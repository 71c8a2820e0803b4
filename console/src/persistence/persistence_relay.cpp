#include "persistence_relay.h"

#include "console_ids.h"
#include "core/logging.h"
#include "device/device_session.h"
#include "parameters/parameter_store.h"

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "FLASH";

} // namespace

PersistenceRelay::PersistenceRelay(DeviceSession& session, ParameterStore& store)
    : session_(session)
    , store_(store)
{
}

FlashResult PersistenceRelay::save() {
    return execute(FlashCommand::Save, kSaveParams, false);
}

FlashResult PersistenceRelay::load() {
    return execute(FlashCommand::Load, kLoadParams, true);
}

FlashResult PersistenceRelay::factoryReset() {
    return execute(FlashCommand::FactoryReset, kFactoryReset, true);
}

FlashResult PersistenceRelay::run(FlashCommand command) {
    switch (command) {
        case FlashCommand::Save:         return save();
        case FlashCommand::Load:         return load();
        case FlashCommand::FactoryReset: return factoryReset();
    }
    return FlashResult::WriteError;
}

FlashResult PersistenceRelay::execute(FlashCommand command, uint8_t opcode, bool resyncOnSuccess) {
    FlashResult result = FlashResult::WriteError;

    if (!session_.isConnected()) {
        log(LogLevel::Warning, kTag, "%s refused: not connected", flashCommandName(command));
    } else if (auto bytes = session_.sendGet(opcode, 0, kFlashResultSize)) {
        result = flashResultFromRaw((*bytes)[0]);
    } else {
        log(LogLevel::Warning, kTag, "%s: no response from device", flashCommandName(command));
    }

    const auto description = describeFlashResult(command, result);
    lastMessage_ = description.message;
    lastOutcome_ = description.outcome;

    log(result == FlashResult::Ok ? LogLevel::Info : LogLevel::Warning, kTag,
        "%s -> %u (%s)", flashCommandName(command), static_cast<unsigned>(result), description.message);

    if (result == FlashResult::Ok && resyncOnSuccess && !store_.fetchAll()) {
        log(LogLevel::Warning, kTag, "Resynchronization after %s failed", flashCommandName(command));
    }
    return result;
}

} // namespace Dspi::Console
