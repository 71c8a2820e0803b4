#pragma once

// ==============================================================================
// ConsoleContext - Process-Wide Object Graph
// ==============================================================================
// The single lifetime owner of the device session, the parameter store, the
// persistence relay, the buffer-stats reader and the poller. Created once at
// startup and passed by reference to whatever needs it.
//
// Each transition to Connected arms the poller's debounced fetchAll().
// ==============================================================================

#include "app/status_poller.h"
#include "core/console_config.h"
#include "device/control_transport.h"
#include "device/device_session.h"
#include "device/device_watcher.h"
#include "diagnostics/buffer_stats.h"
#include "parameters/parameter_store.h"
#include "persistence/persistence_relay.h"

#include <memory>

namespace Dspi::Console {

class ConsoleContext {
public:
    /// Wire the given backends. @p clock drives the poller (empty = steady clock).
    ConsoleContext(
        const ConsoleConfig& config,
        std::unique_ptr<ControlTransport> transport,
        std::unique_ptr<DeviceWatcher> watcher,
        StatusPoller::Clock clock = {}
    );
    ~ConsoleContext();

    ConsoleContext(const ConsoleContext&) = delete;
    ConsoleContext& operator=(const ConsoleContext&) = delete;

    /// Linux usbdevfs transport and uevent watcher
    static std::unique_ptr<ConsoleContext> createForDevice(const ConsoleConfig& config);

    /// connect() and wait until any present device has been opened
    /// @return true if connected
    bool connectAndWait();

    const ConsoleConfig& config() const { return config_; }
    DeviceSession& session() { return session_; }
    ParameterStore& store() { return store_; }
    PersistenceRelay& persistence() { return persistence_; }
    BufferStatsReader& bufferStats() { return bufferStats_; }
    StatusPoller& poller() { return poller_; }

private:
    ConsoleConfig config_;
    DeviceSession session_;
    ParameterStore store_;
    PersistenceRelay persistence_;
    BufferStatsReader bufferStats_;
    StatusPoller poller_;
};

} // namespace Dspi::Console
