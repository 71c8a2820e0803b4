#pragma once

// ==============================================================================
// DeviceWatcher - Hot-Plug Notification Source
// ==============================================================================
// Reports arrival and removal of devices matching a vendor/product pair.
// start() first reports every matching device that is already present, then
// keeps reporting until stop(). The sink may be called from a watcher-owned
// thread and must only enqueue work; it must never touch a device handle.
// ==============================================================================

#include "control_transport.h"

#include <cstdint>
#include <functional>

namespace Dspi::Console {

struct DeviceEvent {
    enum class Kind : uint8_t {
        Matched,
        Terminated
    };

    Kind kind = Kind::Matched;
    DeviceLocation location;
};

class DeviceWatcher {
public:
    using EventSink = std::function<void(const DeviceEvent&)>;

    virtual ~DeviceWatcher() = default;

    /// Begin watching. Already-present devices are reported before this returns.
    /// @return false if the notification source could not be set up
    virtual bool start(uint16_t vendorId, uint16_t productId, EventSink sink) = 0;

    /// Stop watching. No sink call happens after this returns.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
};

} // namespace Dspi::Console
