#include "console_context.h"

#include "device/usbfs_device_watcher.h"
#include "device/usbfs_transport.h"

#include <utility>

namespace Dspi::Console {

ConsoleContext::ConsoleContext(
    const ConsoleConfig& config,
    std::unique_ptr<ControlTransport> transport,
    std::unique_ptr<DeviceWatcher> watcher,
    StatusPoller::Clock clock
)
    : config_(config)
    , session_(std::move(transport), std::move(watcher), config.vendorId, config.productId)
    , store_(session_)
    , persistence_(session_, store_)
    , bufferStats_(session_)
    , poller_(session_, store_, bufferStats_, config_, std::move(clock))
{
    session_.addStateListener([this](ConnectionState state) {
        if (state == ConnectionState::Connected) {
            poller_.onConnected();
        } else {
            poller_.onDisconnected();
        }
    });
}

ConsoleContext::~ConsoleContext() {
    // Stop everything that can call into the members before they are destroyed
    poller_.stop();
    session_.disconnect();
}

std::unique_ptr<ConsoleContext> ConsoleContext::createForDevice(const ConsoleConfig& config) {
    return std::make_unique<ConsoleContext>(
        config,
        std::make_unique<UsbfsTransport>(config.transferTimeoutMs),
        std::make_unique<UsbfsDeviceWatcher>());
}

bool ConsoleContext::connectAndWait() {
    session_.connect();
    session_.drain();
    return session_.isConnected();
}

} // namespace Dspi::Console
