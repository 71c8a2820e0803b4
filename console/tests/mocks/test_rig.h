#pragma once

// =============================================================================
// Test Rigs
// =============================================================================
// A DeviceSession (or a whole ConsoleContext) wired to a FakeDspDevice and a
// MockDeviceWatcher. The session owns both; the rig keeps raw pointers for
// inspection.
// =============================================================================

#include "app/console_context.h"
#include "core/console_config.h"
#include "device/device_session.h"
#include "fake_dsp_device.h"
#include "mock_device_watcher.h"

#include <atomic>
#include <cstdint>
#include <memory>

namespace Dspi::Console {
namespace Testing {

struct SessionRig {
    FakeDspDevice* device = new FakeDspDevice();
    MockDeviceWatcher* watcher = new MockDeviceWatcher();
    DeviceSession session{std::unique_ptr<ControlTransport>(device),
                          std::unique_ptr<DeviceWatcher>(watcher)};

    /// Plug the fake device in, connect, and wait for the session to settle
    bool plugAndConnect() {
        watcher->plug(kFakeLocation);
        session.connect();
        session.drain();
        return session.isConnected();
    }
};

/// Full object graph on a manual clock. Advance time with advance().
struct ContextRig {
    FakeDspDevice* device = new FakeDspDevice();
    MockDeviceWatcher* watcher = new MockDeviceWatcher();
    std::atomic<uint64_t> now{1000};
    ConsoleConfig config;
    ConsoleContext context{config,
                           std::unique_ptr<ControlTransport>(device),
                           std::unique_ptr<DeviceWatcher>(watcher),
                           [this] { return now.load(); }};

    void advance(uint64_t ms) { now += ms; }

    /// Matching requests, by opcode and wValue
    size_t countRequests(uint8_t request, uint16_t value) const {
        size_t n = 0;
        for (const auto& r : device->requests()) {
            if (r.request == request && r.value == value) ++n;
        }
        return n;
    }
};

} // namespace Testing
} // namespace Dspi::Console
