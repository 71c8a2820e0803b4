#pragma once

// ==============================================================================
// UsbfsDeviceWatcher - Linux Hot-Plug Source
// ==============================================================================
// start() scans sysfs for devices already plugged in, then listens on a
// NETLINK_KOBJECT_UEVENT socket for "add" and "remove" events of USB devices
// (DEVTYPE=usb_device) whose PRODUCT key names the watched vendor/product.
//
// The listening thread only forwards DeviceEvents to the sink.
// ==============================================================================

#include "device_watcher.h"

#include <atomic>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace Dspi::Console {

/// The fields of a kernel uevent the watcher cares about
struct Uevent {
    std::string action;      // "add", "remove", ...
    std::string subsystem;   // "usb"
    std::string devType;     // "usb_device"
    std::string product;     // "2e8a/feaa/100" (hex, no leading zeros)
    uint16_t bus = 0;        // BUSNUM
    uint16_t address = 0;    // DEVNUM
};

class UsbfsDeviceWatcher final : public DeviceWatcher {
public:
    explicit UsbfsDeviceWatcher(
        std::filesystem::path sysfsRoot = "/sys/bus/usb/devices",
        std::filesystem::path devRoot = "/dev/bus/usb"
    );
    ~UsbfsDeviceWatcher() override;

    UsbfsDeviceWatcher(const UsbfsDeviceWatcher&) = delete;
    UsbfsDeviceWatcher& operator=(const UsbfsDeviceWatcher&) = delete;

    bool start(uint16_t vendorId, uint16_t productId, EventSink sink) override;
    void stop() override;
    bool isRunning() const override { return running_.load(std::memory_order_acquire); }

    /// Matching devices currently listed in sysfs
    std::vector<DeviceLocation> scanPresent(uint16_t vendorId, uint16_t productId) const;

    /// Decode one netlink datagram ("action@devpath\0KEY=VALUE\0...").
    /// Messages relayed by udev ("libudev" header) are rejected.
    static std::optional<Uevent> parseUevent(std::span<const char> message);

    /// Turn a uevent into a DeviceEvent if it is an add/remove of the watched device
    std::optional<DeviceEvent> eventFor(const Uevent& uevent, uint16_t vendorId, uint16_t productId) const;

    std::string getLastError() const { return lastError_; }

private:
    void threadMain();
    DeviceLocation locationFor(uint16_t bus, uint16_t address) const;

    std::filesystem::path sysfsRoot_;
    std::filesystem::path devRoot_;
    uint16_t vendorId_ = 0;
    uint16_t productId_ = 0;
    EventSink sink_;
    int socket_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::string lastError_;
};

} // namespace Dspi::Console
