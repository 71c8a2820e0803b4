#pragma once

// ==============================================================================
// ControlTransport - Transfer Primitive Interface
// ==============================================================================
// Issues single vendor control transfers against one opened device. No
// business logic and no threading: DeviceSession serializes every call onto
// its executor, so implementations may assume single-threaded use.
//
// Implementations:
//   - UsbfsTransport (Linux usbdevfs)
//   - Testing::FakeDspDevice (firmware emulator used by the tests)
// ==============================================================================

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Dspi::Console {

/// Where a matched device lives (bus/address and its device node)
struct DeviceLocation {
    std::string path;        // "/dev/bus/usb/001/007"
    uint16_t bus = 0;
    uint16_t address = 0;

    bool operator==(const DeviceLocation&) const = default;
};

enum class OpenResult : uint8_t {
    Ok,
    Busy,          // held by another console
    NotFound,      // node vanished between match and open
    AccessDenied,  // node permissions not (yet) granted
    Error
};

class ControlTransport {
public:
    virtual ~ControlTransport() = default;

    /// Open the device for exclusive use. Closes any previous handle first.
    virtual OpenResult open(const DeviceLocation& location) = 0;

    /// Release the handle. Safe to call when not open.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// Host-to-device request
    /// @return false if the handle is not open or the transfer failed
    virtual bool controlOut(uint8_t request, uint16_t value, std::span<const uint8_t> payload) = 0;

    /// Device-to-host request
    /// @return exactly @p length bytes, or nullopt on any failure or short read
    virtual std::optional<std::vector<uint8_t>> controlIn(uint8_t request, uint16_t value, uint16_t length) = 0;

    /// Human-readable reason for the last failure
    virtual std::string getLastError() const = 0;
};

} // namespace Dspi::Console
