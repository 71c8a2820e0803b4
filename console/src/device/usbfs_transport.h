#pragma once

// ==============================================================================
// UsbfsTransport - Linux usbdevfs Transfer Primitive
// ==============================================================================
// Opens /dev/bus/usb/BBB/DDD and issues vendor control transfers with
// USBDEVFS_CONTROL. No interface is claimed: the kernel accepts vendor-type
// requests on an unclaimed handle, and the sound driver keeps the audio
// interfaces. An exclusive flock() on the node keeps a second console out.
// Each transfer is bounded by the kernel timeout given at construction; a
// timeout surfaces as a failed transfer.
//
// Not thread-safe. DeviceSession calls it from its executor only.
// ==============================================================================

#include "control_transport.h"

#include <cstdint>
#include <string>

namespace Dspi::Console {

class UsbfsTransport final : public ControlTransport {
public:
    explicit UsbfsTransport(uint32_t timeoutMs = 1000);
    ~UsbfsTransport() override;

    UsbfsTransport(const UsbfsTransport&) = delete;
    UsbfsTransport& operator=(const UsbfsTransport&) = delete;

    OpenResult open(const DeviceLocation& location) override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    bool controlOut(uint8_t request, uint16_t value, std::span<const uint8_t> payload) override;
    std::optional<std::vector<uint8_t>> controlIn(uint8_t request, uint16_t value, uint16_t length) override;

    std::string getLastError() const override { return lastError_; }

private:
    /// Run one USBDEVFS_CONTROL. Returns the byte count or -1 (errno in lastError_).
    int transfer(uint8_t requestType, uint8_t request, uint16_t value, void* data, uint16_t length);

    int fd_ = -1;
    uint32_t timeoutMs_;
    std::string lastError_;
};

} // namespace Dspi::Console
