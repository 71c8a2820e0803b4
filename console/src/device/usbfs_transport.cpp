#include "usbfs_transport.h"

#include "console_ids.h"
#include "core/logging.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/usbdevice_fs.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "USBFS";

std::string errnoText(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

} // namespace

UsbfsTransport::UsbfsTransport(uint32_t timeoutMs)
    : timeoutMs_(timeoutMs)
{
}

UsbfsTransport::~UsbfsTransport() {
    close();
}

OpenResult UsbfsTransport::open(const DeviceLocation& location) {
    close();

    const int fd = ::open(location.path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        lastError_ = errnoText("open", err);
        log(LogLevel::Warning, kTag, "Failed to open %s: errno=%d %s",
            location.path.c_str(), err, std::strerror(err));
        if (err == ENOENT || err == ENODEV) return OpenResult::NotFound;
        if (err == EACCES || err == EPERM) return OpenResult::AccessDenied;
        return OpenResult::Error;
    }

    // Vendor requests need no claimed interface, and the audio interfaces stay
    // bound to the sound driver. One console per device is an advisory lock.
    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        const int err = errno;
        ::close(fd);
        lastError_ = errnoText("lock", err);
        log(LogLevel::Warning, kTag, "Failed to lock %s: errno=%d %s",
            location.path.c_str(), err, std::strerror(err));
        return err == EWOULDBLOCK ? OpenResult::Busy : OpenResult::Error;
    }

    fd_ = fd;
    lastError_.clear();
    log(LogLevel::Info, kTag, "Opened %s (bus %u, address %u)",
        location.path.c_str(), location.bus, location.address);
    return OpenResult::Ok;
}

void UsbfsTransport::close() {
    if (fd_ < 0) {
        return;
    }

    // Closing the descriptor also drops the lock
    ::close(fd_);
    fd_ = -1;
}

int UsbfsTransport::transfer(uint8_t requestType, uint8_t request, uint16_t value,
                             void* data, uint16_t length) {
    if (fd_ < 0) {
        lastError_ = "device not open";
        return -1;
    }

    struct usbdevfs_ctrltransfer ctrl = {};
    ctrl.bRequestType = requestType;
    ctrl.bRequest = request;
    ctrl.wValue = value;
    ctrl.wIndex = kControlInterface;
    ctrl.wLength = length;
    ctrl.timeout = timeoutMs_;
    ctrl.data = data;

    const int result = ioctl(fd_, USBDEVFS_CONTROL, &ctrl);
    if (result < 0) {
        const int err = errno;
        lastError_ = errnoText("control transfer", err);
        log(LogLevel::Warning, kTag, "Request 0x%02x wValue=0x%04x failed: errno=%d %s",
            request, value, err, std::strerror(err));
        return -1;
    }

    DSPI_TRACE(kTag, "Request 0x%02x wValue=0x%04x -> %d bytes", request, value, result);
    return result;
}

bool UsbfsTransport::controlOut(uint8_t request, uint16_t value, std::span<const uint8_t> payload) {
    // The ioctl takes a non-const buffer even for OUT transfers
    std::vector<uint8_t> buffer(payload.begin(), payload.end());
    const int result = transfer(kRequestTypeOut, request, value,
                                buffer.empty() ? nullptr : buffer.data(),
                                static_cast<uint16_t>(buffer.size()));
    return result >= 0;
}

std::optional<std::vector<uint8_t>> UsbfsTransport::controlIn(uint8_t request, uint16_t value, uint16_t length) {
    std::vector<uint8_t> buffer(length, 0);
    const int result = transfer(kRequestTypeIn, request, value, buffer.data(), length);
    if (result < 0) {
        return std::nullopt;
    }
    if (result != static_cast<int>(length)) {
        lastError_ = "short read: " + std::to_string(result) + " of " + std::to_string(length) + " bytes";
        log(LogLevel::Warning, kTag, "Request 0x%02x wValue=0x%04x %s",
            request, value, lastError_.c_str());
        return std::nullopt;
    }
    return buffer;
}

} // namespace Dspi::Console
