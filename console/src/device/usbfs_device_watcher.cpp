#include "usbfs_device_watcher.h"

#include "core/logging.h"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <linux/netlink.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "HOTPLUG";

/// How often the listening thread rechecks the stop flag
constexpr int kPollTimeoutMs = 200;

constexpr size_t kMaxUeventSize = 8192;

std::optional<uint16_t> parseNumber(std::string_view text, int base) {
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<uint16_t> readSysfsNumber(const std::filesystem::path& file, int base) {
    std::ifstream in(file);
    std::string text;
    if (!in || !std::getline(in, text)) {
        return std::nullopt;
    }
    return parseNumber(text, base);
}

/// PRODUCT is "vid/pid/bcdDevice" in lowercase hex without padding
bool productMatches(std::string_view product, uint16_t vendorId, uint16_t productId) {
    const auto first = product.find('/');
    if (first == std::string_view::npos) return false;
    const auto second = product.find('/', first + 1);
    const auto vid = parseNumber(product.substr(0, first), 16);
    const auto pid = parseNumber(product.substr(first + 1, second == std::string_view::npos
                                                              ? std::string_view::npos
                                                              : second - first - 1), 16);
    return vid && pid && *vid == vendorId && *pid == productId;
}

} // namespace

UsbfsDeviceWatcher::UsbfsDeviceWatcher(std::filesystem::path sysfsRoot, std::filesystem::path devRoot)
    : sysfsRoot_(std::move(sysfsRoot))
    , devRoot_(std::move(devRoot))
{
}

UsbfsDeviceWatcher::~UsbfsDeviceWatcher() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool UsbfsDeviceWatcher::start(uint16_t vendorId, uint16_t productId, EventSink sink) {
    stop();

    vendorId_ = vendorId;
    productId_ = productId;
    sink_ = std::move(sink);

    // Subscribe before scanning so a device plugged in between the two
    // is reported at least once
    socket_ = ::socket(AF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC, NETLINK_KOBJECT_UEVENT);
    if (socket_ < 0) {
        lastError_ = std::string("netlink socket: ") + std::strerror(errno);
    } else {
        sockaddr_nl addr = {};
        addr.nl_family = AF_NETLINK;
        addr.nl_pid = 0;
        addr.nl_groups = 1;  // kernel uevents
        if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            lastError_ = std::string("netlink bind: ") + std::strerror(errno);
            ::close(socket_);
            socket_ = -1;
        }
    }

    for (const auto& location : scanPresent(vendorId, productId)) {
        log(LogLevel::Info, kTag, "Found %s", location.path.c_str());
        sink_(DeviceEvent{DeviceEvent::Kind::Matched, location});
    }

    if (socket_ < 0) {
        // Without uevents only the devices present at start are seen
        log(LogLevel::Warning, kTag, "Hot-plug disabled: %s", lastError_.c_str());
        return false;
    }

    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&UsbfsDeviceWatcher::threadMain, this);
    return true;
}

void UsbfsDeviceWatcher::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

// =============================================================================
// Scanning
// =============================================================================

std::vector<DeviceLocation> UsbfsDeviceWatcher::scanPresent(uint16_t vendorId, uint16_t productId) const {
    namespace fs = std::filesystem;
    std::vector<DeviceLocation> found;
    std::error_code ec;

    for (const auto& entry : fs::directory_iterator(sysfsRoot_, ec)) {
        const auto& dir = entry.path();
        const auto vid = readSysfsNumber(dir / "idVendor", 16);
        const auto pid = readSysfsNumber(dir / "idProduct", 16);
        if (!vid || !pid || *vid != vendorId || *pid != productId) {
            continue;
        }

        const auto bus = readSysfsNumber(dir / "busnum", 10);
        const auto address = readSysfsNumber(dir / "devnum", 10);
        if (!bus || !address) {
            continue;
        }
        found.push_back(locationFor(*bus, *address));
    }

    if (ec) {
        log(LogLevel::Warning, kTag, "Cannot scan %s: %s",
            sysfsRoot_.string().c_str(), ec.message().c_str());
    }
    return found;
}

DeviceLocation UsbfsDeviceWatcher::locationFor(uint16_t bus, uint16_t address) const {
    char busDir[8];
    char devFile[8];
    std::snprintf(busDir, sizeof(busDir), "%03u", static_cast<unsigned>(bus));
    std::snprintf(devFile, sizeof(devFile), "%03u", static_cast<unsigned>(address));

    DeviceLocation location;
    location.path = (devRoot_ / busDir / devFile).string();
    location.bus = bus;
    location.address = address;
    return location;
}

// =============================================================================
// Uevents
// =============================================================================

std::optional<Uevent> UsbfsDeviceWatcher::parseUevent(std::span<const char> message) {
    const std::string_view all(message.data(), message.size());
    if (all.empty() || all.substr(0, 7) == "libudev") {
        return std::nullopt;
    }

    // Header "action@devpath" ends at the first NUL
    const auto headerEnd = all.find('\0');
    const auto header = all.substr(0, headerEnd);
    if (header.find('@') == std::string_view::npos) {
        return std::nullopt;
    }

    Uevent event;
    size_t pos = (headerEnd == std::string_view::npos) ? all.size() : headerEnd + 1;
    while (pos < all.size()) {
        auto end = all.find('\0', pos);
        if (end == std::string_view::npos) end = all.size();
        const auto field = all.substr(pos, end - pos);
        pos = end + 1;

        const auto eq = field.find('=');
        if (eq == std::string_view::npos) continue;
        const auto key = field.substr(0, eq);
        const auto value = field.substr(eq + 1);

        if (key == "ACTION") event.action = value;
        else if (key == "SUBSYSTEM") event.subsystem = value;
        else if (key == "DEVTYPE") event.devType = value;
        else if (key == "PRODUCT") event.product = value;
        else if (key == "BUSNUM") event.bus = parseNumber(value, 10).value_or(0);
        else if (key == "DEVNUM") event.address = parseNumber(value, 10).value_or(0);
    }

    if (event.action.empty()) {
        event.action = header.substr(0, header.find('@'));
    }
    return event;
}

std::optional<DeviceEvent> UsbfsDeviceWatcher::eventFor(
    const Uevent& uevent, uint16_t vendorId, uint16_t productId) const {
    if (uevent.subsystem != "usb" || uevent.devType != "usb_device" || uevent.bus == 0) {
        return std::nullopt;
    }
    if (!productMatches(uevent.product, vendorId, productId)) {
        return std::nullopt;
    }

    DeviceEvent event;
    if (uevent.action == "add") {
        event.kind = DeviceEvent::Kind::Matched;
    } else if (uevent.action == "remove") {
        event.kind = DeviceEvent::Kind::Terminated;
    } else {
        return std::nullopt;
    }

    event.location = locationFor(uevent.bus, uevent.address);
    return event;
}

void UsbfsDeviceWatcher::threadMain() {
    std::vector<char> buffer(kMaxUeventSize);

    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd = {};
        pfd.fd = socket_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            log(LogLevel::Error, kTag, "poll failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        const ssize_t n = ::recv(socket_, buffer.data(), buffer.size(), 0);
        if (n <= 0) {
            if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == ENOBUFS)) {
                // ENOBUFS: the kernel dropped uevents, nothing to recover here
                continue;
            }
            log(LogLevel::Error, kTag, "recv failed: %s", std::strerror(errno));
            break;
        }

        const auto uevent = parseUevent(std::span<const char>(buffer.data(), static_cast<size_t>(n)));
        if (!uevent) continue;

        if (auto event = eventFor(*uevent, vendorId_, productId_)) {
            log(LogLevel::Info, kTag, "%s %s",
                event->kind == DeviceEvent::Kind::Matched ? "Attached" : "Removed",
                event->location.path.c_str());
            sink_(*event);
        }
    }

    running_.store(false, std::memory_order_release);
}

} // namespace Dspi::Console
