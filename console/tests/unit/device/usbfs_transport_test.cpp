// =============================================================================
// UsbfsTransport Tests
// =============================================================================
// Open and exclusivity behaviour against a temporary file standing in for the
// device node. No transfer reaches real hardware.
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "console_ids.h"
#include "device/usbfs_transport.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace Dspi::Console;
namespace fs = std::filesystem;

namespace {

class TempNode {
public:
    TempNode() {
        path_ = fs::temp_directory_path() /
                ("dspi_node_" + std::to_string(::getpid()) + "_" + std::to_string(++counter_));
        std::ofstream(path_).put('\0');
    }
    ~TempNode() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    DeviceLocation location() const { return {path_.string(), 1, 7}; }

private:
    static inline int counter_ = 0;
    fs::path path_;
};

} // namespace

TEST_CASE("Opening a missing node reports NotFound", "[usbfs][open]") {
    UsbfsTransport transport;

    CHECK(transport.open({"/dev/bus/usb/999/999", 999, 999}) == OpenResult::NotFound);
    CHECK_FALSE(transport.isOpen());
    CHECK(transport.getLastError().rfind("open: ", 0) == 0);
}

TEST_CASE("A node held by another console reports Busy", "[usbfs][open]") {
    TempNode node;
    UsbfsTransport first;
    UsbfsTransport second;

    REQUIRE(first.open(node.location()) == OpenResult::Ok);
    CHECK(first.isOpen());

    CHECK(second.open(node.location()) == OpenResult::Busy);
    CHECK_FALSE(second.isOpen());
    CHECK(second.getLastError().rfind("lock: ", 0) == 0);

    SECTION("closing releases the node") {
        first.close();
        CHECK(second.open(node.location()) == OpenResult::Ok);
    }

    SECTION("reopening the same transport keeps a single hold") {
        REQUIRE(first.open(node.location()) == OpenResult::Ok);
        CHECK(second.open(node.location()) == OpenResult::Busy);
    }
}

TEST_CASE("Transfers on a closed transport fail", "[usbfs][transfer]") {
    UsbfsTransport transport;
    const uint8_t payload[4] = {1, 2, 3, 4};

    CHECK_FALSE(transport.controlOut(kSetPreamp, 0, payload));
    CHECK_FALSE(transport.controlIn(kGetPreamp, 0, 4).has_value());
    CHECK(transport.getLastError() == "device not open");
}

TEST_CASE("A node that is not a USB device fails its transfers", "[usbfs][transfer]") {
    TempNode node;
    UsbfsTransport transport;
    REQUIRE(transport.open(node.location()) == OpenResult::Ok);

    CHECK_FALSE(transport.controlIn(kGetPreamp, 0, 4).has_value());
    CHECK(transport.getLastError().rfind("control transfer: ", 0) == 0);
    CHECK(transport.isOpen());
}
