// =============================================================================
// DeviceSession Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "device/device_session.h"
#include "mocks/test_rig.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace Dspi::Console;
using namespace Dspi::Console::Testing;

TEST_CASE("connect opens a plugged device", "[session][connect]") {
    SessionRig rig;

    REQUIRE(rig.plugAndConnect());
    CHECK(rig.session.connectionState() == ConnectionState::Connected);
    CHECK(rig.session.currentDevice() == kFakeLocation);
    CHECK(rig.device->lastLocation() == kFakeLocation);
    CHECK(rig.watcher->vendorId() == kDefaultVendorId);
    CHECK(rig.watcher->productId() == kDefaultProductId);
    CHECK(rig.session.lastError() == SessionError::None);
}

TEST_CASE("Custom ids are passed to the watcher", "[session][connect]") {
    auto* device = new FakeDspDevice();
    auto* watcher = new MockDeviceWatcher();
    DeviceSession session(std::unique_ptr<ControlTransport>(device),
                          std::unique_ptr<DeviceWatcher>(watcher), 0x1209, 0x0001);

    session.connect();
    session.drain();

    CHECK(watcher->vendorId() == 0x1209);
    CHECK(watcher->productId() == 0x0001);
    CHECK_FALSE(session.isConnected());
}

TEST_CASE("No device present leaves the session disconnected", "[session][connect]") {
    SessionRig rig;
    rig.session.connect();
    rig.session.drain();

    CHECK_FALSE(rig.session.isConnected());
    CHECK(rig.device->openCalls() == 0);
    CHECK_FALSE(rig.session.currentDevice().has_value());
}

TEST_CASE("A later plug-in connects without calling connect again", "[session][connect]") {
    SessionRig rig;
    rig.session.connect();
    rig.session.drain();
    REQUIRE_FALSE(rig.session.isConnected());

    rig.watcher->plug(kFakeLocation);
    rig.session.drain();

    CHECK(rig.session.isConnected());
}

TEST_CASE("Reconnecting never holds two handles", "[session][connect]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    rig.session.connect();
    rig.session.drain();
    rig.session.connect();
    rig.session.drain();

    CHECK(rig.session.isConnected());
    CHECK(rig.device->openHandleCount() == 1);
    CHECK(rig.device->maxOpenHandles() == 1);
    CHECK(rig.device->successfulOpens() == 3);
    CHECK(rig.watcher->stopCalls() >= 2);
}

TEST_CASE("A duplicate match while connected is ignored", "[session][connect]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    rig.watcher->plug(DeviceLocation{"/dev/bus/usb/001/009", 1, 9});
    rig.session.drain();

    CHECK(rig.device->openCalls() == 1);
    CHECK(rig.session.currentDevice() == kFakeLocation);
}

TEST_CASE("Exclusive access held elsewhere reports Device busy", "[session][connect]") {
    SessionRig rig;
    rig.device->setBusy(true);

    CHECK_FALSE(rig.plugAndConnect());
    CHECK(rig.session.lastError() == SessionError::DeviceBusy);
    CHECK(rig.session.getLastError() == "Device busy.");
    CHECK(rig.device->openHandleCount() == 0);

    SECTION("retrying after the other process lets go succeeds") {
        rig.device->setBusy(false);
        rig.session.connect();
        rig.session.drain();

        CHECK(rig.session.isConnected());
        CHECK(rig.session.lastError() == SessionError::None);
    }
}

TEST_CASE("A node not yet accessible is opened once permissions arrive", "[session][connect]") {
    SessionRig rig;
    rig.session.setOpenRetryPolicy(5, std::chrono::milliseconds(1));
    rig.device->denyAccess(2);

    CHECK(rig.plugAndConnect());
    CHECK(rig.device->openCalls() == 3);
    CHECK(rig.device->openHandleCount() == 1);
    CHECK(rig.session.lastError() == SessionError::None);
}

TEST_CASE("A node that stays inaccessible reports the open failure", "[session][connect]") {
    SessionRig rig;
    rig.session.setOpenRetryPolicy(3, std::chrono::milliseconds(1));
    rig.device->denyAccess(-1);

    CHECK_FALSE(rig.plugAndConnect());
    CHECK(rig.device->openCalls() == 4);
    CHECK(rig.session.lastError() == SessionError::OpenFailed);
    CHECK(rig.device->openHandleCount() == 0);
}

TEST_CASE("disconnect cuts a pending open retry short", "[session][connect]") {
    SessionRig rig;
    rig.session.setOpenRetryPolicy(3, std::chrono::seconds(30));
    rig.device->denyAccess(-1);
    rig.watcher->plug(kFakeLocation);
    rig.session.connect();

    const auto start = std::chrono::steady_clock::now();
    rig.session.disconnect();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed < std::chrono::seconds(10));
    CHECK_FALSE(rig.session.isConnected());
    CHECK(rig.device->openHandleCount() == 0);
}

TEST_CASE("Unplugging the open device disconnects", "[session][hotplug]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    rig.watcher->unplug(kFakeLocation);
    rig.session.drain();

    CHECK(rig.session.connectionState() == ConnectionState::Disconnected);
    CHECK(rig.session.lastError() == SessionError::DeviceRemoved);
    CHECK(rig.session.getLastError() == "Device removed");
    CHECK(rig.device->openHandleCount() == 0);
    CHECK_FALSE(rig.session.currentDevice().has_value());

    SECTION("plugging back in reconnects") {
        rig.watcher->plug(kFakeLocation);
        rig.session.drain();
        CHECK(rig.session.isConnected());
        CHECK(rig.device->maxOpenHandles() == 1);
    }
}

TEST_CASE("Removal of another device is ignored", "[session][hotplug]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    const DeviceLocation other{"/dev/bus/usb/002/003", 2, 3};
    rig.watcher->plug(other);
    rig.watcher->unplug(other);
    rig.session.drain();

    CHECK(rig.session.isConnected());
}

TEST_CASE("disconnect closes the handle and stops discovery", "[session][connect]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    rig.session.disconnect();

    CHECK_FALSE(rig.session.isConnected());
    CHECK_FALSE(rig.watcher->isRunning());
    CHECK(rig.device->openHandleCount() == 0);
    CHECK(rig.session.lastError() == SessionError::None);

    // Disconnecting twice is harmless
    rig.session.disconnect();
    CHECK(rig.device->closeCalls() == 1);
}

TEST_CASE("State listeners see every transition", "[session][listener]") {
    SessionRig rig;
    std::mutex mutex;
    std::vector<ConnectionState> seen;
    rig.session.addStateListener([&](ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(state);
    });

    REQUIRE(rig.plugAndConnect());
    rig.watcher->unplug(kFakeLocation);
    rig.session.drain();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == ConnectionState::Connected);
    CHECK(seen[1] == ConnectionState::Disconnected);
}

TEST_CASE("sendSet while disconnected issues no transfer", "[session][requests]") {
    SessionRig rig;
    const std::vector<uint8_t> payload{1};

    rig.session.sendSet(kSetBypass, 0, payload);
    rig.session.drain();

    CHECK(rig.device->requests().empty());
}

TEST_CASE("sendSet delivers the payload in order", "[session][requests]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    const auto first = encodeFloat(3.0f);
    const auto second = encodeFloat(-12.0f);
    rig.session.sendSet(kSetPreamp, 0, first);
    rig.session.sendSet(kSetPreamp, 0, second);
    rig.session.drain();

    const auto requests = rig.device->requests();
    REQUIRE(requests.size() == 2);
    CHECK_FALSE(requests[0].in);
    CHECK(requests[0].payload == first);
    CHECK(requests[1].payload == second);
    CHECK(rig.device->state().preampDb == -12.0f);
}

TEST_CASE("sendGet returns exactly the requested bytes", "[session][requests]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());
    rig.device->editState([](FakeDeviceState& s) { s.preampDb = -4.5f; });

    const auto bytes = rig.session.sendGet(kGetPreamp, 0, kScalarSize);

    REQUIRE(bytes.has_value());
    CHECK(bytes->size() == kScalarSize);
    CHECK(decodeFloat(*bytes) == -4.5f);
}

TEST_CASE("sendGet while disconnected is absent without a transfer", "[session][requests]") {
    SessionRig rig;

    CHECK_FALSE(rig.session.sendGet(kGetPreamp, 0, kScalarSize).has_value());
    CHECK(rig.device->requests().empty());
}

TEST_CASE("A failed get forces Disconnected before returning", "[session][requests]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());
    rig.device->failRequest(kGetBypass);

    const auto bytes = rig.session.sendGet(kGetBypass, 0, kFlagSize);

    CHECK_FALSE(bytes.has_value());
    CHECK_FALSE(rig.session.isConnected());
    CHECK(rig.session.lastError() == SessionError::NotResponding);
    CHECK(rig.session.getLastError() == "Device not responding");
    CHECK(rig.device->openHandleCount() == 0);

    SECTION("later requests are dropped") {
        rig.device->clearRequests();
        rig.session.sendSet(kSetBypass, 0, encodeFlag(true));
        rig.session.drain();
        CHECK(rig.device->requests().empty());
    }
}

TEST_CASE("A wrong-length reply is a failure", "[session][requests]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    // Preamp answers four bytes, asking for eight cannot be satisfied
    CHECK_FALSE(rig.session.sendGet(kGetPreamp, 0, 8).has_value());
    CHECK_FALSE(rig.session.isConnected());
}

TEST_CASE("A get in flight during removal reports absent", "[session][hotplug]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    std::atomic<bool> unplugged{false};
    rig.device->setInHook([&](uint8_t request, uint16_t) {
        if (request == kGetPreamp && !unplugged.exchange(true)) {
            rig.watcher->unplug(kFakeLocation);
        }
    });

    const auto bytes = rig.session.sendGet(kGetPreamp, 0, kScalarSize);
    rig.session.drain();

    CHECK_FALSE(bytes.has_value());
    CHECK_FALSE(rig.session.isConnected());
    CHECK(rig.session.lastError() == SessionError::DeviceRemoved);
    CHECK(rig.device->openHandleCount() == 0);
}

TEST_CASE("Sets queued before a removal are dropped", "[session][hotplug]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());

    std::promise<void> release;
    auto released = release.get_future().share();
    std::promise<void> blocked;

    // Park the executor inside a get so later sets queue up behind it
    rig.device->setInHook([&](uint8_t request, uint16_t) {
        if (request == kGetBypass) {
            blocked.set_value();
            released.wait();
        }
    });

    std::thread getter([&] { (void)rig.session.sendGet(kGetBypass, 0, kFlagSize); });
    blocked.get_future().wait();

    rig.session.sendSet(kSetPreamp, 0, encodeFloat(6.0f));
    rig.watcher->unplug(kFakeLocation);
    release.set_value();
    getter.join();
    rig.session.drain();

    CHECK(rig.device->countRequests(kSetPreamp) == 0);
    CHECK_FALSE(rig.session.isConnected());
}
