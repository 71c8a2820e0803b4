// =============================================================================
// ConsoleContext Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "app/console_context.h"
#include "mocks/test_rig.h"

#include <dspi/dsp/core/math_constants.h>

using namespace Dspi::Console;
using namespace Dspi::Console::Testing;

TEST_CASE("Context passes the configured ids to discovery", "[context]") {
    FakeDspDevice* device = new FakeDspDevice();
    MockDeviceWatcher* watcher = new MockDeviceWatcher();
    const ConsoleConfig config{.vendorId = 0x1209, .productId = 0xd5b1};
    ConsoleContext context(config, std::unique_ptr<ControlTransport>(device),
                           std::unique_ptr<DeviceWatcher>(watcher));

    CHECK_FALSE(context.connectAndWait());
    CHECK(watcher->vendorId() == 0x1209);
    CHECK(watcher->productId() == 0xd5b1);
    CHECK(context.config().productId == 0xd5b1);
}

TEST_CASE("connectAndWait reports a present device", "[context]") {
    ContextRig rig;
    rig.watcher->plug(kFakeLocation);

    CHECK(rig.context.connectAndWait());
    CHECK(rig.context.session().currentDevice() == kFakeLocation);
    CHECK(rig.context.poller().hasPendingFetch());
}

TEST_CASE("Every part shares one session", "[context]") {
    ContextRig rig;
    rig.watcher->plug(kFakeLocation);
    REQUIRE(rig.context.connectAndWait());

    rig.context.store().setBypass(true);
    CHECK(rig.context.persistence().save() == FlashResult::Ok);
    CHECK(rig.context.bufferStats().poll() == kBufferCounters.size());

    CHECK(rig.device->state().bypass);
    CHECK(rig.device->maxOpenHandles() == 1);
}

TEST_CASE("Response curves use the device sample rate", "[context]") {
    ConsoleConfigLoader loader;
    CHECK_FALSE(loader.setValue("sample-rate", "96000"));

    ConsoleContext context(loader.config(), std::make_unique<FakeDspDevice>(),
                           std::make_unique<MockDeviceWatcher>());
    CHECK(context.store().sampleRate() == Dspi::DSP::kDeviceSampleRate);
}

TEST_CASE("Destroying the context closes the device", "[context]") {
    FakeDspDevice* device = new FakeDspDevice();
    auto* watcher = new MockDeviceWatcher();
    watcher->plug(kFakeLocation);

    // The device is owned by the context, so observe it through a listener
    bool closedBeforeDestruction = false;
    {
        ConsoleContext context(ConsoleConfig{}, std::unique_ptr<ControlTransport>(device),
                               std::unique_ptr<DeviceWatcher>(watcher));
        REQUIRE(context.connectAndWait());
        context.session().addStateListener([&](ConnectionState state) {
            if (state == ConnectionState::Disconnected) closedBeforeDestruction = true;
        });
        context.poller().start();
    }

    CHECK(closedBeforeDestruction);
}
