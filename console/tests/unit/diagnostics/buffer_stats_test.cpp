// =============================================================================
// BufferStatsReader Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "diagnostics/buffer_stats.h"
#include "mocks/test_rig.h"

#include <set>

using namespace Dspi::Console;
using namespace Dspi::Console::Testing;

TEST_CASE("Counter table covers selectors 3 to 8", "[stats]") {
    std::set<uint16_t> selectors;
    for (const auto& counter : kBufferCounters) {
        selectors.insert(counter.selector);
    }
    CHECK(selectors == std::set<uint16_t>{3, 4, 5, 6, 7, 8});
}

TEST_CASE("poll reads every counter", "[stats]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());
    rig.device->setCounter(kStatusPdmRingOverruns, 1);
    rig.device->setCounter(kStatusPdmDmaUnderruns, 70000);
    rig.device->setCounter(kStatusSpdifUnderruns, 0xDEADBEEF);

    BufferStatsReader reader(rig.session);
    CHECK(reader.poll() == kBufferCounters.size());

    const auto& stats = reader.stats();
    CHECK(stats.pdmRingOverruns == 1);
    CHECK(stats.pdmRingUnderruns == 0);
    CHECK(stats.pdmDmaUnderruns == 70000);
    CHECK(stats.spdifUnderruns == 0xDEADBEEF);

    const auto requests = rig.device->requests();
    REQUIRE(requests.size() == 6);
    for (size_t i = 0; i < requests.size(); ++i) {
        CHECK(requests[i].request == kGetStatus);
        CHECK(requests[i].value == kBufferCounters[i].selector);
        CHECK(requests[i].payload.size() == kCounterSize);
    }
}

TEST_CASE("Failed reads keep the previous values", "[stats]") {
    SessionRig rig;
    REQUIRE(rig.plugAndConnect());
    rig.device->setCounter(kStatusSpdifOverruns, 9);

    BufferStatsReader reader(rig.session);
    REQUIRE(reader.poll() == 6);

    rig.device->setCounter(kStatusSpdifOverruns, 12);
    rig.device->failRequest(kGetStatus);

    CHECK(reader.poll() == 0);
    CHECK(reader.stats().spdifOverruns == 9);
    CHECK_FALSE(rig.session.isConnected());

    reader.reset();
    CHECK(reader.stats() == BufferStats{});
}
