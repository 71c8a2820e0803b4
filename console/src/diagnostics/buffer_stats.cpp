#include "buffer_stats.h"

#include "device/device_session.h"
#include "protocol/wire_format.h"

namespace Dspi::Console {

BufferStatsReader::BufferStatsReader(DeviceSession& session)
    : session_(session)
{
}

size_t BufferStatsReader::poll() {
    size_t updated = 0;
    for (const auto& counter : kBufferCounters) {
        // A failed get drops the session, the remaining reads then no-op
        auto bytes = session_.sendGet(kGetStatus, counter.selector, kCounterSize);
        if (!bytes) continue;

        if (auto value = decodeU32(*bytes)) {
            stats_.*counter.field = *value;
            ++updated;
        }
    }
    return updated;
}

} // namespace Dspi::Console
