#pragma once

// ==============================================================================
// BufferStatsReader - Buffer-Health Counters
// ==============================================================================
// Reads status selectors 3-8, one little-endian u32 each. A counter whose
// read fails keeps its previous value.
// ==============================================================================

#include "console_ids.h"
#include "parameters/state_snapshot.h"

#include <array>
#include <cstdint>

namespace Dspi::Console {

class DeviceSession;

struct BufferCounter {
    StatusSelector selector;
    uint32_t BufferStats::* field;
    const char* label;
};

inline constexpr std::array<BufferCounter, 6> kBufferCounters = {{
    {kStatusPdmRingOverruns,  &BufferStats::pdmRingOverruns,  "PDM ring overruns"},
    {kStatusPdmRingUnderruns, &BufferStats::pdmRingUnderruns, "PDM ring underruns"},
    {kStatusPdmDmaOverruns,   &BufferStats::pdmDmaOverruns,   "PDM DMA overruns"},
    {kStatusPdmDmaUnderruns,  &BufferStats::pdmDmaUnderruns,  "PDM DMA underruns"},
    {kStatusSpdifOverruns,    &BufferStats::spdifOverruns,    "S/PDIF overruns"},
    {kStatusSpdifUnderruns,   &BufferStats::spdifUnderruns,   "S/PDIF underruns"},
}};

class BufferStatsReader {
public:
    /// @param session Non-owning. Must outlive the reader.
    explicit BufferStatsReader(DeviceSession& session);

    /// Read every counter
    /// @return number of counters that were read successfully
    size_t poll();

    const BufferStats& stats() const { return stats_; }

    void reset() { stats_ = {}; }

private:
    DeviceSession& session_;
    BufferStats stats_;
};

} // namespace Dspi::Console
