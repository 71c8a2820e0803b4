#pragma once

// ==============================================================================
// StateSnapshot - Immutable Copy of the Parameter Store
// ==============================================================================
// Consumers read a snapshot instead of observing live fields. revision grows
// by one for every store mutation that changed data, so an unchanged revision
// means nothing changed.
// ==============================================================================

#include "channel_layout.h"
#include "protocol/wire_format.h"

#include <dspi/dsp/core/filter_params.h>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace Dspi::Console {

struct ChannelState {
    std::vector<DSP::FilterParams> bands;   // size == bandCount(channel)
    float delayMs = 0.0f;                   // outputs only
    float gainDb = 0.0f;                    // outputs only
    bool muted = false;                     // outputs only
    bool visible = true;                    // display only, never sent

    bool operator==(const ChannelState&) const = default;
};

struct GlobalState {
    float preampDb = 0.0f;
    bool bypass = false;     // masks the input channels' response only

    bool operator==(const GlobalState&) const = default;
};

/// Buffer-health counters (status selectors 3-8)
struct BufferStats {
    uint32_t pdmRingOverruns = 0;
    uint32_t pdmRingUnderruns = 0;
    uint32_t pdmDmaOverruns = 0;
    uint32_t pdmDmaUnderruns = 0;
    uint32_t spdifOverruns = 0;
    uint32_t spdifUnderruns = 0;

    bool operator==(const BufferStats&) const = default;
};

struct StateSnapshot {
    std::array<ChannelState, kNumChannels> channels;
    GlobalState global;
    SystemStatus status;
    BufferStats stats;
    bool connected = false;
    uint64_t revision = 0;

    const ChannelState& channel(Channel ch) const { return channels[channelIndex(ch)]; }

    std::span<const DSP::FilterParams> bands(Channel ch) const { return channel(ch).bands; }
};

/// What a store mutation touched
enum class ChangeKind : uint8_t {
    Filters,
    Delay,
    Global,       // preamp or bypass
    Output,       // gain or mute
    Status,
    Visibility,
    Stats
};

} // namespace Dspi::Console
