#pragma once

// ==============================================================================
// ParameterStore - Host Mirror of the Device State
// ==============================================================================
// Holds every channel's bands, delay, gain and mute, the global preamp and
// bypass, the live status and the buffer-health counters.
//
// Writes are optimistic: the cache changes first, then one fire-and-forget
// request goes to the device. Nothing is read back until the next fetchAll().
//
// fetchAll() reconciles device values into the cache. A value that differs
// from the cache by no more than its threshold is left alone:
//   delay  0.01 ms
//   preamp 0.1 dB, output gain 0.1 dB
//   bands, bypass, mute  exact
//
// Thread Safety: all methods may be called from any thread. The store lock is
// never held while a request is in flight. Listeners run on the calling thread
// after the lock is released.
// ==============================================================================

#include "channel_layout.h"
#include "state_snapshot.h"

#include <dspi/dsp/core/filter_params.h>
#include <dspi/dsp/core/math_constants.h>
#include <dspi/dsp/systems/frequency_response.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace Dspi::Console {

class DeviceSession;

class ParameterStore {
public:
    using Listener = std::function<void(ChangeKind)>;

    static constexpr float kDelayEpsilonMs = 0.01f;
    static constexpr float kPreampEpsilonDb = 0.1f;
    static constexpr float kGainEpsilonDb = 0.1f;

    /// @param session Non-owning. Must outlive the store.
    /// @param sampleRate Rate used for response curves
    explicit ParameterStore(DeviceSession& session, float sampleRate = DSP::kDeviceSampleRate);

    // ==========================================================================
    // Synchronization
    // ==========================================================================

    /// Read preamp, bypass, then per channel its bands followed by delay, gain
    /// and mute for outputs. Stops at the first absent read and leaves the
    /// cache untouched; otherwise reconciles everything at once.
    /// @return false if the device did not answer
    bool fetchAll();

    /// Replace SystemStatus from one combined status read
    /// @return false if the device did not answer (status left as is)
    bool pollStatus();

    /// Publish counters read by BufferStatsReader
    void updateBufferStats(const BufferStats& stats);

    /// Number of fetchAll() calls so far, answered or not
    uint64_t fetchCount() const;

    // ==========================================================================
    // Optimistic Writes
    // ==========================================================================

    /// @return false if @p band is out of range for @p ch (nothing sent)
    bool setFilter(Channel ch, size_t band, const DSP::FilterParams& params);

    /// Clamped to 0-170 ms. @return false for an input channel.
    bool setDelay(Channel ch, float ms);

    /// Clamped to -60..+10 dB
    void setPreampGain(float db);

    void setBypass(bool enabled);

    /// @return false for an input channel
    bool setChannelGain(Channel ch, float db);

    /// @return false for an input channel
    bool setChannelMute(Channel ch, bool muted);

    /// Write the first bandCount(ch) entries of @p filters to consecutive
    /// bands and reset the remaining bands to the default off filter
    void applyFilterSet(Channel ch, std::span<const DSP::FilterParams> filters);

    /// Reset every band of @p ch to the default off filter
    void clearChannelBands(Channel ch);

    /// Reset every band of both input channels
    void clearMasterBands();

    // ==========================================================================
    // Display State
    // ==========================================================================

    void setVisibility(Channel ch, bool visible);

    /// Show only @p ch, or every channel when nullopt
    void soloVisibility(std::optional<Channel> ch);

    // ==========================================================================
    // Reading
    // ==========================================================================

    StateSnapshot snapshot() const;

    uint64_t revision() const;

    /// Response of @p ch over the standard sweep, with the master bypass
    /// applied to input channels
    std::vector<float> channelResponse(Channel ch, size_t numPoints = DSP::kDefaultResponsePoints) const;

    /// Response of @p ch at one frequency, bypass applied
    float channelResponseDbAt(Channel ch, float frequency) const;

    float sampleRate() const { return sampleRate_; }

    // ==========================================================================
    // Change Notification
    // ==========================================================================

    void addListener(Listener listener);

private:
    struct FetchedChannel {
        std::vector<DSP::FilterParams> bands;
        float delayMs = 0.0f;
        float gainDb = 0.0f;
        bool muted = false;
    };

    std::optional<DSP::FilterParams> fetchFilter(Channel ch, size_t band);
    std::optional<float> fetchFloat(uint8_t opcode, uint16_t value);
    std::optional<bool> fetchFlag(uint8_t opcode, uint16_t value);

    void sendFilter(Channel ch, size_t band, const DSP::FilterParams& params);

    /// Bump the revision and remember @p kind for notify(). Lock must be held.
    void markChanged(ChangeKind kind, std::vector<ChangeKind>& changes);
    void notify(const std::vector<ChangeKind>& changes);

    /// Caller holds the lock
    bool bypassAppliesTo(Channel ch) const { return isInput(ch) && global_.bypass; }

    DeviceSession& session_;
    float sampleRate_;

    mutable std::mutex mutex_;
    std::array<ChannelState, kNumChannels> channels_;
    GlobalState global_;
    SystemStatus status_;
    BufferStats stats_;
    uint64_t revision_ = 0;
    uint64_t fetchCount_ = 0;

    std::mutex listenerMutex_;
    std::vector<Listener> listeners_;
};

} // namespace Dspi::Console
