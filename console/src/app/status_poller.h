#pragma once

// ==============================================================================
// StatusPoller - Periodic Device Refresh
// ==============================================================================
// While connected, each tick:
//   - runs the one debounced fetchAll() once the settle delay has passed
//     since the last connect event
//   - polls the combined status every statusPollIntervalMs (60 ms)
//   - polls the buffer-health counters every statsPollIntervalMs (1 s)
//
// tick() is public so the schedule can be driven with an injected clock.
// ==============================================================================

#include "core/console_config.h"
#include "parameters/fetch_debouncer.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace Dspi::Console {

class BufferStatsReader;
class DeviceSession;
class ParameterStore;

class StatusPoller {
public:
    /// Milliseconds on a monotonic timeline
    using Clock = std::function<uint64_t()>;

    /// All references are non-owning and must outlive the poller.
    /// An empty clock uses std::chrono::steady_clock.
    StatusPoller(
        DeviceSession& session,
        ParameterStore& store,
        BufferStatsReader& bufferStats,
        const ConsoleConfig& config,
        Clock clock = {}
    );
    ~StatusPoller();

    StatusPoller(const StatusPoller&) = delete;
    StatusPoller& operator=(const StatusPoller&) = delete;

    /// Start the background thread (tick every statusPollIntervalMs)
    void start();

    /// Stop and join. Idempotent.
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /// Session listener hooks. Safe from any thread.
    void onConnected();
    void onDisconnected();

    /// One scheduling pass at the current clock time
    void tick();

    bool hasPendingFetch() const;

    /// Drop the armed fetch when the caller has just fetched itself
    void cancelPendingFetch();

    uint64_t nowMs() const;

private:
    void threadMain();

    DeviceSession& session_;
    ParameterStore& store_;
    BufferStatsReader& bufferStats_;
    uint64_t statusIntervalMs_;
    uint64_t statsIntervalMs_;
    Clock clock_;

    mutable std::mutex debounceMutex_;
    FetchDebouncer debouncer_;

    // Touched by tick() only
    std::optional<uint64_t> lastStatusPoll_;
    std::optional<uint64_t> lastStatsPoll_;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread thread_;
};

} // namespace Dspi::Console
