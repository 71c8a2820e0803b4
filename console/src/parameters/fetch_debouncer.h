#pragma once

// =============================================================================
// FetchDebouncer - Settle Delay Between Connect and Bulk Fetch
// =============================================================================
// Pure time-based logic, no threads.
// A device that has just enumerated may still be initialising, and a flaky
// cable can produce several connect events in a row. The bulk fetch runs once,
// a settle delay after the most recent connect event.
//
// Usage:
//   1. Call onConnected() on every transition to Connected
//   2. Periodically call shouldFetch() with the current time
//   3. When it returns true, call consumePendingFetch() and run fetchAll()
// =============================================================================

#include <cstdint>

namespace Dspi::Console {

class FetchDebouncer {
public:
    static constexpr uint64_t kDefaultSettleMs = 100;

    explicit FetchDebouncer(uint64_t settleMs = kDefaultSettleMs)
        : settleMs_(settleMs) {}

    /// Arm (or re-arm) the timer
    void onConnected(uint64_t currentTimeMs) {
        lastConnectTime_ = currentTimeMs;
        hasPending_ = true;
    }

    /// A disconnect cancels any pending fetch
    void onDisconnected() {
        reset();
    }

    /// @return true once the settle delay has elapsed since the last connect
    bool shouldFetch(uint64_t currentTimeMs) const {
        if (!hasPending_) {
            return false;
        }
        return (currentTimeMs - lastConnectTime_) >= settleMs_;
    }

    bool hasPendingFetch() const {
        return hasPending_;
    }

    /// Clear the pending flag. Returns whether one was pending.
    bool consumePendingFetch() {
        const bool was = hasPending_;
        reset();
        return was;
    }

    void reset() {
        hasPending_ = false;
        lastConnectTime_ = 0;
    }

    uint64_t settleMs() const { return settleMs_; }

private:
    uint64_t settleMs_;
    uint64_t lastConnectTime_ = 0;
    bool hasPending_ = false;
};

} // namespace Dspi::Console
