#pragma once

// ==============================================================================
// DeviceSession - Connection State Machine and Request Serialization
// ==============================================================================
// Owns the transfer primitive (and so the open handle), the hot-plug watcher
// and the executor every transfer runs on.
//
//   Disconnected --(matched device opened)--> Connected
//   Connected --(termination event | failed get)--> Disconnected
//
// Leaving Connected always closes the handle before any later match is
// handled, so at most one handle is ever open. A freshly added node may still
// be root-only until udev applies its rules, so an open refused for
// permissions is retried a few times before the match is given up. Hot-plug events are posted onto
// the executor; a termination also advances the executor generation at once,
// so queued work from the old session is dropped and an in-flight get that
// completes afterwards reports absent.
//
// Thread Safety: all public methods may be called from any thread. State
// listeners run on the executor thread.
// ==============================================================================

#include "console_ids.h"
#include "control_transport.h"
#include "device_watcher.h"
#include "serial_executor.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Dspi::Console {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connected
};

/// Last condition worth reporting to the user
enum class SessionError : uint8_t {
    None,
    DeviceBusy,        // exclusive access held elsewhere, connect() again to retry
    DeviceRemoved,     // termination notification
    NotResponding,     // a get failed while connected
    OpenFailed         // permissions or other open error
};

class DeviceSession {
public:
    using StateListener = std::function<void(ConnectionState)>;
    using Bytes = std::vector<uint8_t>;

    static constexpr int kDefaultOpenRetries = 10;
    static constexpr std::chrono::milliseconds kDefaultOpenRetryDelay{100};

    DeviceSession(
        std::unique_ptr<ControlTransport> transport,
        std::unique_ptr<DeviceWatcher> watcher,
        uint16_t vendorId = kDefaultVendorId,
        uint16_t productId = kDefaultProductId
    );
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // ==========================================================================
    // Connection
    // ==========================================================================

    /// Tear down any handle and subscription, then restart discovery.
    /// An already-plugged device is matched asynchronously; call drain() to
    /// wait for the outcome. Must not be called from a state listener.
    void connect();

    /// Stop discovery and close the handle
    void disconnect();

    [[nodiscard]] ConnectionState connectionState() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool isConnected() const noexcept {
        return connectionState() == ConnectionState::Connected;
    }

    /// Location of the open device, if connected
    std::optional<DeviceLocation> currentDevice() const;

    /// Register a callback for every Connected/Disconnected transition
    void addStateListener(StateListener listener);

    /// Retries after an open refused for permissions. Call before connect().
    void setOpenRetryPolicy(int retries, std::chrono::milliseconds delay) {
        openRetries_ = retries;
        openRetryDelay_ = delay;
    }

    // ==========================================================================
    // Requests
    // ==========================================================================

    /// Fire-and-forget host-to-device request. Silent no-op when disconnected.
    void sendSet(uint8_t opcode, uint16_t value, std::span<const uint8_t> payload);

    /// Blocking device-to-host request.
    /// @return exactly @p length bytes, or nullopt on any failure. A failure
    ///         while connected forces the session to Disconnected first.
    std::optional<Bytes> sendGet(uint8_t opcode, uint16_t value, uint16_t length);

    /// Wait until every request and event queued so far has been handled
    void drain();

    // ==========================================================================
    // Errors
    // ==========================================================================

    SessionError lastError() const;

    /// User-facing text for lastError() ("Device busy.", "Device removed", ...)
    std::string getLastError() const;

private:
    void onDeviceEvent(const DeviceEvent& event);

    // Executor thread only
    void handleMatched(const DeviceLocation& location);
    bool waitBeforeRetry(uint64_t generation);
    void closeHandle(SessionError reason, std::string message);
    void notifyListeners(ConnectionState state);

    void setError(SessionError error, std::string message);

    /// Cut a pending open retry short after invalidate()
    void wakeOpenRetry();

    std::unique_ptr<ControlTransport> transport_;
    std::unique_ptr<DeviceWatcher> watcher_;
    uint16_t vendorId_;
    uint16_t productId_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};

    // Guards openLocation_ and the error fields. Never held across a transfer.
    mutable std::mutex stateMutex_;
    std::optional<DeviceLocation> openLocation_;
    SessionError lastError_ = SessionError::None;
    std::string lastErrorMessage_;

    std::mutex listenerMutex_;
    std::vector<StateListener> listeners_;

    int openRetries_ = kDefaultOpenRetries;
    std::chrono::milliseconds openRetryDelay_ = kDefaultOpenRetryDelay;
    std::mutex retryMutex_;
    std::condition_variable retryCv_;

    // Declared last: the worker is joined before the transport is destroyed
    SerialExecutor executor_;
};

} // namespace Dspi::Console
