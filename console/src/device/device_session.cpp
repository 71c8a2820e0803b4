#include "device_session.h"

#include "core/logging.h"

#include <utility>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "SESSION";

} // namespace

DeviceSession::DeviceSession(
    std::unique_ptr<ControlTransport> transport,
    std::unique_ptr<DeviceWatcher> watcher,
    uint16_t vendorId,
    uint16_t productId
)
    : transport_(std::move(transport))
    , watcher_(std::move(watcher))
    , vendorId_(vendorId)
    , productId_(productId)
{
}

DeviceSession::~DeviceSession() {
    disconnect();
    executor_.shutdown();
}

// =============================================================================
// Connection
// =============================================================================

void DeviceSession::connect() {
    if (executor_.isWorkerThread()) {
        log(LogLevel::Error, kTag, "connect() called from the session thread, ignored");
        return;
    }

    disconnect();

    log(LogLevel::Info, kTag, "Watching for %04x:%04x", vendorId_, productId_);
    const bool watching = watcher_->start(vendorId_, productId_,
        [this](const DeviceEvent& event) { onDeviceEvent(event); });
    if (!watching) {
        log(LogLevel::Warning, kTag, "Hot-plug notifications unavailable, only present devices are seen");
    }
}

void DeviceSession::disconnect() {
    if (executor_.isWorkerThread()) {
        log(LogLevel::Error, kTag, "disconnect() called from the session thread, ignored");
        return;
    }

    watcher_->stop();

    // Drop queued work of the old session, then close under the new generation.
    // A concurrent failed get may advance the generation again, so retry.
    executor_.invalidate();
    wakeOpenRetry();
    const auto close = [this] { closeHandle(SessionError::None, {}); };
    while (!executor_.post(close).get()) {
        if (!executor_.isRunning()) {
            // Worker joined, nothing else can touch the transport
            transport_->close();
            state_.store(ConnectionState::Disconnected, std::memory_order_release);
            break;
        }
    }
}

std::optional<DeviceLocation> DeviceSession::currentDevice() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return openLocation_;
}

void DeviceSession::addStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

void DeviceSession::onDeviceEvent(const DeviceEvent& event) {
    if (event.kind == DeviceEvent::Kind::Matched) {
        // Fire-and-forget: the outcome is observed through the state
        auto queued = executor_.post([this, location = event.location] { handleMatched(location); });
        (void)queued;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!openLocation_ || openLocation_->path != event.location.path) {
            DSPI_TRACE(kTag, "Ignoring removal of %s", event.location.path.c_str());
            return;
        }
    }

    // Invalidate before queueing so nothing already queued touches the handle
    executor_.invalidate();
    auto queued = executor_.post([this] { closeHandle(SessionError::DeviceRemoved, "Device removed"); });
    (void)queued;
}

void DeviceSession::handleMatched(const DeviceLocation& location) {
    if (transport_->isOpen()) {
        log(LogLevel::Debug, kTag, "Already connected, ignoring %s", location.path.c_str());
        return;
    }

    // A node announced by a raw kernel uevent can still be root-only until udev
    // has applied its rules
    const uint64_t generation = executor_.generation();
    OpenResult result = transport_->open(location);
    for (int retry = 1; result == OpenResult::AccessDenied && retry <= openRetries_; ++retry) {
        log(LogLevel::Debug, kTag, "%s not accessible yet, retry %d of %d",
            location.path.c_str(), retry, openRetries_);
        if (!waitBeforeRetry(generation)) {
            return;
        }
        result = transport_->open(location);
    }

    switch (result) {
        case OpenResult::Ok:
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                openLocation_ = location;
                lastError_ = SessionError::None;
                lastErrorMessage_.clear();
            }
            state_.store(ConnectionState::Connected, std::memory_order_release);
            log(LogLevel::Info, kTag, "Connected to %s", location.path.c_str());
            notifyListeners(ConnectionState::Connected);
            break;

        case OpenResult::Busy:
            setError(SessionError::DeviceBusy, "Device busy.");
            log(LogLevel::Warning, kTag, "%s is held by another console", location.path.c_str());
            break;

        case OpenResult::NotFound:
            log(LogLevel::Info, kTag, "%s disappeared before it could be opened", location.path.c_str());
            break;

        case OpenResult::AccessDenied:
        case OpenResult::Error:
            setError(SessionError::OpenFailed, "Cannot open device: " + transport_->getLastError());
            log(LogLevel::Error, kTag, "Cannot open %s: %s",
                location.path.c_str(), transport_->getLastError().c_str());
            break;
    }
}

bool DeviceSession::waitBeforeRetry(uint64_t generation) {
    std::unique_lock<std::mutex> lock(retryMutex_);
    retryCv_.wait_for(lock, openRetryDelay_, [&] { return executor_.generation() != generation; });
    return executor_.generation() == generation;
}

void DeviceSession::wakeOpenRetry() {
    {
        std::lock_guard<std::mutex> lock(retryMutex_);
    }
    retryCv_.notify_all();
}

void DeviceSession::closeHandle(SessionError reason, std::string message) {
    transport_->close();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        openLocation_.reset();
        lastError_ = reason;
        lastErrorMessage_ = std::move(message);
    }

    if (state_.exchange(ConnectionState::Disconnected, std::memory_order_acq_rel) == ConnectionState::Connected) {
        log(reason == SessionError::None ? LogLevel::Info : LogLevel::Warning, kTag,
            "Disconnected%s%s", reason == SessionError::None ? "" : ": ", getLastError().c_str());
        notifyListeners(ConnectionState::Disconnected);
    }
}

void DeviceSession::notifyListeners(ConnectionState state) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(state);
    }
}

// =============================================================================
// Requests
// =============================================================================

void DeviceSession::sendSet(uint8_t opcode, uint16_t value, std::span<const uint8_t> payload) {
    if (!isConnected()) {
        return;
    }

    auto task = [this, opcode, value, data = Bytes(payload.begin(), payload.end())] {
        if (!transport_->isOpen()) {
            return;
        }
        if (!transport_->controlOut(opcode, value, data)) {
            log(LogLevel::Warning, kTag, "Set 0x%02x wValue=0x%04x not delivered: %s",
                opcode, value, transport_->getLastError().c_str());
        }
    };

    if (executor_.isWorkerThread()) {
        task();
        return;
    }

    // Fire-and-forget: no delivery confirmation beyond the transfer itself
    auto queued = executor_.post(std::move(task));
    (void)queued;
}

std::optional<DeviceSession::Bytes> DeviceSession::sendGet(uint8_t opcode, uint16_t value, uint16_t length) {
    if (!isConnected()) {
        return std::nullopt;
    }

    std::optional<Bytes> result;
    const uint64_t generation = executor_.generation();

    auto task = [&] {
        if (!transport_->isOpen()) {
            return;
        }

        result = transport_->controlIn(opcode, value, length);

        if (executor_.generation() != generation) {
            // The session was torn down while this transfer was in flight
            result.reset();
            return;
        }

        if (!result && isConnected()) {
            log(LogLevel::Warning, kTag, "Get 0x%02x wValue=0x%04x failed (%s), dropping session",
                opcode, value, transport_->getLastError().c_str());
            executor_.invalidate();
            closeHandle(SessionError::NotResponding, "Device not responding");
        }
    };

    if (executor_.isWorkerThread()) {
        task();
        return result;
    }

    if (!executor_.post(task).get()) {
        return std::nullopt;
    }
    return result;
}

void DeviceSession::drain() {
    executor_.drain();
}

// =============================================================================
// Errors
// =============================================================================

SessionError DeviceSession::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

std::string DeviceSession::getLastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastErrorMessage_;
}

void DeviceSession::setError(SessionError error, std::string message) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastError_ = error;
    lastErrorMessage_ = std::move(message);
}

} // namespace Dspi::Console
