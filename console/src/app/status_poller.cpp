#include "status_poller.h"

#include "core/logging.h"
#include "device/device_session.h"
#include "diagnostics/buffer_stats.h"
#include "parameters/parameter_store.h"

#include <chrono>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "POLLER";

uint64_t steadyNowMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

StatusPoller::StatusPoller(
    DeviceSession& session,
    ParameterStore& store,
    BufferStatsReader& bufferStats,
    const ConsoleConfig& config,
    Clock clock
)
    : session_(session)
    , store_(store)
    , bufferStats_(bufferStats)
    , statusIntervalMs_(config.statusPollIntervalMs)
    , statsIntervalMs_(config.statsPollIntervalMs)
    , clock_(clock ? std::move(clock) : Clock(steadyNowMs))
    , debouncer_(config.settleDelayMs)
{
}

StatusPoller::~StatusPoller() {
    stop();
}

uint64_t StatusPoller::nowMs() const {
    return clock_();
}

// =============================================================================
// Connection Hooks
// =============================================================================

void StatusPoller::onConnected() {
    std::lock_guard<std::mutex> lock(debounceMutex_);
    debouncer_.onConnected(nowMs());
}

void StatusPoller::onDisconnected() {
    std::lock_guard<std::mutex> lock(debounceMutex_);
    debouncer_.onDisconnected();
}

bool StatusPoller::hasPendingFetch() const {
    std::lock_guard<std::mutex> lock(debounceMutex_);
    return debouncer_.hasPendingFetch();
}

void StatusPoller::cancelPendingFetch() {
    std::lock_guard<std::mutex> lock(debounceMutex_);
    debouncer_.reset();
}

// =============================================================================
// Scheduling
// =============================================================================

void StatusPoller::tick() {
    if (!session_.isConnected()) {
        return;
    }

    const uint64_t now = nowMs();

    bool fetchDue = false;
    {
        std::lock_guard<std::mutex> lock(debounceMutex_);
        if (debouncer_.shouldFetch(now)) {
            fetchDue = debouncer_.consumePendingFetch();
        }
    }
    if (fetchDue && !store_.fetchAll()) {
        return;
    }

    if (!lastStatusPoll_ || now - *lastStatusPoll_ >= statusIntervalMs_) {
        lastStatusPoll_ = now;
        if (!store_.pollStatus()) {
            return;
        }
    }

    if (!lastStatsPoll_ || now - *lastStatsPoll_ >= statsIntervalMs_) {
        lastStatsPoll_ = now;
        if (bufferStats_.poll() > 0) {
            store_.updateBufferStats(bufferStats_.stats());
        }
    }
}

void StatusPoller::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    thread_ = std::thread(&StatusPoller::threadMain, this);
}

void StatusPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_.store(false, std::memory_order_release);
    }
    wakeCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatusPoller::threadMain() {
    log(LogLevel::Debug, kTag, "Polling every %llu ms", static_cast<unsigned long long>(statusIntervalMs_));

    std::unique_lock<std::mutex> lock(wakeMutex_);
    while (running_.load(std::memory_order_acquire)) {
        lock.unlock();
        tick();
        lock.lock();

        wakeCv_.wait_for(lock, std::chrono::milliseconds(statusIntervalMs_), [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

} // namespace Dspi::Console
