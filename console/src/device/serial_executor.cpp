#include "serial_executor.h"

#include "core/logging.h"

#include <exception>
#include <utility>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "EXECUTOR";

} // namespace

SerialExecutor::SerialExecutor() {
    // workerId_ is written before the thread can observe it
    std::unique_lock<std::mutex> lock(queueMutex_);
    thread_ = std::thread(&SerialExecutor::threadMain, this);
    workerId_ = thread_.get_id();
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

std::future<bool> SerialExecutor::post(Task task) {
    PendingTask pending;
    pending.fn = std::move(task);
    pending.generation = generation();
    auto future = pending.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load(std::memory_order_acquire)) {
            pending.promise.set_value(false);
            return future;
        }
        tasks_.push(std::move(pending));
    }

    queueCv_.notify_one();
    return future;
}

void SerialExecutor::drain() {
    if (isWorkerThread()) {
        return;
    }

    // The marker resolves (run or dropped) only after everything queued before it
    PendingTask marker;
    marker.fn = [] {};
    auto future = marker.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        marker.generation = generation();
        tasks_.push(std::move(marker));
    }

    queueCv_.notify_one();
    future.wait();
}

uint64_t SerialExecutor::invalidate() noexcept {
    return generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

bool SerialExecutor::isWorkerThread() const noexcept {
    return std::this_thread::get_id() == workerId_;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    queueCv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    // Anything left was queued behind the stop request
    std::lock_guard<std::mutex> lock(queueMutex_);
    while (!tasks_.empty()) {
        tasks_.front().promise.set_value(false);
        tasks_.pop();
    }
}

void SerialExecutor::threadMain() {
    {
        // Wait for the constructor to publish workerId_
        std::lock_guard<std::mutex> lock(queueMutex_);
    }

    while (true) {
        PendingTask task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] {
                return !tasks_.empty() || !running_.load(std::memory_order_acquire);
            });
            if (!running_.load(std::memory_order_acquire)) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (task.generation != generation()) {
            DSPI_TRACE(kTag, "Dropped task from generation %llu",
                       static_cast<unsigned long long>(task.generation));
            task.promise.set_value(false);
            continue;
        }

        try {
            task.fn();
        } catch (const std::exception& e) {
            log(LogLevel::Error, kTag, "Task threw: %s", e.what());
            task.promise.set_value(false);
            continue;
        }
        task.promise.set_value(true);
    }
}

} // namespace Dspi::Console
