#pragma once

// ==============================================================================
// SerialExecutor - Single-Thread FIFO Task Queue
// ==============================================================================
// Every control transfer and every hot-plug transition runs on this one worker
// thread, in submission order, so no two transfers are ever in flight.
//
// Each task is stamped with the generation current at submission. invalidate()
// advances the generation; queued tasks from an older generation are dropped
// without running and their future resolves to false. A task that is already
// running finishes, and can compare generation() against the value it
// captured to discard a stale result.
// ==============================================================================

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>

namespace Dspi::Console {

class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Enqueue a task under the current generation
    /// @return future resolving to true once the task ran, false if it was
    ///         dropped (invalidated or executor shut down)
    std::future<bool> post(Task task);

    /// Block until every task queued before this call has run or been dropped.
    /// Returns immediately when called from the worker thread.
    void drain();

    /// Advance the generation. Returns the new value.
    uint64_t invalidate() noexcept;

    [[nodiscard]] uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool isWorkerThread() const noexcept;

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Drop everything still queued and join the worker. Idempotent.
    void shutdown();

private:
    struct PendingTask {
        Task fn;
        uint64_t generation = 0;
        std::promise<bool> promise;
    };

    void threadMain();

    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> running_{true};

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::queue<PendingTask> tasks_;

    std::thread thread_;
    std::thread::id workerId_;
};

} // namespace Dspi::Console
