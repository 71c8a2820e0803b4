// =============================================================================
// SerialExecutor Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "device/serial_executor.h"

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace Dspi::Console;

namespace {

/// Holds the worker inside a task until release() is called
class WorkerGate {
public:
    SerialExecutor::Task blocker() {
        return [this] {
            entered_.set_value();
            released_.wait();
        };
    }

    void waitUntilBlocked() { enteredFuture_.wait(); }
    void release() { release_.set_value(); }

private:
    std::promise<void> entered_;
    std::future<void> enteredFuture_ = entered_.get_future();
    std::promise<void> release_;
    std::shared_future<void> released_ = release_.get_future().share();
};

} // namespace

TEST_CASE("Tasks run in submission order", "[executor]") {
    SerialExecutor executor;
    std::mutex mutex;
    std::vector<int> order;

    std::vector<std::future<bool>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(executor.post([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }
    executor.drain();

    REQUIRE(order.size() == 20);
    for (int i = 0; i < 20; ++i) {
        CHECK(order[static_cast<size_t>(i)] == i);
        CHECK(results[static_cast<size_t>(i)].get());
    }
}

TEST_CASE("Tasks run on the worker thread", "[executor]") {
    SerialExecutor executor;
    std::atomic<bool> onWorker{false};

    CHECK_FALSE(executor.isWorkerThread());
    executor.post([&] { onWorker = executor.isWorkerThread(); }).wait();

    CHECK(onWorker.load());
}

TEST_CASE("invalidate drops queued tasks from the old generation", "[executor]") {
    SerialExecutor executor;
    WorkerGate gate;
    std::atomic<int> ran{0};

    auto blocker = executor.post(gate.blocker());
    gate.waitUntilBlocked();

    auto stale1 = executor.post([&] { ++ran; });
    auto stale2 = executor.post([&] { ++ran; });

    const auto before = executor.generation();
    CHECK(executor.invalidate() == before + 1);

    auto fresh = executor.post([&] { ran += 10; });
    gate.release();

    CHECK(blocker.get());
    CHECK_FALSE(stale1.get());
    CHECK_FALSE(stale2.get());
    CHECK(fresh.get());
    CHECK(ran.load() == 10);
}

TEST_CASE("A running task can detect that it went stale", "[executor]") {
    SerialExecutor executor;
    std::promise<void> captured;
    std::promise<void> invalidated;
    std::atomic<bool> stale{false};

    auto done = executor.post([&] {
        const auto gen = executor.generation();
        captured.set_value();
        invalidated.get_future().wait();
        stale = executor.generation() != gen;
    });

    captured.get_future().wait();
    executor.invalidate();
    invalidated.set_value();

    CHECK(done.get());
    CHECK(stale.load());
}

TEST_CASE("drain waits for earlier tasks", "[executor]") {
    SerialExecutor executor;
    std::atomic<int> count{0};

    for (int i = 0; i < 5; ++i) {
        (void)executor.post([&] { ++count; });
    }
    executor.drain();

    CHECK(count.load() == 5);
}

TEST_CASE("drain from the worker thread returns immediately", "[executor]") {
    SerialExecutor executor;
    std::atomic<bool> returned{false};

    executor.post([&] {
        executor.drain();
        returned = true;
    }).wait();

    CHECK(returned.load());
}

TEST_CASE("A throwing task resolves to false and the worker survives", "[executor]") {
    SerialExecutor executor;

    auto thrown = executor.post([] { throw std::runtime_error("boom"); });
    auto after = executor.post([] {});

    CHECK_FALSE(thrown.get());
    CHECK(after.get());
}

TEST_CASE("shutdown resolves queued and later tasks to false", "[executor]") {
    SerialExecutor executor;
    WorkerGate gate;

    auto blocker = executor.post(gate.blocker());
    gate.waitUntilBlocked();
    auto queued = executor.post([] {});

    std::thread stopper([&] { executor.shutdown(); });
    gate.release();
    stopper.join();

    CHECK(blocker.get());
    CHECK_FALSE(queued.get());
    CHECK_FALSE(executor.isRunning());
    CHECK_FALSE(executor.post([] {}).get());

    // Idempotent, and drain after shutdown does not block
    executor.shutdown();
    executor.drain();
}
