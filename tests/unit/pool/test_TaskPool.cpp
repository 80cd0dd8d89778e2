#include "pool/TaskPool.hpp"
#include "support/PoolTestHelpers.hpp"
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace WP;
using namespace WP::Testing;
using namespace std::chrono_literals;

TEST_SUITE("pool.taskpool") {
TEST_CASE("TaskPool runs submitted work and returns values") {
    PoolConfig config;
    config.name        = "basic";
    config.coreWorkers = 2;
    config.maxWorkers  = 2;
    auto pool          = TaskPool::Create(config);
    REQUIRE(pool.has_value());

    auto handle = (*pool)->submit([] { return 6 * 7; });
    REQUIRE(handle.has_value());
    CHECK(handle->wait().value() == 42);

    std::atomic<int>               counter{0};
    std::vector<TaskHandle<void>> handles;
    for (int i = 0; i < 100; ++i) {
        auto h = (*pool)->submit([&] { counter.fetch_add(1); });
        REQUIRE(h.has_value());
        handles.push_back(std::move(*h));
    }
    for (auto& h : handles)
        CHECK(h.wait().has_value());
    CHECK(counter.load() == 100);
    // Handles complete before the worker updates its counters.
    CHECK(eventually([&] { return (*pool)->stats().completedTasks == 101; }));
    CHECK((*pool)->size() <= 2);
}

TEST_CASE("TaskPool::Create rejects inconsistent configuration") {
    PoolConfig config;
    config.coreWorkers = 4;
    config.maxWorkers  = 2;
    auto pool          = TaskPool::Create(config);
    REQUIRE_FALSE(pool.has_value());
    CHECK(pool.error().code == Error::Code::InvalidConfig);
}

TEST_CASE("Dispatch order: core workers, queue, overflow workers, then rejection") {
    auto sink = std::make_shared<RecordingSink>();

    PoolConfig config;
    config.name        = "scenario";
    config.coreWorkers = 2;
    config.maxWorkers  = 4;
    config.queue       = QueueCapacity::Bounded(2);
    config.rejection   = RejectionKind::Abort;
    config.eventSink   = sink;
    TaskPool pool(config);

    Gate                           gate;
    std::atomic<int>               started{0};
    std::vector<TaskHandle<int>>   accepted;
    std::vector<Error>             rejected;
    for (int i = 1; i <= 9; ++i) {
        auto handle = pool.submit([&, i] {
            started.fetch_add(1);
            gate.wait();
            return i;
        });
        if (handle)
            accepted.push_back(std::move(*handle));
        else
            rejected.push_back(handle.error());

        auto stats = pool.stats();
        if (i <= 2) {
            CHECK(stats.workers == static_cast<std::size_t>(i));
            CHECK(stats.queuedTasks == 0);
        } else if (i <= 4) {
            CHECK(stats.workers == 2);
            CHECK(stats.queuedTasks == static_cast<std::size_t>(i - 2));
        } else if (i <= 6) {
            CHECK(stats.workers == static_cast<std::size_t>(i - 2));
            CHECK(stats.queuedTasks == 2);
        }
    }

    REQUIRE(accepted.size() == 6);
    REQUIRE(rejected.size() == 3);
    for (auto const& error : rejected)
        CHECK(error.code == Error::Code::Rejected);
    CHECK(pool.stats().rejectedTasks == 3);
    CHECK(sink->count(PoolEvent::Kind::TaskRejected) == 3);
    CHECK(sink->count(PoolEvent::Kind::WorkerCreated) == 4);

    // Tasks 1, 2, 5 and 6 hold the four workers; 3 and 4 wait in the queue.
    CHECK(eventually([&] { return started.load() == 4; }));
    CHECK(pool.stats().largestWorkers == 4);

    gate.open();
    int sum = 0;
    for (auto& handle : accepted)
        sum += handle.wait().value();
    CHECK(sum == 1 + 2 + 3 + 4 + 5 + 6);
}

TEST_CASE("Concurrent executions never exceed maxWorkers") {
    PoolConfig config;
    config.coreWorkers = 1;
    config.maxWorkers  = 3;
    config.queue       = QueueCapacity::Handoff();
    config.rejection   = RejectionKind::CallerRuns;
    TaskPool pool(config);

    std::atomic<int>               running{0};
    std::atomic<int>               peak{0};
    std::vector<TaskHandle<void>> handles;
    auto const                     body = [&] {
        int now = running.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(2ms);
        running.fetch_sub(1);
    };
    for (int i = 0; i < 60; ++i) {
        auto handle = pool.submit(body);
        REQUIRE(handle.has_value());
        handles.push_back(std::move(*handle));
    }
    for (auto& handle : handles)
        CHECK(handle.wait().has_value());
    // CallerRuns adds the submitting thread on top of the pool's workers.
    CHECK(peak.load() <= 4);
    CHECK(pool.stats().largestWorkers <= 3);
}

TEST_CASE("Failing tasks only fail their own handle") {
    auto       sink = std::make_shared<RecordingSink>();
    PoolConfig config;
    config.coreWorkers = 1;
    config.maxWorkers  = 1;
    config.eventSink   = sink;
    TaskPool pool(config);

    auto bad = pool.submit([]() -> int { throw std::runtime_error("broken"); });
    REQUIRE(bad.has_value());
    auto good = pool.submit([] { return 1; });
    REQUIRE(good.has_value());

    auto failure = bad->wait();
    REQUIRE_FALSE(failure.has_value());
    CHECK(failure.error().code == Error::Code::TaskFailed);
    CHECK(good->wait().value() == 1);

    CHECK(eventually([&] { return pool.stats().completedTasks == 2; }));
    auto stats = pool.stats();
    CHECK(stats.failedTasks == 1);
    CHECK(stats.workers == 1);
    CHECK(sink->count(PoolEvent::Kind::TaskFailed) == 1);
}

TEST_CASE("Idle overflow workers retire after keepAlive") {
    auto       sink = std::make_shared<RecordingSink>();
    PoolConfig config;
    config.coreWorkers = 1;
    config.maxWorkers  = 3;
    config.keepAlive   = 30ms;
    config.queue       = QueueCapacity::Bounded(1);
    config.eventSink   = sink;
    TaskPool pool(config);

    Gate                           gate;
    std::vector<TaskHandle<void>> handles;
    for (int i = 0; i < 4; ++i) {
        auto handle = pool.submit([&] { gate.wait(); });
        REQUIRE(handle.has_value());
        handles.push_back(std::move(*handle));
    }
    CHECK(pool.size() == 3);
    gate.open();
    for (auto& handle : handles)
        CHECK(handle.wait().has_value());

    CHECK(eventually([&] { return pool.size() == 1; }));
    CHECK(eventually([&] { return sink->count(PoolEvent::Kind::WorkerRetired) >= 2; }));
    // The core worker stays.
    std::this_thread::sleep_for(80ms);
    CHECK(pool.size() == 1);
}

TEST_CASE("allowCoreTimeout lets core workers retire too") {
    PoolConfig config;
    config.coreWorkers      = 2;
    config.maxWorkers       = 2;
    config.keepAlive        = 20ms;
    config.allowCoreTimeout = true;
    TaskPool pool(config);

    CHECK(pool.prestartCoreWorkers() == 2);
    CHECK(eventually([&] { return pool.size() == 0; }));

    // New work brings a worker back.
    auto handle = pool.submit([] { return 3; });
    REQUIRE(handle.has_value());
    CHECK(handle->wait().value() == 3);
}

TEST_CASE("CallerRuns executes on the submitting thread when saturated") {
    PoolConfig config;
    config.coreWorkers = 1;
    config.maxWorkers  = 1;
    config.queue       = QueueCapacity::Handoff();
    config.rejection   = RejectionKind::CallerRuns;
    TaskPool pool(config);

    Gate             gate;
    std::atomic<bool> blocking{false};
    auto first = pool.submit([&] {
        blocking = true;
        gate.wait();
    });
    REQUIRE(first.has_value());
    REQUIRE(eventually([&] { return blocking.load(); }));

    auto const caller = std::this_thread::get_id();
    auto       second = pool.submit([] { return std::this_thread::get_id(); });
    REQUIRE(second.has_value());
    CHECK(second->ready());
    CHECK(second->wait().value() == caller);
    CHECK(pool.stats().rejectedTasks == 1);
    gate.open();
    CHECK(first->wait().has_value());
}

TEST_CASE("Discard and DiscardOldest complete dropped handles with Discarded") {
    Gate gate;

    SUBCASE("Discard drops the newcomer") {
        PoolConfig config;
        config.coreWorkers = 1;
        config.maxWorkers  = 1;
        config.queue       = QueueCapacity::Bounded(1);
        config.rejection   = RejectionKind::Discard;
        TaskPool pool(config);

        auto running = pool.submit([&] { gate.wait(); return 1; });
        auto queued  = pool.submit([] { return 2; });
        auto dropped = pool.submit([] { return 3; });
        REQUIRE(running.has_value());
        REQUIRE(queued.has_value());
        REQUIRE(dropped.has_value());
        CHECK(dropped->wait().error().code == Error::Code::Discarded);
        gate.open();
        CHECK(running->wait().value() == 1);
        CHECK(queued->wait().value() == 2);
    }
    SUBCASE("DiscardOldest drops the queue head") {
        PoolConfig config;
        config.coreWorkers = 1;
        config.maxWorkers  = 1;
        config.queue       = QueueCapacity::Bounded(1);
        config.rejection   = RejectionKind::DiscardOldest;
        TaskPool pool(config);

        auto running = pool.submit([&] { gate.wait(); return 1; });
        auto oldest  = pool.submit([] { return 2; });
        auto newest  = pool.submit([] { return 3; });
        REQUIRE(running.has_value());
        REQUIRE(oldest.has_value());
        REQUIRE(newest.has_value());
        CHECK(oldest->wait().error().code == Error::Code::Discarded);
        gate.open();
        CHECK(running->wait().value() == 1);
        CHECK(newest->wait().value() == 3);
    }
}

TEST_CASE("Handoff timeout blocks the submitter until a worker is free") {
    PoolConfig config;
    config.coreWorkers    = 1;
    config.maxWorkers     = 1;
    config.queue          = QueueCapacity::Handoff();
    config.handoffTimeout = 2000ms;
    TaskPool pool(config);

    Gate              gate;
    std::atomic<bool> blocking{false};
    auto              first = pool.submit([&] {
        blocking = true;
        gate.wait();
    });
    REQUIRE(first.has_value());
    REQUIRE(eventually([&] { return blocking.load(); }));

    std::jthread releaser([&] {
        std::this_thread::sleep_for(20ms);
        gate.open();
    });
    auto second = pool.submit([] { return 9; });
    REQUIRE(second.has_value());
    CHECK(second->wait().value() == 9);
    CHECK(pool.stats().rejectedTasks == 0);
}

TEST_CASE("Handle cancel prevents a queued task from running") {
    PoolConfig config;
    config.coreWorkers = 1;
    config.maxWorkers  = 1;
    TaskPool pool(config);

    Gate              gate;
    std::atomic<bool> ran{false};
    auto              blocker = pool.submit([&] { gate.wait(); });
    auto              queued  = pool.submit([&] { ran = true; });
    REQUIRE(blocker.has_value());
    REQUIRE(queued.has_value());

    CHECK(queued->cancel());
    CHECK(queued->isCancelled());
    gate.open();
    CHECK(blocker->wait().has_value());
    pool.shutdown();
    CHECK(pool.awaitTermination(2s));
    CHECK_FALSE(ran.load());
    CHECK(queued->wait().error().code == Error::Code::Cancelled);
}

TEST_CASE("TaskPool works through the Executor interface") {
    TaskPool  pool(PoolConfig{});
    Executor& executor = pool;
    auto      handle   = executor.submit([](CancellationToken const& token) { return token.stopRequested(); });
    REQUIRE(handle.has_value());
    CHECK(handle->wait().value() == false);

    auto packaged = packageTask([] { return 5; });
    CHECK_FALSE(executor.execute(packaged.task).has_value());
    CHECK(packaged.handle.wait().value() == 5);
    CHECK(executor.execute(nullptr).has_value());
}

TEST_CASE("Tracing records worker names and task spans") {
    auto     path = std::filesystem::temp_directory_path() / "workpool_taskpool_trace.json";
    TaskPool pool(PoolConfig{});
    pool.enableTrace(path.string());
    {
        auto scope  = pool.traceScope("batch", "test");
        auto handle = pool.submit([] { std::this_thread::sleep_for(1ms); }, TaskOptions{"resize"});
        REQUIRE(handle.has_value());
        CHECK(handle->wait().has_value());
    }
    pool.shutdown();
    CHECK(pool.awaitTermination(2s));

    bool sawSpan = false;
    bool sawName = false;
    for (auto const& event : pool.trace().events()) {
        if (event.phase == 'X' && event.label == "resize")
            sawSpan = true;
        if (event.phase == 'M')
            sawName = true;
    }
    CHECK(sawSpan);
    CHECK(sawName);
    CHECK_FALSE(pool.flushTrace().has_value());
    CHECK(std::filesystem::exists(path));
    std::filesystem::remove(path);
}
}
