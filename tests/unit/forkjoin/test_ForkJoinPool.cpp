#include "forkjoin/ForkJoinPool.hpp"
#include "forkjoin/RangeTask.hpp"
#include "support/PoolTestHelpers.hpp"
#include "task/Task.hpp"
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace WP;
using namespace WP::Testing;
using namespace std::chrono_literals;

namespace {

auto makePool(std::size_t parallelism, std::int64_t splitThreshold = 1024) -> std::unique_ptr<ForkJoinPool> {
    PoolConfig config;
    config.name                     = "fj-test";
    config.forkJoin.parallelism     = parallelism;
    config.forkJoin.splitThreshold  = splitThreshold;
    auto pool                       = ForkJoinPool::Create(config);
    REQUIRE(pool.has_value());
    return std::move(*pool);
}

auto sumRange(std::int64_t lo, std::int64_t hi) -> std::int64_t {
    std::int64_t total = 0;
    for (auto i = lo; i < hi; ++i)
        total += i;
    return total;
}

auto plus(std::int64_t a, std::int64_t b) -> std::int64_t {
    return a + b;
}

// Sums [lo, hi) by explicit fork/join.
class SumTask final : public RecursiveTask<std::int64_t> {
public:
    SumTask(std::int64_t lo, std::int64_t hi, std::int64_t threshold) : lo_(lo), hi_(hi), threshold_(threshold) {}

protected:
    auto compute() -> std::int64_t override {
        if (hi_ - lo_ <= threshold_)
            return sumRange(lo_, hi_);
        auto const mid   = lo_ + (hi_ - lo_) / 2;
        auto       left  = std::make_shared<SumTask>(lo_, mid, threshold_);
        auto       right = std::make_shared<SumTask>(mid, hi_, threshold_);
        left->fork();
        auto const rightValue = right->invoke();
        return left->join() + rightValue;
    }

private:
    std::int64_t lo_;
    std::int64_t hi_;
    std::int64_t threshold_;
};

class ThrowingTask final : public RecursiveTask<int> {
public:
    explicit ThrowingTask(int depth) : depth_(depth) {}

protected:
    auto compute() -> int override {
        if (depth_ == 0)
            throw std::runtime_error("leaf exploded");
        auto child = std::make_shared<ThrowingTask>(depth_ - 1);
        child->fork();
        return child->join() + 1;
    }

private:
    int depth_;
};

class CountingAction final : public RecursiveAction {
public:
    CountingAction(std::atomic<int>& counter, int depth) : counter_(counter), depth_(depth) {}

protected:
    auto compute() -> void override {
        counter_.fetch_add(1);
        if (depth_ == 0)
            return;
        CountingAction left(counter_, depth_ - 1);
        CountingAction right(counter_, depth_ - 1);
        invokeAll(left, right);
    }

private:
    std::atomic<int>& counter_;
    int               depth_;
};

class ConstantTask final : public RecursiveTask<int> {
public:
    explicit ConstantTask(int value) : value_(value) {}

protected:
    auto compute() -> int override { return value_; }

private:
    int value_;
};

} // namespace

TEST_SUITE("forkjoin.pool") {
TEST_CASE("parallelReduce sums ranges of every size") {
    auto pool = makePool(4, 64);
    CHECK(pool->parallelism() == 4);
    CHECK(pool->splitThreshold() == 64);

    for (std::int64_t n : {0, 1, 2, 63, 64, 65, 1000, 4097, 100000}) {
        for (std::int64_t threshold : {1, 7, 64, 1000000}) {
            if (n > 20000 && threshold < 64)
                continue;
            auto sum = parallelReduce<std::int64_t>(*pool, 0, n, threshold, sumRange, plus);
            REQUIRE(sum.has_value());
            CHECK(*sum == n * (n - 1) / 2);
        }
        auto defaulted = parallelReduce<std::int64_t>(*pool, 1, n + 1, sumRange, plus);
        REQUIRE(defaulted.has_value());
        CHECK(*defaulted == n * (n + 1) / 2);
    }
}

TEST_CASE("parallelReduce keeps the order of a non-commutative combine") {
    auto pool = makePool(4);
    auto text = parallelReduce<std::string>(
            *pool, 0, 26, 2,
            [](std::int64_t lo, std::int64_t hi) {
                std::string part;
                for (auto i = lo; i < hi; ++i)
                    part.push_back(static_cast<char>('a' + i));
                return part;
            },
            [](std::string a, std::string b) { return a + b; });
    REQUIRE(text.has_value());
    CHECK(*text == "abcdefghijklmnopqrstuvwxyz");
}

TEST_CASE("parallelReduce rejects a reversed range and clamps the threshold") {
    auto pool     = makePool(2);
    auto reversed = parallelReduce<std::int64_t>(*pool, 10, 5, 4, sumRange, plus);
    REQUIRE_FALSE(reversed.has_value());
    CHECK(reversed.error().code == Error::Code::InvalidError);

    auto clamped = parallelReduce<std::int64_t>(*pool, 0, 100, 0, sumRange, plus);
    REQUIRE(clamped.has_value());
    CHECK(*clamped == 4950);
}

TEST_CASE("A custom RecursiveTask computes the same sum") {
    auto pool = makePool(4);
    for (std::int64_t n : {1, 10, 5000, 200000}) {
        auto sum = pool->invoke<std::int64_t>(std::make_shared<SumTask>(0, n, 500));
        REQUIRE(sum.has_value());
        CHECK(*sum == n * (n - 1) / 2);
    }
}

TEST_CASE("RecursiveAction with invokeAll visits every node") {
    auto             pool = makePool(3);
    std::atomic<int> counter{0};
    auto             done = pool->invoke<void>(std::make_shared<CountingAction>(counter, 10));
    REQUIRE(done.has_value());
    CHECK(counter.load() == (1 << 11) - 1);
}

TEST_CASE("Idle workers steal forked subtasks") {
    auto pool = makePool(4);
    auto sum  = parallelReduce<std::int64_t>(
            *pool, 0, 256 * 100, 100,
            [](std::int64_t lo, std::int64_t hi) {
                std::this_thread::sleep_for(200us);
                return sumRange(lo, hi);
            },
            plus);
    REQUIRE(sum.has_value());
    CHECK(*sum == std::int64_t{256 * 100} * (256 * 100 - 1) / 2);

    auto stats = pool->stats();
    CHECK(stats.parallelism == 4);
    CHECK(stats.workers.size() == 4);
    CHECK(stats.stolen > 0);
    CHECK(stats.executed > 0);
}

TEST_CASE("Exceptions in subtasks propagate through join") {
    auto pool   = makePool(4);
    auto result = pool->invoke<int>(std::make_shared<ThrowingTask>(5));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::TaskFailed);
    REQUIRE(result.error().message.has_value());
    CHECK(*result.error().message == "leaf exploded");

    // The pool stays usable.
    auto after = pool->invoke<int>(std::make_shared<ConstantTask>(9));
    REQUIRE(after.has_value());
    CHECK(*after == 9);
}

TEST_CASE("Joining a cancelled task reports Cancelled") {
    auto pool = makePool(2);
    auto task = std::make_shared<ConstantTask>(1);
    CHECK(task->cancel());
    CHECK_FALSE(task->cancel());
    CHECK(task->isDone());
    CHECK(task->isCancelled());
    CHECK(task->isCompletedAbnormally());

    auto result = pool->invoke<int>(task);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Cancelled);

    auto null = pool->invoke<int>(std::shared_ptr<ForkJoinTask<int>>{});
    REQUIRE_FALSE(null.has_value());
    CHECK(null.error().code == Error::Code::InvalidError);
}

TEST_CASE("A completed task cannot be cancelled") {
    auto pool   = makePool(2);
    auto task   = std::make_shared<ConstantTask>(4);
    auto result = pool->invoke<int>(task);
    REQUIRE(result.has_value());
    CHECK(task->isDone());
    CHECK_FALSE(task->cancel());
    CHECK(task->state() == TaskState::Completed);
}

TEST_CASE("fork outside any pool uses the common pool") {
    auto task = std::make_shared<SumTask>(0, 10000, 100);
    task->fork();
    CHECK(task->join() == std::int64_t{10000} * 9999 / 2);
    CHECK(ForkJoinPool::Instance().state() == PoolState::Running);
    CHECK(ForkJoinPool::Instance().config().name == "forkjoin-common");
}

TEST_CASE("A task joined without forking runs on the caller") {
    SumTask task(0, 1000, 1000);
    CHECK(task.invoke() == 499500);
    CHECK(task.isDone());
}

TEST_CASE("Plain tasks run through the Executor interface") {
    auto sink = std::make_shared<RecordingSink>();

    PoolConfig config;
    config.name                 = "fj-executor";
    config.forkJoin.parallelism = 2;
    config.eventSink            = sink;
    auto created                = ForkJoinPool::Create(config);
    REQUIRE(created.has_value());
    auto&     pool     = **created;
    Executor& executor = pool;

    auto value = executor.submit([] { return 21 * 2; });
    REQUIRE(value.has_value());
    CHECK(value->wait().value() == 42);

    auto failing = executor.submit([]() -> int { throw std::runtime_error("plain failure"); });
    REQUIRE(failing.has_value());
    auto failure = failing->wait();
    REQUIRE_FALSE(failure.has_value());
    CHECK(failure.error().code == Error::Code::TaskFailed);
    CHECK(eventually([&] { return sink->count(PoolEvent::Kind::TaskFailed) == 1; }));

    CHECK(executor.execute(nullptr).has_value());
    CHECK(sink->count(PoolEvent::Kind::WorkerCreated) == 2);
}

TEST_CASE("shutdown drains admitted work, then refuses more") {
    auto sink = std::make_shared<RecordingSink>();

    PoolConfig config;
    config.name                 = "fj-shutdown";
    config.forkJoin.parallelism = 2;
    config.eventSink            = sink;
    auto created                = ForkJoinPool::Create(config);
    REQUIRE(created.has_value());
    auto& pool = **created;

    std::atomic<int>              ran{0};
    std::vector<TaskHandle<void>> handles;
    for (int i = 0; i < 20; ++i) {
        auto h = pool.submit([&] {
            std::this_thread::sleep_for(2ms);
            ran.fetch_add(1);
        });
        REQUIRE(h.has_value());
        handles.push_back(std::move(*h));
    }
    auto reduce = std::make_shared<SumTask>(0, 50000, 100);
    REQUIRE_FALSE(pool.submitTask(reduce).has_value());

    pool.shutdown();
    CHECK(pool.isShutdown());

    auto late = pool.submit([] { return 1; });
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == Error::Code::IllegalState);

    REQUIRE(pool.awaitTermination(5s));
    CHECK(pool.isTerminated());
    CHECK(ran.load() == 20);
    for (auto& h : handles)
        CHECK(h.wait().has_value());
    CHECK(reduce->isDone());
    CHECK(reduce->join() == std::int64_t{50000} * 49999 / 2);
    CHECK(pool.size() == 0);
    CHECK(sink->count(PoolEvent::Kind::WorkerRetired) == 2);

    // Terminated is reported right after the state flips.
    REQUIRE(eventually([&] { return sink->count(PoolEvent::Kind::StateChanged) == 2; }));
    std::vector<PoolState> transitions;
    for (auto const& event : sink->snapshot())
        if (event.kind == PoolEvent::Kind::StateChanged)
            transitions.push_back(event.state);
    REQUIRE(transitions.size() == 2);
    CHECK(transitions[0] == PoolState::ShuttingDown);
    CHECK(transitions[1] == PoolState::Terminated);
}

TEST_CASE("shutdownNow returns plain tasks that never started") {
    auto pool = makePool(1);

    Gate             gate;
    std::atomic<int> ran{0};
    auto             blocker = pool->submit([&] { gate.wait(); });
    REQUIRE(blocker.has_value());
    REQUIRE(eventually([&] { return pool->stats().queuedSubmissions == 0; }));

    std::vector<TaskHandle<int>> handles;
    for (int i = 0; i < 4; ++i) {
        auto h = pool->submit([&ran, i] {
            ran.fetch_add(1);
            return i;
        });
        REQUIRE(h.has_value());
        handles.push_back(std::move(*h));
    }
    auto forkJoin = std::make_shared<ConstantTask>(3);
    REQUIRE_FALSE(pool->submitTask(forkJoin).has_value());

    auto unstarted = pool->shutdownNow();
    gate.open();
    CHECK(unstarted.size() == 4);
    CHECK(pool->state() >= PoolState::Stopping);
    CHECK(pool->awaitTermination(2s));
    CHECK(blocker->wait().has_value());

    // Fork/join entries that never ran are cancelled.
    CHECK(forkJoin->isCancelled());
    CHECK(ran.load() == 0);

    unstarted.front()->run();
    CHECK(handles.front().wait().value() == 0);
    unstarted.clear();
    for (std::size_t i = 1; i < handles.size(); ++i) {
        auto result = handles[i].wait_for(1s);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Cancelled);
    }
}

TEST_CASE("Create validates the configuration and normalises parallelism") {
    PoolConfig bad;
    bad.forkJoin.splitThreshold = 0;
    auto refused                = ForkJoinPool::Create(bad);
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == Error::Code::InvalidConfig);

    PoolConfig automatic;
    automatic.forkJoin.parallelism = 0;
    ForkJoinPool pool(automatic);
    CHECK(pool.parallelism() >= 1);
    CHECK(pool.size() == pool.parallelism());
}

TEST_CASE("Destroying a pool with outstanding work waits for it") {
    std::atomic<int> ran{0};
    {
        auto pool = makePool(2);
        for (int i = 0; i < 10; ++i) {
            auto h = pool->submit([&] {
                std::this_thread::sleep_for(1ms);
                ran.fetch_add(1);
            });
            REQUIRE(h.has_value());
        }
    }
    CHECK(ran.load() == 10);
}
}
