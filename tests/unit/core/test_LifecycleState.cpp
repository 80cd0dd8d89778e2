#include "core/LifecycleState.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace WP;
using namespace std::chrono_literals;

TEST_SUITE("core.lifecycle") {
TEST_CASE("LifecycleState only moves forward") {
    LifecycleState state;
    CHECK(state.isRunning());
    CHECK_FALSE(state.isShutdown());
    CHECK(state.toString() == "Running");

    CHECK(state.advanceTo(PoolState::ShuttingDown));
    CHECK_FALSE(state.advanceTo(PoolState::ShuttingDown));
    CHECK(state.isShutdown());

    CHECK(state.advanceTo(PoolState::Stopping));
    // A weaker request after a stronger one is ignored.
    CHECK_FALSE(state.advanceTo(PoolState::ShuttingDown));
    CHECK(state.get() == PoolState::Stopping);

    CHECK(state.markTerminated());
    CHECK_FALSE(state.markTerminated());
    CHECK(state.isTerminated());
    CHECK_FALSE(state.advanceTo(PoolState::Stopping));
}

TEST_CASE("LifecycleState concurrent shutdown requests resolve to the strongest") {
    LifecycleState             state;
    std::atomic<int>           winners{0};
    std::vector<std::jthread>  threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto target = (i % 2 == 0) ? PoolState::ShuttingDown : PoolState::Stopping;
            if (state.advanceTo(target))
                winners.fetch_add(1);
        });
    }
    threads.clear();
    CHECK(state.get() == PoolState::Stopping);
    CHECK(winners.load() >= 1);
    CHECK(winners.load() <= 2);
}

TEST_CASE("LifecycleState termination wakes waiters") {
    LifecycleState state;
    CHECK_FALSE(state.waitTerminatedFor(10ms));

    std::jthread terminator([&] {
        std::this_thread::sleep_for(20ms);
        state.markTerminated();
    });
    state.waitTerminated();
    CHECK(state.isTerminated());
    CHECK(state.waitTerminatedFor(0ms));
}
}
