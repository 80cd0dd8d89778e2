#include <workpool/WorkPool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace WP;
using namespace std::chrono_literals;

// Loads the pool configuration from argv[1], or uses the defaults.
static auto load_config(int argc, char** argv) -> Expected<PoolConfig> {
    if (argc > 1)
        return loadPoolConfig(argv[1]);
    PoolConfig config;
    config.name        = "demo";
    config.coreWorkers = 2;
    config.maxWorkers  = 4;
    config.queue       = QueueCapacity::Bounded(16);
    config.rejection   = RejectionKind::CallerRuns;
    return config;
}

static void print_stats(TaskPool const& pool) {
    auto const stats = pool.stats();
    std::cout << "pool '" << pool.name() << "': state=" << poolStateToString(stats.state) << " workers=" << stats.workers
              << " largest=" << stats.largestWorkers << " completed=" << stats.completedTasks
              << " failed=" << stats.failedTasks << " rejected=" << stats.rejectedTasks << "\n";
}

int main(int argc, char** argv) {
#ifdef WP_LOG_DEBUG
    set_thread_name("main");
#endif
    auto config = load_config(argc, argv);
    if (!config) {
        std::cerr << "workpool_demo: " << describeError(config.error()) << "\n";
        return 1;
    }
    config->eventSink = std::make_shared<LoggingEventSink>();
    std::cout << "configuration: " << poolConfigToJson(*config) << "\n";

    auto created = TaskPool::Create(*config);
    if (!created) {
        std::cerr << "workpool_demo: " << describeError(created.error()) << "\n";
        return 1;
    }
    auto& pool = **created;

    std::vector<TaskHandle<std::uint64_t>> squares;
    for (std::uint64_t i = 1; i <= 32; ++i) {
        auto handle = pool.submit(
                [i] {
                    std::this_thread::sleep_for(5ms);
                    return i * i;
                },
                TaskOptions{"square-" + std::to_string(i)});
        if (!handle) {
            std::cerr << "submit failed: " << describeError(handle.error()) << "\n";
            continue;
        }
        squares.push_back(std::move(*handle));
    }

    std::atomic<int> ticks{0};
    auto heartbeat = pool.scheduleAtFixedRate([&ticks] { ticks.fetch_add(1); }, 0ms, 20ms, TaskOptions{"heartbeat"});
    if (!heartbeat) {
        std::cerr << "schedule failed: " << describeError(heartbeat.error()) << "\n";
        return 1;
    }

    std::uint64_t total = 0;
    for (auto& handle : squares) {
        if (auto value = handle.wait())
            total += *value;
        else
            std::cerr << "task failed: " << describeError(value.error()) << "\n";
    }
    std::cout << "sum of squares 1..32 = " << total << "\n";

    std::this_thread::sleep_for(100ms);
    heartbeat->cancel();
    std::cout << "heartbeat ran " << heartbeat->runCount() << " times\n";

    PoolConfig fjConfig = *config;
    fjConfig.name       = "demo-forkjoin";
    ForkJoinPool forkJoin(fjConfig);
    auto sum = parallelReduce<std::int64_t>(
            forkJoin, 0, 10'000'000,
            [](std::int64_t lo, std::int64_t hi) {
                std::int64_t acc = 0;
                for (auto i = lo; i < hi; ++i)
                    acc += i;
                return acc;
            },
            [](std::int64_t a, std::int64_t b) { return a + b; });
    if (!sum) {
        std::cerr << "parallelReduce failed: " << describeError(sum.error()) << "\n";
        return 1;
    }
    auto const fjStats = forkJoin.stats();
    std::cout << "sum 0..10^7 = " << *sum << " (parallelism=" << fjStats.parallelism << " executed=" << fjStats.executed
              << " stolen=" << fjStats.stolen << ")\n";

    pool.shutdown();
    if (!pool.awaitTermination(5s)) {
        std::cerr << "pool did not terminate in time\n";
        return 1;
    }
    print_stats(pool);
    return 0;
}
