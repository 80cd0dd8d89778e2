#pragma once
#include "core/Error.hpp"
#include "core/LifecycleState.hpp"
#include "core/PoolConfig.hpp"
#include "core/PoolEvent.hpp"
#include "pool/PoolTrace.hpp"
#include "pool/RejectionPolicy.hpp"
#include "pool/TaskQueue.hpp"
#include "pool/WorkerFactory.hpp"
#include "schedule/Scheduler.hpp"
#include "task/Executor.hpp"
#include "task/Task.hpp"

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace WP {

struct PoolStats {
    std::size_t   workers        = 0;
    std::size_t   largestWorkers = 0;
    std::size_t   activeTasks    = 0;
    std::size_t   queuedTasks    = 0;
    std::size_t   scheduled      = 0; // Armed schedule entries plus firings in flight
    std::uint64_t completedTasks = 0; // Tasks that finished running, successfully or not
    std::uint64_t failedTasks    = 0;
    std::uint64_t rejectedTasks  = 0; // Submissions handed to the rejection policy
    PoolState     state          = PoolState::Running;
};

/**
 * TaskPool: bounded, elastic worker pool.
 *
 * Dispatch for a submitted task, in order:
 *   1. hand it to a worker blocked waiting for work;
 *   2. start a new worker for it while fewer than coreWorkers exist;
 *   3. queue it if the queue has room;
 *   4. start an overflow worker for it while fewer than maxWorkers exist;
 *   5. hand it to the rejection policy.
 *
 * Worker count and lifecycle state are atomics updated by CAS; the only locks
 * are the queue's own, the worker registry (touched when workers start and
 * exit) and the per-worker slot naming the task it runs.
 *
 * Workers above the core count retire after keepAlive without work, as do
 * core workers when allowCoreTimeout is set. Tasks that throw or return an
 * error only fail their own handle; the worker carries on.
 *
 * Scheduled work (schedule, scheduleAtFixedRate, scheduleWithFixedDelay) is
 * admitted through the same dispatch steps when it comes due, except that a
 * full pool fails the firing instead of consulting the rejection policy.
 */
class TaskPool final : public Executor, private RejectionContext, private ScheduleTarget {
public:
    using Clock = std::chrono::steady_clock;

    // Validates the configuration first; InvalidConfig on inconsistent settings.
    static auto Create(PoolConfig config) -> Expected<std::unique_ptr<TaskPool>>;

    // Normalises the configuration instead of validating it.
    explicit TaskPool(PoolConfig config = {});
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto execute(std::shared_ptr<Task> task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto shutdownNow() -> std::vector<std::shared_ptr<Task>> override;
    auto awaitTermination(Clock::duration timeout) -> bool override;
    auto state() const -> PoolState override;
    // Shared by the Executor view and the rejection policies.
    [[nodiscard]] auto isShutdown() const -> bool override;
    auto size() const -> size_t override;

    // Starts every core worker up front. Returns how many were started.
    auto prestartCoreWorkers() -> std::size_t;

    template <typename F>
    auto schedule(F&& fn, Clock::duration delay, TaskOptions options = {})
            -> Expected<ScheduleHandle<TaskResultOf<std::decay_t<F>>>> {
        auto scheduler = this->ensureScheduler();
        if (!scheduler)
            return std::unexpected(scheduler.error());
        return (*scheduler)->schedule(std::forward<F>(fn), delay, std::move(options));
    }

    template <typename F>
    auto scheduleAtFixedRate(F&& fn, Clock::duration initialDelay, Clock::duration period, TaskOptions options = {})
            -> Expected<ScheduleHandle<void>> {
        auto scheduler = this->ensureScheduler();
        if (!scheduler)
            return std::unexpected(scheduler.error());
        return (*scheduler)->scheduleAtFixedRate(std::forward<F>(fn), initialDelay, period, std::move(options));
    }

    template <typename F>
    auto scheduleWithFixedDelay(F&& fn, Clock::duration initialDelay, Clock::duration delay, TaskOptions options = {})
            -> Expected<ScheduleHandle<void>> {
        auto scheduler = this->ensureScheduler();
        if (!scheduler)
            return std::unexpected(scheduler.error());
        return (*scheduler)->scheduleWithFixedDelay(std::forward<F>(fn), initialDelay, delay, std::move(options));
    }

    [[nodiscard]] auto stats() const -> PoolStats;
    [[nodiscard]] auto config() const -> PoolConfig const& { return this->config_; }
    [[nodiscard]] auto name() const -> std::string const& { return this->config_.name; }

    // Tracing
    auto enableTrace(std::string path) -> void;
    auto enableTraceNdjson(std::string path) -> void;
    auto flushTrace() -> std::optional<Error>;
    auto traceScope(std::string name, std::string category, std::string label = {}) -> PoolTrace::Scope;
    auto trace() -> PoolTrace& { return this->trace_; }

private:
    enum class Admission {
        External, // submit()/execute(): refused once shut down, may reach the rejection policy
        Internal  // Scheduled firings: allowed while draining, never reach the policy
    };
    enum class Outcome {
        Admitted,
        Saturated,
        Closed
    };

    struct Worker {
        std::size_t           index = 0;
        std::string           name;
        std::shared_ptr<Task> firstTask;
        std::jthread          thread;

        std::mutex            runMutex;
        std::shared_ptr<Task> current; // Guarded by runMutex

        std::atomic<std::uint64_t> completed{0};
    };

    auto admit(std::shared_ptr<Task> const& task, Admission admission) -> Outcome;
    auto addWorker(std::shared_ptr<Task> const& firstTask, bool core, Admission admission) -> bool;
    auto runWorker(Worker* worker) -> void;
    auto getTask(Worker* worker) -> std::shared_ptr<Task>;
    auto runTask(Worker* worker, std::shared_ptr<Task> const& task) -> void;
    auto processWorkerExit(Worker* worker) -> void;
    auto tryTerminate() -> void;
    auto reapRetired() -> void;
    auto accepts(PoolState state, Admission admission) const -> bool;
    auto runAndRecord(std::shared_ptr<Task> const& task, std::string const& workerName) -> void;
    auto emit(PoolEvent event) -> void;
    auto emitStateChanged(PoolState state) -> void;
    auto ensureScheduler() -> Expected<std::shared_ptr<Scheduler>>;
    auto currentScheduler() const -> std::shared_ptr<Scheduler>;
    auto shutdownError() const -> Error;

    // RejectionContext
    auto poolName() const -> std::string const& override;
    auto evictOldest() -> std::shared_ptr<Task> override;
    auto retryAdmission(std::shared_ptr<Task> const& task) -> bool override;
    auto runOnCaller(std::shared_ptr<Task> const& task) -> void override;

    // ScheduleTarget
    auto dispatchScheduled(std::shared_ptr<Task> const& task) -> std::optional<Error> override;
    auto emitEvent(PoolEvent event) -> void override;
    auto scheduleDrained() -> void override;
    auto targetName() const -> std::string const& override;

    PoolConfig                       config_;
    std::shared_ptr<RejectionPolicy> policy_;
    std::shared_ptr<WorkerFactory>   factory_;
    TaskQueue                        queue_;
    LifecycleState                   lifecycle_;
    PoolTrace                        trace_;

    std::atomic<std::size_t>   workerCount_{0};
    std::atomic<std::size_t>   largestWorkers_{0};
    std::atomic<std::size_t>   activeTasks_{0};
    std::atomic<std::size_t>   nextWorkerIndex_{0};
    std::atomic<std::uint64_t> completedTasks_{0};
    std::atomic<std::uint64_t> failedTasks_{0};
    std::atomic<std::uint64_t> rejectedTasks_{0};

    mutable std::mutex                                          workersMutex_;
    phmap::flat_hash_map<std::size_t, std::unique_ptr<Worker>> workers_;
    std::vector<std::unique_ptr<Worker>>                        retired_;

    mutable std::mutex         schedulerMutex_;
    std::shared_ptr<Scheduler> scheduler_;
};

} // namespace WP
