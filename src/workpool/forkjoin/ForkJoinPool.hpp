#pragma once
#include "core/Error.hpp"
#include "core/LifecycleState.hpp"
#include "core/PoolConfig.hpp"
#include "core/PoolEvent.hpp"
#include "forkjoin/ForkJoinTask.hpp"
#include "forkjoin/WorkStealingDeque.hpp"
#include "pool/WorkerFactory.hpp"
#include "task/Executor.hpp"
#include "task/TaskHandle.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace WP {

struct ForkJoinWorkerStats {
    std::string   name;
    std::uint64_t executed = 0; // Tasks this worker ran, stolen ones included
    std::uint64_t stolen   = 0; // Tasks taken from another worker's deque
};

struct ForkJoinStats {
    std::size_t                      parallelism = 0;
    std::size_t                      queuedSubmissions = 0;
    std::uint64_t                    executed = 0;
    std::uint64_t                    stolen   = 0;
    std::vector<ForkJoinWorkerStats> workers;
};

/**
 * ForkJoinPool: fixed set of workers with per-worker work-stealing deques.
 *
 * Worker loop: pop from the own deque (LIFO), then take from the shared
 * submission queue (FIFO), then steal from the top of a randomly chosen
 * victim's deque, and park when all of that came up empty. fork() inside a
 * worker pushes onto that worker's deque; a full deque spills into the
 * submission queue. join() inside a worker keeps running other tasks until the
 * joined one is done.
 *
 * Plain Tasks accepted through execute()/submit() run like any other entry.
 * shutdown() refuses new external work and lets admitted work, including
 * everything it forks, finish. shutdownNow() cancels whatever has not started
 * and returns the plain Tasks among it.
 */
class ForkJoinPool final : public Executor {
public:
    using Clock = std::chrono::steady_clock;

    static auto Create(PoolConfig config) -> Expected<std::unique_ptr<ForkJoinPool>>;
    // Process-wide pool serving fork() calls made outside any pool worker.
    static auto Instance() -> ForkJoinPool&;

    explicit ForkJoinPool(PoolConfig config = {});
    ~ForkJoinPool() override;

    ForkJoinPool(ForkJoinPool const&)                    = delete;
    auto operator=(ForkJoinPool const&) -> ForkJoinPool& = delete;

    // Runs the task to completion and returns its result. Called on one of this
    // pool's workers the task is computed inline.
    template <typename T>
    auto invoke(std::shared_ptr<ForkJoinTask<T>> task) -> Expected<T> {
        if (!task)
            return std::unexpected(Error{Error::Code::InvalidError, "null fork/join task"});
        bool const external = ForkJoinPool::current() != this;
        if (external) {
            if (auto error = this->submitTask(task))
                return std::unexpected(std::move(*error));
        }
        try {
            if constexpr (std::is_void_v<T>) {
                external ? task->join() : task->invoke();
                return {};
            } else {
                return external ? task->join() : task->invoke();
            }
        } catch (...) {
            return std::unexpected(describeFailure());
        }
    }

    // Admits a fork/join task from outside without waiting for it.
    auto submitTask(std::shared_ptr<ForkJoinTaskBase> task) -> std::optional<Error>;

    auto execute(std::shared_ptr<Task> task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto shutdownNow() -> std::vector<std::shared_ptr<Task>> override;
    auto awaitTermination(Clock::duration timeout) -> bool override;
    auto state() const -> PoolState override;
    auto size() const -> size_t override;

    [[nodiscard]] auto parallelism() const -> std::size_t { return this->workers_.size(); }
    [[nodiscard]] auto splitThreshold() const -> std::int64_t { return this->config_.forkJoin.splitThreshold; }
    [[nodiscard]] auto config() const -> PoolConfig const& { return this->config_; }
    [[nodiscard]] auto stats() const -> ForkJoinStats;

    // The pool whose worker is the calling thread, or nullptr.
    static auto current() -> ForkJoinPool*;

private:
    friend class ForkJoinTaskBase;

    struct Worker {
        Worker(std::size_t index, std::string name, std::size_t dequeCapacity)
            : index(index), name(std::move(name)), deque(dequeCapacity), rng(static_cast<unsigned>(index * 7919 + 17)) {}

        std::size_t                           index;
        std::string                           name;
        WorkStealingDeque<ForkJoinTaskBase*>  deque;
        std::minstd_rand                      rng;
        std::jthread                          thread;
        std::atomic<std::uint64_t>            executed{0};
        std::atomic<std::uint64_t>            stolen{0};
    };

    static auto describeFailure() -> Error;

    // fork() from a task: counts the entry and queues it, or cancels it once Stopping.
    auto fork(ForkJoinTaskBase* task) -> void;
    // Queues an entry already counted in outstanding_.
    auto enqueue(ForkJoinTaskBase* task) -> void;
    auto signalWork(bool all = false) -> void;
    auto signalCompletion() -> void;
    auto helpJoin(ForkJoinTaskBase& task) -> void;
    auto awaitExternal(ForkJoinTaskBase& task) -> void;

    auto runWorker(Worker* worker) -> void;
    auto findWork(Worker* worker) -> ForkJoinTaskBase*;
    auto pollSubmission() -> ForkJoinTaskBase*;
    auto trySteal(Worker* thief) -> ForkJoinTaskBase*;
    auto runEntry(Worker* worker, ForkJoinTaskBase* task) -> void;
    auto hasVisibleWork() const -> bool;
    auto park() -> void;
    auto workerExited() -> void;
    auto exitRequested() const -> bool;
    auto emit(PoolEvent event) -> void;
    auto emitStateChanged(PoolState state) -> void;

    static thread_local Worker* tlsWorker_;

    PoolConfig                           config_;
    std::shared_ptr<WorkerFactory>       factory_;
    LifecycleState                       lifecycle_;
    std::vector<std::unique_ptr<Worker>> workers_;

    mutable std::mutex             submissionMutex_;
    std::deque<ForkJoinTaskBase*>  submissions_;

    // Tasks pushed but not yet executed or abandoned.
    std::atomic<std::size_t> outstanding_{0};
    std::atomic<std::size_t> liveWorkers_{0};

    std::mutex                 parkMutex_;
    std::condition_variable    parkCv_;
    std::atomic<std::size_t>   idle_{0};
    std::atomic<std::uint64_t> signals_{0};

    std::mutex               joinMutex_;
    std::condition_variable  joinCv_;
    std::atomic<std::size_t> joinWaiters_{0};
};

} // namespace WP
