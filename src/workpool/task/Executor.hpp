#pragma once

#include "core/Error.hpp"
#include "core/PoolState.hpp"
#include "task/TaskHandle.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace WP {

class Task;

/**
 * Executor: interface for admitting and executing Tasks
 *
 * Rationale
 * ---------
 * Decouples code that produces work from the pool that runs it. Both the
 * elastic TaskPool and the work-stealing ForkJoinPool implement it.
 *
 * Contract
 * --------
 * - execute(...) returns std::nullopt once the task has been admitted (run,
 *   queued, handed to a worker or disposed of by the rejection policy), or an
 *   Error if it was refused (Rejected, IllegalState after shutdown).
 * - submit(...) packages a callable and returns the handle for its result.
 * - shutdown() stops admission and lets admitted work drain; it never blocks.
 * - shutdownNow() additionally hands back work that has not started and asks
 *   running work to stop.
 * - awaitTermination(...) only observes; it never changes state.
 *
 * Thread-safety
 * -------------
 * All members may be called concurrently from any thread.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto execute(std::shared_ptr<Task> task) -> std::optional<Error> = 0;

    template <typename F>
    auto submit(F&& fn, TaskOptions options = {}) -> Expected<TaskHandle<TaskResultOf<std::decay_t<F>>>> {
        auto packaged = packageTask(std::forward<F>(fn), std::move(options));
        if (auto error = this->execute(packaged.task))
            return std::unexpected(std::move(*error));
        return std::move(packaged.handle);
    }

    virtual auto shutdown() -> void                                                 = 0;
    virtual auto shutdownNow() -> std::vector<std::shared_ptr<Task>>                = 0;
    virtual auto awaitTermination(std::chrono::steady_clock::duration timeout) -> bool = 0;
    virtual auto state() const -> PoolState                                         = 0;

    auto isShutdown() const -> bool { return this->state() != PoolState::Running; }
    auto isTerminated() const -> bool { return this->state() == PoolState::Terminated; }

    // Implementation-defined capacity/size (e.g., number of live workers).
    virtual auto size() const -> size_t = 0;
};

} // namespace WP
