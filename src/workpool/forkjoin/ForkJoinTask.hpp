#pragma once
#include "core/Error.hpp"
#include "task/TaskStateAtomic.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace WP {

class ForkJoinPool;
class Task;

/**
 * ForkJoinTaskBase: type-erased part of a fork/join task.
 *
 * A forked task is pushed onto the forking worker's deque (or the shared
 * submission queue when called outside a pool worker) and, if it is owned by
 * a shared_ptr, keeps itself alive until it has been executed. Tasks living on
 * the stack may be forked too, as long as they are joined before they go out
 * of scope.
 *
 * The parent pointer is non-owning: it names the task that was running on the
 * thread when this one was forked and is only meaningful while that task is
 * still computing.
 */
class ForkJoinTaskBase : public std::enable_shared_from_this<ForkJoinTaskBase> {
public:
    ForkJoinTaskBase() = default;
    virtual ~ForkJoinTaskBase() = default;

    ForkJoinTaskBase(ForkJoinTaskBase const&)            = delete;
    ForkJoinTaskBase& operator=(ForkJoinTaskBase const&) = delete;

    [[nodiscard]] auto isDone() const -> bool { return this->done_.load(std::memory_order_acquire); }
    [[nodiscard]] auto isCancelled() const -> bool { return this->state_.isCancelled(); }
    [[nodiscard]] auto isCompletedAbnormally() const -> bool { return this->state_.isFailed() || this->state_.isCancelled(); }
    [[nodiscard]] auto state() const -> TaskState { return this->state_.get(); }
    [[nodiscard]] auto parent() const -> ForkJoinTaskBase* { return this->parent_; }

    // Pending -> Cancelled. Returns false once the task has started.
    auto cancel() -> bool;

    // Runs the computation on the calling thread unless it already started elsewhere.
    auto exec() -> void;

    // Blocks until done; pool workers run other tasks meanwhile.
    auto awaitDone() -> void;

    // The plain Task this entry wraps, if it came in through ForkJoinPool::execute().
    virtual auto plainTask() const -> std::shared_ptr<Task> { return nullptr; }

    // The task currently computing on this thread, or nullptr.
    static auto current() -> ForkJoinTaskBase*;

protected:
    auto forkBase() -> void;
    auto rethrowIfAbnormal() const -> void;
    virtual auto runCompute() -> void = 0;

private:
    friend class ForkJoinPool;

    auto attach(ForkJoinPool* pool) -> void;
    auto finish() -> void;

    TaskStateAtomic                   state_;
    std::atomic<bool>                 done_{false};
    std::atomic<ForkJoinPool*>        pool_{nullptr};
    std::exception_ptr                error_;
    ForkJoinTaskBase*                 parent_ = nullptr;
    std::shared_ptr<ForkJoinTaskBase> inFlight_;
};

/**
 * ForkJoinTask<T>: recursive task producing a T.
 *
 * Subclasses implement compute(). Inside compute(), fork() schedules a subtask
 * asynchronously and join() waits for it, rethrowing whatever the subtask
 * threw; join() on a cancelled task throws ErrorException with a Cancelled
 * error. invoke() computes on the calling thread and returns the result.
 */
template <typename T>
class ForkJoinTask : public ForkJoinTaskBase {
public:
    using value_type = T;

    auto fork() -> ForkJoinTask& {
        this->forkBase();
        return *this;
    }

    auto join() -> T {
        this->awaitDone();
        this->rethrowIfAbnormal();
        if constexpr (!std::is_void_v<T>)
            return *this->result_;
    }

    auto invoke() -> T {
        this->exec();
        return this->join();
    }

protected:
    virtual auto compute() -> T = 0;

private:
    auto runCompute() -> void override {
        if constexpr (std::is_void_v<T>)
            this->compute();
        else
            this->result_.emplace(this->compute());
    }

    using Storage = std::conditional_t<std::is_void_v<T>, std::monostate, std::optional<T>>;
    Storage result_;
};

template <typename T>
using RecursiveTask   = ForkJoinTask<T>;
using RecursiveAction = ForkJoinTask<void>;

// Forks `second`, computes `first` inline, then joins `second`.
template <typename A, typename B>
auto invokeAll(ForkJoinTask<A>& first, ForkJoinTask<B>& second) -> void {
    second.fork();
    first.invoke();
    second.join();
}

} // namespace WP
