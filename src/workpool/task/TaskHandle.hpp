#pragma once
#include "ResultSlot.hpp"
#include "Task.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace WP {

/**
 * TaskHandle<T>: caller-side view of a submitted task.
 *
 * Shares the task's ResultSlot, so the outcome stays readable after the pool
 * has released the task. The task itself is referenced weakly and only used
 * to forward cancellation.
 */
template <typename T>
class TaskHandle {
public:
    using value_type = T;

    TaskHandle() = default;
    TaskHandle(std::shared_ptr<ResultSlot<T>> slot, std::weak_ptr<Task> task)
        : slot_(std::move(slot)), task_(std::move(task)) {}

    [[nodiscard]] auto valid() const -> bool { return this->slot_ != nullptr; }

    [[nodiscard]] auto ready() const -> bool { return this->slot_ && this->slot_->ready(); }

    // Blocks until the task finished, failed or was cancelled.
    auto wait() const -> Expected<T> {
        if (!this->slot_)
            return std::unexpected(Error{Error::Code::IllegalState, "empty task handle"});
        return this->slot_->get();
    }

    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> const& d) const -> Expected<T> {
        return this->wait_until(std::chrono::steady_clock::now()
                                + std::chrono::duration_cast<std::chrono::steady_clock::duration>(d));
    }

    auto wait_until(std::chrono::steady_clock::time_point deadline) const -> Expected<T> {
        if (!this->slot_)
            return std::unexpected(Error{Error::Code::IllegalState, "empty task handle"});
        if (!this->slot_->wait_until(deadline))
            return std::unexpected(Error{Error::Code::Timeout, "task did not complete before the deadline"});
        return this->slot_->get();
    }

    // Non-blocking poll; nullopt while the task is still pending or running.
    [[nodiscard]] auto poll() const -> std::optional<Expected<T>> {
        if (!this->slot_)
            return std::nullopt;
        return this->slot_->peek();
    }

    /**
     * Completes the handle with a Cancelled error and asks the task to stop.
     * A task that has not started yet will never run; a running task only
     * observes the request through its CancellationToken. Returns false if the
     * outcome was already decided.
     */
    auto cancel() -> bool {
        if (!this->slot_)
            return false;
        if (!this->slot_->setError(Error{Error::Code::Cancelled, "cancelled through handle"}))
            return false;
        if (auto task = this->task_.lock())
            task->requestStop();
        return true;
    }

    [[nodiscard]] auto isCancelled() const -> bool {
        return this->slot_ && this->slot_->errorCode() == Error::Code::Cancelled;
    }

    [[nodiscard]] auto task() const -> std::weak_ptr<Task> { return this->task_; }

private:
    std::shared_ptr<ResultSlot<T>> slot_;
    std::weak_ptr<Task>            task_;
};

template <typename F>
inline constexpr bool TakesCancellationToken = std::is_invocable_v<F&, CancellationToken const&>;

template <typename F>
using TaskResultOf = typename std::conditional_t<TakesCancellationToken<F>,
                                                 std::invoke_result<F&, CancellationToken const&>,
                                                 std::invoke_result<F&>>::type;

template <typename R>
struct PackagedTask {
    std::shared_ptr<Task> task;
    TaskHandle<R>         handle;
};

namespace detail {

inline auto describeCurrentException() -> std::string {
    try {
        throw;
    } catch (ErrorException const& e) {
        return describeError(e.error());
    } catch (std::exception const& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace detail

/**
 * Wraps a callable into a Task plus the handle observing its result.
 * Callables may take a CancellationToken const& to observe cooperative stop
 * requests. Exceptions escaping the callable become TaskFailed errors in the
 * handle; they never reach the worker.
 */
template <typename F>
auto packageTask(F&& fn, TaskOptions options = {}) -> PackagedTask<TaskResultOf<std::decay_t<F>>> {
    using Fn = std::decay_t<F>;
    using R  = TaskResultOf<Fn>;

    auto slot = std::make_shared<ResultSlot<R>>();

    auto function = [slot, fn = Fn(std::forward<F>(fn))](Task& task) mutable -> std::optional<Error> {
        try {
            if constexpr (std::is_void_v<R>) {
                if constexpr (TakesCancellationToken<Fn>)
                    fn(std::as_const(task.token()));
                else
                    fn();
                slot->setValue();
            } else {
                if constexpr (TakesCancellationToken<Fn>)
                    slot->setValue(fn(std::as_const(task.token())));
                else
                    slot->setValue(fn());
            }
            return std::nullopt;
        } catch (...) {
            Error error{Error::Code::TaskFailed, detail::describeCurrentException()};
            slot->setError(error);
            return error;
        }
    };
    auto abandon = [slot](Error const& reason) { slot->setError(reason); };

    auto task   = Task::Create(std::move(function), std::move(abandon), std::move(options));
    auto handle = TaskHandle<R>(slot, task);
    return PackagedTask<R>{std::move(task), std::move(handle)};
}

} // namespace WP
