#pragma once
#include "CancellationToken.hpp"
#include "TaskStateAtomic.hpp"
#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace WP {

struct TaskOptions {
    std::string label; // Shown in logs, events and traces
};

/**
 * Task: type-erased unit of work owned by whoever currently holds it.
 *
 * A task sits in a pool's queue until a worker takes it, then belongs to that
 * worker until run() returns. The typed outcome lives in a ResultSlot that the
 * task's function writes and TaskHandles read; the Task itself only tracks
 * state, the cancellation token and how to fail its slot when it never runs.
 */
class Task {
public:
    // Runs the work and writes the result slot. Returns the failure it recorded, if any.
    using Function = std::function<std::optional<Error>(Task&)>;
    // Completes the result slot with an error when the task is dropped or cancelled before running.
    using Abandon = std::function<void(Error const&)>;

    static auto Create(Function function, Abandon abandon = {}, TaskOptions options = {}) -> std::shared_ptr<Task>;

    ~Task();

    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    // Executes the task on the calling thread if it is still pending.
    // Returns the error recorded by the task body; nullopt on success or if the task did not run.
    auto run() -> std::optional<Error>;

    // Pending -> Cancelled, failing the result slot with reason. Returns false if the task already started.
    auto cancel(Error const& reason) -> bool;

    // Raises the cooperative stop flag and cancels the task if it has not started yet.
    auto requestStop() -> void;

    auto state() const -> TaskState;
    auto isPending() const -> bool;
    auto hasStarted() const -> bool;
    auto isTerminal() const -> bool;

    auto id() const -> std::uint64_t;
    auto label() const -> std::string const&;
    auto setLabel(std::string label) -> void;

    auto token() -> CancellationToken&;
    auto token() const -> CancellationToken const&;

    auto createdAt() const -> std::chrono::steady_clock::time_point;

private:
    Task() = default; // Private constructor - use Create()

    TaskStateAtomic                       state_;
    CancellationToken                     token_;
    Function                              function_;
    Abandon                               abandon_;
    std::string                           label_;
    std::uint64_t                         id_ = 0;
    std::chrono::steady_clock::time_point createdAt_;
};

} // namespace WP
