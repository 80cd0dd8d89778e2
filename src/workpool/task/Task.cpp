#include "task/Task.hpp"
#include "log/TaggedLogger.hpp"

#include <atomic>
#include <exception>

namespace WP {

namespace {
std::atomic<std::uint64_t> nextTaskId{1};
} // namespace

auto Task::Create(Function function, Abandon abandon, TaskOptions options) -> std::shared_ptr<Task> {
    auto task        = std::shared_ptr<Task>(new Task{});
    task->function_  = std::move(function);
    task->abandon_   = std::move(abandon);
    task->label_     = std::move(options.label);
    task->id_        = nextTaskId.fetch_add(1, std::memory_order_relaxed);
    task->createdAt_ = std::chrono::steady_clock::now();
    return task;
}

Task::~Task() {
    // A task that never ran must not leave its handles waiting forever.
    if (this->state_.isPending() && this->abandon_) {
        wp_log("Task dropped before execution id=" + std::to_string(this->id_), "Task");
        this->abandon_(Error{Error::Code::Cancelled, "task dropped before execution"});
    }
}

auto Task::run() -> std::optional<Error> {
    if (!this->state_.tryStart()) {
        wp_log("Task::run skipped, state=" + std::string(this->state_.toString()), "Task");
        return std::nullopt;
    }

    std::optional<Error> failure;
    {
        detail::CurrentTokenScope scope(&this->token_);
        try {
            if (this->function_)
                failure = this->function_(*this);
        } catch (ErrorException const& e) {
            failure = e.error();
        } catch (std::exception const& e) {
            failure = Error{Error::Code::TaskFailed, e.what()};
        } catch (...) {
            failure = Error{Error::Code::TaskFailed, "unknown exception"};
        }
    }
    if (failure)
        this->state_.markFailed();
    else
        this->state_.markCompleted();

    // Release captured state as soon as the work is done; handles keep the result slot alive.
    this->function_ = nullptr;
    this->abandon_  = nullptr;
    return failure;
}

auto Task::cancel(Error const& reason) -> bool {
    if (!this->state_.markCancelled())
        return false;
    this->token_.requestStop();
    if (this->abandon_)
        this->abandon_(reason);
    return true;
}

auto Task::requestStop() -> void {
    this->token_.requestStop();
    this->state_.markCancelled();
}

auto Task::state() const -> TaskState {
    return this->state_.get();
}

auto Task::isPending() const -> bool {
    return this->state_.isPending();
}

auto Task::hasStarted() const -> bool {
    return this->state_.hasStarted();
}

auto Task::isTerminal() const -> bool {
    return this->state_.isTerminal();
}

auto Task::id() const -> std::uint64_t {
    return this->id_;
}

auto Task::label() const -> std::string const& {
    return this->label_;
}

auto Task::setLabel(std::string label) -> void {
    this->label_ = std::move(label);
}

auto Task::token() -> CancellationToken& {
    return this->token_;
}

auto Task::token() const -> CancellationToken const& {
    return this->token_;
}

auto Task::createdAt() const -> std::chrono::steady_clock::time_point {
    return this->createdAt_;
}

} // namespace WP
