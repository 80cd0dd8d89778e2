#include "TaskStateAtomic.hpp"

namespace WP {

TaskStateAtomic::TaskStateAtomic(const TaskStateAtomic& other) : state(other.state.load(std::memory_order_acquire)) {}

TaskStateAtomic& TaskStateAtomic::operator=(const TaskStateAtomic& other) {
    state.store(other.state.load(std::memory_order_acquire), std::memory_order_release);
    return *this;
}

bool TaskStateAtomic::transition(TaskState from, TaskState to) {
    TaskState expected = from;
    return state.compare_exchange_strong(expected, to, std::memory_order_acq_rel, std::memory_order_acquire);
}

bool TaskStateAtomic::tryStart() {
    return transition(TaskState::Pending, TaskState::Running);
}

bool TaskStateAtomic::markCompleted() {
    return transition(TaskState::Running, TaskState::Completed);
}

bool TaskStateAtomic::markFailed() {
    return transition(TaskState::Running, TaskState::Failed);
}

bool TaskStateAtomic::markCancelled() {
    return transition(TaskState::Pending, TaskState::Cancelled);
}

TaskState TaskStateAtomic::get() const {
    return state.load(std::memory_order_acquire);
}

bool TaskStateAtomic::isTerminal() const {
    TaskState current = get();
    return current == TaskState::Completed || current == TaskState::Failed || current == TaskState::Cancelled;
}

bool TaskStateAtomic::hasStarted() const {
    TaskState current = get();
    return current != TaskState::Pending && current != TaskState::Cancelled;
}

bool TaskStateAtomic::isPending() const {
    return get() == TaskState::Pending;
}

bool TaskStateAtomic::isRunning() const {
    return get() == TaskState::Running;
}

bool TaskStateAtomic::isCompleted() const {
    return get() == TaskState::Completed;
}

bool TaskStateAtomic::isFailed() const {
    return get() == TaskState::Failed;
}

bool TaskStateAtomic::isCancelled() const {
    return get() == TaskState::Cancelled;
}

std::string_view TaskStateAtomic::toString() const {
    return taskStateToString(get());
}

} // namespace WP
