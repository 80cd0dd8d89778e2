#pragma once
#include <string_view>

namespace WP {

// Represents the possible states of a task
enum class TaskState {
    Pending,   // Created or queued, not yet picked up by a worker
    Running,   // Task is actively executing
    Completed, // Task finished successfully
    Failed,    // Task body raised an error
    Cancelled  // Cancelled or dropped before it started
};

// Convert TaskState to string for debugging/logging
constexpr std::string_view taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::Pending:
            return "Pending";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
        case TaskState::Cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

} // namespace WP
