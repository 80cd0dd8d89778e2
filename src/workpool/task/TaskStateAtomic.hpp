#pragma once
#include "TaskState.hpp"

#include <atomic>
#include <string_view>

namespace WP {

// Thread-safe wrapper for managing task state transitions
struct TaskStateAtomic {
    TaskStateAtomic() = default;                              // Default constructor initializes to Pending
    TaskStateAtomic(const TaskStateAtomic& other);            // Copy constructor takes a snapshot of the other state
    TaskStateAtomic& operator=(const TaskStateAtomic& other); // Copy assignment takes a snapshot of the other state

    // Move operations are deleted because std::atomic is non-movable
    TaskStateAtomic(TaskStateAtomic&& other)            = delete;
    TaskStateAtomic& operator=(TaskStateAtomic&& other) = delete;

    bool tryStart();          // Attempts to transition from Pending to Running. Returns false if the task already started or was cancelled
    bool markCompleted();     // Attempts to transition from Running to Completed
    bool markFailed();        // Attempts to transition from Running to Failed
    bool markCancelled();     // Attempts to transition from Pending to Cancelled. Running tasks are never cancelled here
    bool isTerminal() const;  // Completed, Failed or Cancelled
    bool hasStarted() const;  // Any state except Pending and Cancelled
    bool isPending() const;
    bool isRunning() const;
    bool isCompleted() const;
    bool isFailed() const;
    bool isCancelled() const;

    TaskState get() const; // Get current state with acquire semantics

    std::string_view toString() const; // Get string representation of current state

private:
    bool transition(TaskState from, TaskState to);

    std::atomic<TaskState> state{TaskState::Pending}; // The underlying atomic state storage
};

} // namespace WP
