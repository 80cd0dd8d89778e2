#pragma once
#include <string_view>

namespace WP {

// Lifecycle of a pool. Values are ordered; a pool only ever moves to a larger value.
enum class PoolState {
    Running,      // Accepts and executes tasks
    ShuttingDown, // Rejects new tasks, drains queued ones
    Stopping,     // Rejects new tasks, queued tasks were handed back, running ones asked to stop
    Terminated    // All workers exited
};

constexpr std::string_view poolStateToString(PoolState state) {
    switch (state) {
        case PoolState::Running:
            return "Running";
        case PoolState::ShuttingDown:
            return "ShuttingDown";
        case PoolState::Stopping:
            return "Stopping";
        case PoolState::Terminated:
            return "Terminated";
        default:
            return "Unknown";
    }
}

} // namespace WP
