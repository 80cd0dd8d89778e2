#pragma once
#include "PoolState.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace WP {

/**
 * Structured notification emitted by pools and the scheduler.
 *
 * Events are delivered synchronously on the thread that observed them (a
 * worker, the timer thread or a submitting caller). Sinks must be thread-safe
 * and should return quickly.
 */
struct PoolEvent {
    enum class Kind {
        WorkerCreated,
        WorkerRetired,
        TaskRejected,
        TaskFailed,
        ScheduleDrift,
        StateChanged
    };

    Kind                     kind;
    std::string              pool;
    std::string              worker;              // Empty when not tied to a worker
    std::string              detail;              // Error description, rejection reason, task label
    std::chrono::nanoseconds drift{0};            // ScheduleDrift only
    PoolState                state = PoolState::Running; // StateChanged only
};

constexpr std::string_view poolEventKindToString(PoolEvent::Kind kind) {
    switch (kind) {
        case PoolEvent::Kind::WorkerCreated:
            return "worker_created";
        case PoolEvent::Kind::WorkerRetired:
            return "worker_retired";
        case PoolEvent::Kind::TaskRejected:
            return "task_rejected";
        case PoolEvent::Kind::TaskFailed:
            return "task_failed";
        case PoolEvent::Kind::ScheduleDrift:
            return "schedule_drift";
        case PoolEvent::Kind::StateChanged:
            return "state_changed";
    }
    return "unknown";
}

auto describeEvent(PoolEvent const& event) -> std::string;

// Receives pool events. Held by shared_ptr in PoolConfig.
struct EventSink {
    virtual ~EventSink() = default;

    virtual void onEvent(PoolEvent const& event) = 0;
};

// Forwards every event to the tagged logger under the "WorkPool" tag.
struct LoggingEventSink final : EventSink {
    void onEvent(PoolEvent const& event) override;
};

} // namespace WP
