#pragma once
#include "core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace WP {

struct EventSink;
struct RejectionPolicy;
struct WorkerFactory;

// How many tasks the pool buffers while every worker is busy.
struct QueueCapacity {
    enum class Mode {
        Handoff,  // No buffering: a task is only queued if a worker is waiting to take it
        Bounded,  // Up to `capacity` tasks
        Unbounded // Never full; memory grows without limit under sustained overload
    };

    Mode        mode     = Mode::Unbounded;
    std::size_t capacity = 0;

    static auto Handoff() -> QueueCapacity { return {Mode::Handoff, 0}; }
    static auto Bounded(std::size_t capacity) -> QueueCapacity { return {Mode::Bounded, capacity}; }
    static auto Unbounded() -> QueueCapacity { return {Mode::Unbounded, 0}; }
};

enum class RejectionKind {
    Abort,
    Discard,
    DiscardOldest,
    CallerRuns
};

// What a fixed-rate schedule does with firings it missed while a run overran.
enum class MissedRunPolicy {
    CatchUp, // Run the missed firings back to back until the schedule is current again
    Skip     // Drop missed firings and continue at the next period boundary
};

struct ScheduleOptions {
    MissedRunPolicy           missedRuns = MissedRunPolicy::CatchUp;
    std::chrono::milliseconds driftThreshold{50};             // Start later than this past the trigger emits ScheduleDrift
    bool                      runDelayedAfterShutdown    = true;  // One-shot delayed tasks still fire after shutdown()
    bool                      continuePeriodicAfterShutdown = false; // Periodic tasks keep firing after shutdown()
};

struct ForkJoinOptions {
    std::size_t   parallelism    = 0;    // Worker count; 0 picks std::thread::hardware_concurrency()
    std::int64_t  splitThreshold = 1024; // Default sequential cutoff for range tasks
    std::size_t   dequeCapacity  = 4096; // Per-worker deque slots, rounded up to a power of two
};

/**
 * PoolConfig: everything a pool needs, captured once at construction.
 *
 * Strategy hooks (rejection, worker factory, event sink) are injected as
 * shared objects; when left empty the pool falls back to the built-in policy
 * named by `rejection`, the DefaultWorkerFactory and no event delivery.
 */
struct PoolConfig {
    std::string               name        = "workpool";
    std::size_t               coreWorkers = 1;
    std::size_t               maxWorkers  = 4;
    std::chrono::milliseconds keepAlive{60'000}; // Idle time after which workers above the core count retire
    bool                      allowCoreTimeout = false; // Core workers retire after keepAlive as well

    QueueCapacity                            queue = QueueCapacity::Unbounded();
    std::optional<std::chrono::milliseconds> handoffTimeout; // Handoff mode only: block submit up to this long for a taker

    RejectionKind                    rejection = RejectionKind::Abort;
    std::shared_ptr<RejectionPolicy> rejectionPolicy; // Overrides `rejection` when set

    std::shared_ptr<WorkerFactory> workerFactory;
    std::optional<int>             workerPriority; // Nice value applied by the default factory

    std::shared_ptr<EventSink> eventSink;

    ScheduleOptions schedule;
    ForkJoinOptions forkJoin;

    // Reports the first inconsistency found, or nullopt if the configuration is usable as is.
    [[nodiscard]] auto validate() const -> std::optional<Error>;
};

[[nodiscard]] auto rejectionKindToString(RejectionKind kind) -> std::string_view;
[[nodiscard]] auto rejectionKindFromString(std::string_view text) -> Expected<RejectionKind>;
[[nodiscard]] auto queueModeToString(QueueCapacity::Mode mode) -> std::string_view;
[[nodiscard]] auto queueModeFromString(std::string_view text) -> Expected<QueueCapacity::Mode>;
[[nodiscard]] auto missedRunPolicyToString(MissedRunPolicy policy) -> std::string_view;
[[nodiscard]] auto missedRunPolicyFromString(std::string_view text) -> Expected<MissedRunPolicy>;

} // namespace WP
