#pragma once
#include "core/Error.hpp"
#include "core/PoolConfig.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace WP {

class Task;

/**
 * The slice of the pool a rejection policy may touch.
 * Implemented by TaskPool; tests provide their own.
 */
struct RejectionContext {
    virtual ~RejectionContext() = default;

    virtual auto poolName() const -> std::string const& = 0;
    virtual auto isShutdown() const -> bool             = 0;
    // Removes the queue head so it can be discarded. nullptr when nothing is queued.
    virtual auto evictOldest() -> std::shared_ptr<Task> = 0;
    // Runs the dispatch steps once more without consulting the policy. True if the task was admitted.
    virtual auto retryAdmission(std::shared_ptr<Task> const& task) -> bool = 0;
    // Executes the task synchronously on the calling thread, with the pool's bookkeeping.
    virtual auto runOnCaller(std::shared_ptr<Task> const& task) -> void = 0;
};

/**
 * Decides what happens to a task the pool cannot admit.
 *
 * rejected() returns nullopt when the policy disposed of the task (ran it,
 * dropped it, admitted it after all) and submit() should report success, or
 * the Error that submit() hands back to the caller.
 */
struct RejectionPolicy {
    virtual ~RejectionPolicy() = default;

    virtual auto rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> = 0;
    virtual auto name() const -> std::string_view                                                          = 0;
};

struct AbortPolicy final : RejectionPolicy {
    auto rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> override;
    auto name() const -> std::string_view override { return "abort"; }
};

// Drops the task; its handle completes with a Discarded error.
struct DiscardPolicy final : RejectionPolicy {
    auto rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> override;
    auto name() const -> std::string_view override { return "discard"; }
};

// Evicts the oldest queued task, then retries admission once before aborting.
struct DiscardOldestPolicy final : RejectionPolicy {
    auto rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> override;
    auto name() const -> std::string_view override { return "discard_oldest"; }
};

// Runs the task on the submitting thread. Refuses once the pool is shut down.
struct CallerRunsPolicy final : RejectionPolicy {
    auto rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> override;
    auto name() const -> std::string_view override { return "caller_runs"; }
};

auto makeRejectionPolicy(RejectionKind kind) -> std::shared_ptr<RejectionPolicy>;

} // namespace WP
