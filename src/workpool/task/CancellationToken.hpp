#pragma once
#include <atomic>

namespace WP {

/**
 * Cooperative stop flag shared between a task and whoever
 * may cancel it (its handle, or the pool during shutdownNow()).
 *
 * Nothing preempts a running task: bodies are expected to poll
 * stopRequested() at points where stopping is safe.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(CancellationToken const&)            = delete;
    CancellationToken& operator=(CancellationToken const&) = delete;

    [[nodiscard]] bool stopRequested() const {
        return stop.load(std::memory_order_acquire);
    }

    // Returns true if this call raised the flag.
    bool requestStop() {
        return !stop.exchange(true, std::memory_order_acq_rel);
    }

private:
    std::atomic<bool> stop{false};
};

namespace this_task {

// True if the task currently executing on this thread has been asked to stop.
// Always false outside a task body.
[[nodiscard]] bool stopRequested();

// The token of the task currently executing on this thread, or nullptr.
[[nodiscard]] CancellationToken const* currentToken();

} // namespace this_task

namespace detail {

// Installs a token as the current one for the calling thread for the lifetime of the scope.
class CurrentTokenScope {
public:
    explicit CurrentTokenScope(CancellationToken const* token);
    ~CurrentTokenScope();

    CurrentTokenScope(CurrentTokenScope const&)            = delete;
    CurrentTokenScope& operator=(CurrentTokenScope const&) = delete;

private:
    CancellationToken const* previous;
};

} // namespace detail

} // namespace WP
