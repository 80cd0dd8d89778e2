#pragma once
#include "PoolState.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string_view>

namespace WP {

/**
 * Monotonic, thread-safe pool state.
 *
 * Transitions are CAS based and only ever move forward in PoolState order, so
 * concurrent shutdown()/shutdownNow() calls resolve to the strongest request.
 * Termination waiters block on a condition variable that is signalled once
 * when Terminated is reached.
 */
class LifecycleState {
public:
    LifecycleState() = default;

    LifecycleState(LifecycleState const&)            = delete;
    LifecycleState& operator=(LifecycleState const&) = delete;

    // Moves to target if the current state is weaker. Returns true if this call changed the state.
    bool advanceTo(PoolState target);
    // Moves to Terminated from any non-terminal state and wakes waiters. Returns true on the first call.
    bool markTerminated();

    PoolState get() const;
    bool      isRunning() const;
    bool      isShutdown() const; // Any state other than Running
    bool      isTerminated() const;

    void waitTerminated() const;
    bool waitTerminatedFor(std::chrono::steady_clock::duration timeout) const;

    std::string_view toString() const;

private:
    std::atomic<PoolState>          state{PoolState::Running};
    mutable std::mutex              mutex;
    mutable std::condition_variable terminatedCV;
};

} // namespace WP
