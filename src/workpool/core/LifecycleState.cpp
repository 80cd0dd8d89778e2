#include "LifecycleState.hpp"

namespace WP {

bool LifecycleState::advanceTo(PoolState target) {
    if (target == PoolState::Terminated)
        return this->markTerminated();
    PoolState current = state.load(std::memory_order_acquire);
    while (current < target) {
        if (state.compare_exchange_weak(current, target, std::memory_order_acq_rel, std::memory_order_acquire))
            return true;
    }
    return false;
}

bool LifecycleState::markTerminated() {
    PoolState current = state.load(std::memory_order_acquire);
    while (current != PoolState::Terminated) {
        if (state.compare_exchange_weak(current, PoolState::Terminated, std::memory_order_acq_rel, std::memory_order_acquire)) {
            std::lock_guard<std::mutex> lock(mutex);
            terminatedCV.notify_all();
            return true;
        }
    }
    return false;
}

PoolState LifecycleState::get() const {
    return state.load(std::memory_order_acquire);
}

bool LifecycleState::isRunning() const {
    return get() == PoolState::Running;
}

bool LifecycleState::isShutdown() const {
    return get() != PoolState::Running;
}

bool LifecycleState::isTerminated() const {
    return get() == PoolState::Terminated;
}

void LifecycleState::waitTerminated() const {
    std::unique_lock<std::mutex> lock(mutex);
    terminatedCV.wait(lock, [this] { return this->isTerminated(); });
}

bool LifecycleState::waitTerminatedFor(std::chrono::steady_clock::duration timeout) const {
    std::unique_lock<std::mutex> lock(mutex);
    return terminatedCV.wait_for(lock, timeout, [this] { return this->isTerminated(); });
}

std::string_view LifecycleState::toString() const {
    return poolStateToString(get());
}

} // namespace WP
