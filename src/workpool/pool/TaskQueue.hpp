#pragma once
#include "core/PoolConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace WP {

class Task;

/**
 * TaskQueue: blocking FIFO buffer between submitters and workers.
 *
 * Capacity modes
 * --------------
 * - Handoff: holds nothing on its own. offer() only succeeds while a consumer
 *   is blocked in take()/poll() and has not been matched with another task.
 * - Bounded: at most `capacity` tasks; offer() fails and put() blocks when full.
 * - Unbounded: offer() always succeeds. Sustained overload grows memory
 *   without limit; pick Bounded when that is not acceptable.
 *
 * Tasks leave in the order they were accepted. Consumers can be woken without
 * a task through wakeAll(); they pass the epoch() they observed before
 * checking pool state, so a wake that races with the check is never lost.
 */
class TaskQueue {
public:
    explicit TaskQueue(QueueCapacity capacity);

    TaskQueue(TaskQueue const&)            = delete;
    TaskQueue& operator=(TaskQueue const&) = delete;

    auto capacity() const -> QueueCapacity;

    // Non-blocking insert. Returns false when the queue cannot accept the task right now.
    auto offer(std::shared_ptr<Task> task) -> bool;
    // Blocks up to timeout for room (or, in handoff mode, for a waiting consumer).
    auto offerFor(std::shared_ptr<Task> task, std::chrono::steady_clock::duration timeout) -> bool;
    // Blocks until the task is accepted. Returns false if the queue was closed meanwhile.
    auto put(std::shared_ptr<Task> task) -> bool;
    // Inserts only if a consumer is currently blocked waiting and unmatched, regardless of mode.
    auto transferToWaiting(std::shared_ptr<Task> task) -> bool;

    auto epoch() const -> std::uint64_t;
    // Blocks until a task is available. Returns nullptr if woken through wakeAll() after `seenEpoch`.
    auto take(std::uint64_t seenEpoch) -> std::shared_ptr<Task>;
    // Like take() but gives up after timeout.
    auto poll(std::chrono::steady_clock::duration timeout, std::uint64_t seenEpoch) -> std::shared_ptr<Task>;
    auto tryPoll() -> std::shared_ptr<Task>;

    // Removes and returns the head of the queue, or nullptr if empty.
    auto evictOldest() -> std::shared_ptr<Task>;
    auto remove(Task const* task) -> bool;
    // Removes every queued task, in FIFO order.
    auto drain() -> std::vector<std::shared_ptr<Task>>;

    // Wakes every blocked consumer without handing it a task.
    auto wakeAll() -> void;
    // Fails blocked and future put()/offerFor() calls.
    auto close() -> void;

    auto size() const -> std::size_t;
    auto empty() const -> bool;
    // Free slots; SIZE_MAX for unbounded, 0 for handoff.
    auto remainingCapacity() const -> std::size_t;
    auto waitingConsumers() const -> std::size_t;

private:
    auto hasRoomLocked() const -> bool;
    auto hasUnmatchedConsumerLocked() const -> bool;
    auto popLocked() -> std::shared_ptr<Task>;

    QueueCapacity                     capacity_;
    mutable std::mutex                mutex_;
    std::condition_variable           notEmpty_;
    std::condition_variable           notFull_;
    std::deque<std::shared_ptr<Task>> items_;
    std::size_t                       waitingConsumers_ = 0;
    std::uint64_t                     epoch_            = 0;
    bool                              closed_           = false;
};

} // namespace WP
