#include "pool/TaskQueue.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

#include <algorithm>
#include <limits>

namespace WP {

TaskQueue::TaskQueue(QueueCapacity capacity) : capacity_(capacity) {}

auto TaskQueue::capacity() const -> QueueCapacity {
    return this->capacity_;
}

auto TaskQueue::hasUnmatchedConsumerLocked() const -> bool {
    return this->items_.size() < this->waitingConsumers_;
}

auto TaskQueue::hasRoomLocked() const -> bool {
    switch (this->capacity_.mode) {
        case QueueCapacity::Mode::Handoff:
            return this->hasUnmatchedConsumerLocked();
        case QueueCapacity::Mode::Bounded:
            return this->items_.size() < this->capacity_.capacity;
        case QueueCapacity::Mode::Unbounded:
            return true;
    }
    return false;
}

auto TaskQueue::offer(std::shared_ptr<Task> task) -> bool {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (this->closed_ || !this->hasRoomLocked())
            return false;
        this->items_.push_back(std::move(task));
    }
    this->notEmpty_.notify_one();
    return true;
}

auto TaskQueue::offerFor(std::shared_ptr<Task> task, std::chrono::steady_clock::duration timeout) -> bool {
    {
        std::unique_lock<std::mutex> lock(this->mutex_);
        bool const admitted = this->notFull_.wait_for(lock, timeout, [this] { return this->closed_ || this->hasRoomLocked(); });
        if (!admitted || this->closed_)
            return false;
        this->items_.push_back(std::move(task));
    }
    this->notEmpty_.notify_one();
    return true;
}

auto TaskQueue::put(std::shared_ptr<Task> task) -> bool {
    {
        std::unique_lock<std::mutex> lock(this->mutex_);
        this->notFull_.wait(lock, [this] { return this->closed_ || this->hasRoomLocked(); });
        if (this->closed_)
            return false;
        this->items_.push_back(std::move(task));
    }
    this->notEmpty_.notify_one();
    return true;
}

auto TaskQueue::transferToWaiting(std::shared_ptr<Task> task) -> bool {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (this->closed_ || !this->hasUnmatchedConsumerLocked())
            return false;
        this->items_.push_back(std::move(task));
    }
    this->notEmpty_.notify_one();
    return true;
}

auto TaskQueue::epoch() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->epoch_;
}

auto TaskQueue::popLocked() -> std::shared_ptr<Task> {
    auto task = std::move(this->items_.front());
    this->items_.pop_front();
    return task;
}

auto TaskQueue::take(std::uint64_t seenEpoch) -> std::shared_ptr<Task> {
    std::shared_ptr<Task> task;
    {
        std::unique_lock<std::mutex> lock(this->mutex_);
        if (this->items_.empty() && this->epoch_ == seenEpoch) {
            ++this->waitingConsumers_;
            // A new consumer is room for a handoff producer.
            this->notFull_.notify_one();
            this->notEmpty_.wait(lock, [&] { return !this->items_.empty() || this->epoch_ != seenEpoch; });
            --this->waitingConsumers_;
        }
        if (this->items_.empty())
            return nullptr;
        task = this->popLocked();
    }
    this->notFull_.notify_one();
    return task;
}

auto TaskQueue::poll(std::chrono::steady_clock::duration timeout, std::uint64_t seenEpoch) -> std::shared_ptr<Task> {
    std::shared_ptr<Task> task;
    {
        std::unique_lock<std::mutex> lock(this->mutex_);
        if (this->items_.empty() && this->epoch_ == seenEpoch) {
            ++this->waitingConsumers_;
            this->notFull_.notify_one();
            this->notEmpty_.wait_for(lock, timeout, [&] { return !this->items_.empty() || this->epoch_ != seenEpoch; });
            --this->waitingConsumers_;
        }
        if (this->items_.empty())
            return nullptr;
        task = this->popLocked();
    }
    this->notFull_.notify_one();
    return task;
}

auto TaskQueue::tryPoll() -> std::shared_ptr<Task> {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (this->items_.empty())
            return nullptr;
        task = this->popLocked();
    }
    this->notFull_.notify_one();
    return task;
}

auto TaskQueue::evictOldest() -> std::shared_ptr<Task> {
    return this->tryPoll();
}

auto TaskQueue::remove(Task const* task) -> bool {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        auto it = std::find_if(this->items_.begin(), this->items_.end(), [task](auto const& queued) { return queued.get() == task; });
        if (it == this->items_.end())
            return false;
        this->items_.erase(it);
    }
    this->notFull_.notify_one();
    return true;
}

auto TaskQueue::drain() -> std::vector<std::shared_ptr<Task>> {
    std::vector<std::shared_ptr<Task>> drained;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        drained.reserve(this->items_.size());
        for (auto& task : this->items_)
            drained.push_back(std::move(task));
        this->items_.clear();
    }
    this->notFull_.notify_all();
    wp_log("TaskQueue::drain removed " + std::to_string(drained.size()) + " tasks", "Queue");
    return drained;
}

auto TaskQueue::wakeAll() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        ++this->epoch_;
    }
    this->notEmpty_.notify_all();
}

auto TaskQueue::close() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->closed_ = true;
    }
    this->notFull_.notify_all();
}

auto TaskQueue::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->items_.size();
}

auto TaskQueue::empty() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->items_.empty();
}

auto TaskQueue::remainingCapacity() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    switch (this->capacity_.mode) {
        case QueueCapacity::Mode::Handoff:
            return 0;
        case QueueCapacity::Mode::Bounded:
            return this->capacity_.capacity > this->items_.size() ? this->capacity_.capacity - this->items_.size() : 0;
        case QueueCapacity::Mode::Unbounded:
            return std::numeric_limits<std::size_t>::max();
    }
    return 0;
}

auto TaskQueue::waitingConsumers() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->waitingConsumers_;
}

} // namespace WP
