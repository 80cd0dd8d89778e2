#include "schedule/Scheduler.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

namespace WP {

struct Scheduler::Firing {
    std::atomic<bool> settled{false};
};

namespace {

// Ends an entry that will never fire again.
auto retire(ScheduledEntry& entry, Error const& reason) -> void {
    entry.cancelled.store(true, std::memory_order_release);
    entry.setNextFireTime(std::nullopt);
    if (entry.oneShot)
        entry.oneShot->cancel(reason);
    if (entry.completion)
        entry.completion->setError(reason);
}

auto makeEvent(PoolEvent::Kind kind, std::string const& pool, std::string detail) -> PoolEvent {
    PoolEvent event{kind, pool, {}, std::move(detail)};
    return event;
}

} // namespace

auto ScheduledEntry::cancel() -> bool {
    Error const reason{Error::Code::Cancelled, "schedule cancelled"};
    if (this->kind == Kind::OneShot) {
        if (!this->oneShot || !this->oneShot->cancel(reason))
            return false;
    } else {
        if (!this->completion || !this->completion->setError(reason))
            return false;
    }
    this->cancelled.store(true, std::memory_order_release);
    if (auto scheduler = this->owner.lock())
        scheduler->disarm(*this);
    this->setNextFireTime(std::nullopt);
    return true;
}

auto ScheduledEntry::nextFireTime() const -> std::optional<Clock::time_point> {
    auto const ticks = this->nextFire.load(std::memory_order_acquire);
    if (ticks == 0)
        return std::nullopt;
    return Clock::time_point{Clock::duration{ticks}};
}

auto ScheduledEntry::setNextFireTime(std::optional<Clock::time_point> when) -> void {
    this->nextFire.store(when ? when->time_since_epoch().count() : 0, std::memory_order_release);
}

Scheduler::Scheduler(ScheduleTarget& target, ScheduleOptions options) : target_(target), options_(options) {}

auto Scheduler::Create(ScheduleTarget& target, ScheduleOptions options) -> std::shared_ptr<Scheduler> {
    auto scheduler     = std::shared_ptr<Scheduler>(new Scheduler(target, options));
    scheduler->thread_ = std::jthread([raw = scheduler.get()](std::stop_token stopToken) { raw->timerLoop(stopToken); });
    wp_log("Scheduler started for " + target.targetName(), "Scheduler");
    return scheduler;
}

Scheduler::~Scheduler() {
    this->stop();
}

auto Scheduler::clampDelay(Clock::duration delay) -> Clock::duration {
    return delay < Clock::duration::zero() ? Clock::duration::zero() : delay;
}

auto Scheduler::schedulePeriodic(ScheduledEntry::Kind kind, ScheduledEntry::Body body, Clock::duration initialDelay,
                                 Clock::duration period, TaskOptions options) -> Expected<ScheduleHandle<void>> {
    if (period <= Clock::duration::zero())
        return std::unexpected(Error{Error::Code::InvalidConfig, "schedule period must be positive"});
    auto entry        = std::make_shared<ScheduledEntry>();
    entry->kind       = kind;
    entry->label      = std::move(options.label);
    entry->period     = period;
    entry->body       = std::move(body);
    entry->completion = std::make_shared<ResultSlot<void>>();
    if (auto error = this->arm(entry, Clock::now() + clampDelay(initialDelay)))
        return std::unexpected(std::move(*error));
    return ScheduleHandle<void>(entry, TaskHandle<void>(entry->completion, std::weak_ptr<Task>{}));
}

auto Scheduler::arm(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point when) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (!this->accepting_ || this->stopped_)
            return Error{Error::Code::IllegalState, "pool '" + this->target_.targetName() + "' no longer accepts schedules"};
        entry->id       = this->nextEntryId_.fetch_add(1, std::memory_order_relaxed);
        entry->owner    = this->weak_from_this();
        entry->key      = when;
        entry->sequence = this->nextSequence_++;
        entry->armed    = true;
        this->entries_.emplace(std::make_pair(when, entry->sequence), entry);
        this->pending_.fetch_add(1, std::memory_order_acq_rel);
        entry->setNextFireTime(when);
    }
    this->cv_.notify_all();
    wp_log("Scheduler armed " + std::string(scheduleKindToString(entry->kind)) + " entry id=" + std::to_string(entry->id),
           "Scheduler");
    return std::nullopt;
}

auto Scheduler::keepsPeriodicLocked() const -> bool {
    return !this->stopped_ && (this->accepting_ || this->options_.continuePeriodicAfterShutdown);
}

auto Scheduler::rearm(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor,
                      Clock::time_point completedAt) -> void {
    Clock::time_point next;
    if (entry->kind == ScheduledEntry::Kind::FixedRate) {
        next = scheduledFor + entry->period;
        if (this->options_.missedRuns == MissedRunPolicy::Skip && next < completedAt) {
            auto const missed = (completedAt - next) / entry->period;
            next += (missed + 1) * entry->period;
        }
    } else {
        next = completedAt + entry->period;
    }

    bool armed = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (!entry->cancelled.load(std::memory_order_acquire) && this->keepsPeriodicLocked()) {
            entry->key      = next;
            entry->sequence = this->nextSequence_++;
            entry->armed    = true;
            this->entries_.emplace(std::make_pair(next, entry->sequence), entry);
            this->pending_.fetch_add(1, std::memory_order_acq_rel);
            entry->setNextFireTime(next);
            armed = true;
        }
    }
    if (armed) {
        this->cv_.notify_all();
        return;
    }
    retire(*entry, Error{Error::Code::Cancelled, "pool '" + this->target_.targetName() + "' shut down"});
}

auto Scheduler::disarm(ScheduledEntry& entry) -> bool {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (!entry.armed)
            return false;
        this->entries_.erase(std::make_pair(entry.key, entry.sequence));
        entry.armed = false;
    }
    this->cv_.notify_all();
    this->release(1);
    return true;
}

auto Scheduler::release(std::size_t count) -> void {
    if (count == 0)
        return;
    if (this->pending_.fetch_sub(count, std::memory_order_acq_rel) == count)
        this->target_.scheduleDrained();
}

auto Scheduler::timerLoop(std::stop_token stopToken) -> void {
    std::unique_lock<std::mutex> lock(this->mutex_);
    while (!stopToken.stop_requested() && !this->stopped_) {
        if (this->entries_.empty()) {
            this->cv_.wait(lock);
            continue;
        }
        auto it = this->entries_.begin();
        // Copied: a cancel may erase the node while the wait has the mutex released.
        auto const deadline = it->first.first;
        if (deadline > Clock::now()) {
            this->cv_.wait_until(lock, deadline);
            continue;
        }
        auto       entry        = it->second;
        auto const scheduledFor = it->first.first;
        this->entries_.erase(it);
        entry->armed = false;
        lock.unlock();
        this->fire(entry, scheduledFor);
        lock.lock();
    }
}

auto Scheduler::fire(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor) -> void {
    if (entry->cancelled.load(std::memory_order_acquire)) {
        this->release(1);
        return;
    }
    if (entry->isPeriodic()) {
        this->firePeriodic(entry, scheduledFor);
        return;
    }

    entry->setNextFireTime(std::nullopt);
    auto const& task = entry->oneShot;
    if (task && task->isPending()) {
        entry->runs.fetch_add(1, std::memory_order_acq_rel);
        if (auto error = this->target_.dispatchScheduled(task)) {
            wp_log("Scheduler one-shot dispatch failed: " + describeError(*error), "Scheduler");
            this->target_.emitEvent(makeEvent(PoolEvent::Kind::TaskRejected, this->target_.targetName(), describeError(*error)));
            task->cancel(*error);
        }
    }
    this->release(1);
}

auto Scheduler::firePeriodic(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor) -> void {
    auto                     firing    = std::make_shared<Firing>();
    std::weak_ptr<Scheduler> weak      = this->weak_from_this();
    auto const               threshold = std::chrono::duration_cast<Clock::duration>(this->options_.driftThreshold);

    auto function = [weak, entry, firing, scheduledFor, threshold](Task& task) -> std::optional<Error> {
        auto const drift = Clock::now() - scheduledFor;
        entry->runs.fetch_add(1, std::memory_order_acq_rel);
        if (drift > threshold) {
            if (auto scheduler = weak.lock()) {
                auto event  = makeEvent(PoolEvent::Kind::ScheduleDrift, scheduler->target_.targetName(), entry->label);
                event.drift = std::chrono::duration_cast<std::chrono::nanoseconds>(drift);
                scheduler->target_.emitEvent(std::move(event));
            }
        }

        std::optional<Error> failure;
        try {
            entry->body(std::as_const(task.token()));
        } catch (...) {
            failure = Error{Error::Code::TaskFailed, detail::describeCurrentException()};
        }
        if (failure)
            entry->completion->setError(*failure);

        if (!firing->settled.exchange(true, std::memory_order_acq_rel)) {
            if (auto scheduler = weak.lock())
                scheduler->settleFiring(entry, scheduledFor, failure, true);
        }
        return failure;
    };
    auto abandon = [weak, entry, firing, scheduledFor](Error const& reason) {
        if (firing->settled.exchange(true, std::memory_order_acq_rel))
            return;
        entry->completion->setError(reason);
        if (auto scheduler = weak.lock())
            scheduler->settleFiring(entry, scheduledFor, reason, false);
    };

    auto task = Task::Create(std::move(function), std::move(abandon), TaskOptions{entry->label});
    entry->setNextFireTime(std::nullopt);
    if (auto error = this->target_.dispatchScheduled(task)) {
        // The firing is skipped, not the schedule.
        firing->settled.store(true, std::memory_order_release);
        task->cancel(*error);
        wp_log("Scheduler periodic firing rejected: " + describeError(*error), "Scheduler");
        this->target_.emitEvent(makeEvent(PoolEvent::Kind::TaskRejected, this->target_.targetName(), describeError(*error)));
        this->rearm(entry, scheduledFor, Clock::now());
        this->release(1);
    }
}

auto Scheduler::settleFiring(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor,
                             std::optional<Error> const& failure, bool ran) -> void {
    if (ran && !failure)
        this->rearm(entry, scheduledFor, Clock::now());
    else
        entry->setNextFireTime(std::nullopt);
    this->release(1);
}

auto Scheduler::shutdown() -> void {
    std::vector<std::shared_ptr<ScheduledEntry>> dropped;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->accepting_ = false;
        for (auto it = this->entries_.begin(); it != this->entries_.end();) {
            auto const& entry = it->second;
            bool const  keep  = entry->isPeriodic() ? this->options_.continuePeriodicAfterShutdown
                                                    : this->options_.runDelayedAfterShutdown;
            if (keep) {
                ++it;
                continue;
            }
            entry->armed = false;
            dropped.push_back(entry);
            it = this->entries_.erase(it);
        }
    }
    this->cv_.notify_all();
    Error const reason{Error::Code::Cancelled, "pool '" + this->target_.targetName() + "' shut down"};
    for (auto const& entry : dropped)
        retire(*entry, reason);
    wp_log("Scheduler::shutdown cancelled " + std::to_string(dropped.size()) + " entries", "Scheduler");
    this->release(dropped.size());
}

auto Scheduler::shutdownNow() -> std::vector<std::shared_ptr<Task>> {
    std::vector<std::shared_ptr<ScheduledEntry>> dropped;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->accepting_ = false;
        this->stopped_   = true;
        for (auto& [key, entry] : this->entries_) {
            entry->armed = false;
            dropped.push_back(entry);
        }
        this->entries_.clear();
    }
    this->cv_.notify_all();

    std::vector<std::shared_ptr<Task>> unstarted;
    Error const                        reason{Error::Code::Cancelled, "pool '" + this->target_.targetName() + "' stopped"};
    for (auto const& entry : dropped) {
        if (!entry->isPeriodic() && entry->oneShot && entry->oneShot->isPending()) {
            entry->cancelled.store(true, std::memory_order_release);
            entry->setNextFireTime(std::nullopt);
            unstarted.push_back(entry->oneShot);
            continue;
        }
        retire(*entry, reason);
    }
    this->release(dropped.size());
    return unstarted;
}

auto Scheduler::stop() -> void {
    std::vector<std::shared_ptr<ScheduledEntry>> dropped;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->accepting_ = false;
        this->stopped_   = true;
        for (auto& [key, entry] : this->entries_) {
            entry->armed = false;
            dropped.push_back(entry);
        }
        this->entries_.clear();
    }
    this->thread_.request_stop();
    this->cv_.notify_all();
    if (this->thread_.joinable()) {
        if (this->thread_.get_id() == std::this_thread::get_id())
            this->thread_.detach();
        else
            this->thread_.join();
    }

    Error const reason{Error::Code::Cancelled, "scheduler stopped"};
    for (auto const& entry : dropped)
        retire(*entry, reason);
    this->release(dropped.size());
}

auto Scheduler::pending() const -> std::size_t {
    return this->pending_.load(std::memory_order_acquire);
}

auto Scheduler::armedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->entries_.size();
}

} // namespace WP
