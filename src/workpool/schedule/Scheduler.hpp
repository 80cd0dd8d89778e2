#pragma once
#include "core/Error.hpp"
#include "core/PoolConfig.hpp"
#include "core/PoolEvent.hpp"
#include "schedule/ScheduleHandle.hpp"
#include "schedule/ScheduledTask.hpp"
#include "task/TaskHandle.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace WP {

class Task;

// The pool side of a Scheduler: where firings are dispatched and events go.
struct ScheduleTarget {
    virtual ~ScheduleTarget() = default;

    // Admits a firing through normal dispatch, bypassing the rejection policy.
    virtual auto dispatchScheduled(std::shared_ptr<Task> const& task) -> std::optional<Error> = 0;
    virtual auto emitEvent(PoolEvent event) -> void                                           = 0;
    // Called whenever the number of pending entries drops to zero.
    virtual auto scheduleDrained() -> void                   = 0;
    virtual auto targetName() const -> std::string const& = 0;
};

/**
 * Scheduler: delayed and periodic admission on top of a pool.
 *
 * A single timer thread keeps entries ordered by their next trigger time and
 * hands each due firing to the ScheduleTarget. Fixed-rate entries rearm at
 * previous trigger + period, fixed-delay entries at completion + delay; both
 * rearm only after the firing completed, so executions never overlap.
 *
 * pending() counts armed entries plus firings dispatched but not yet settled.
 */
class Scheduler : public std::enable_shared_from_this<Scheduler> {
public:
    using Clock = std::chrono::steady_clock;

    static auto Create(ScheduleTarget& target, ScheduleOptions options) -> std::shared_ptr<Scheduler>;

    ~Scheduler();

    Scheduler(Scheduler const&)            = delete;
    Scheduler& operator=(Scheduler const&) = delete;

    template <typename F>
    auto schedule(F&& fn, Clock::duration delay, TaskOptions options = {}) -> Expected<ScheduleHandle<TaskResultOf<std::decay_t<F>>>> {
        using R       = TaskResultOf<std::decay_t<F>>;
        auto label    = options.label;
        auto packaged = packageTask(std::forward<F>(fn), std::move(options));
        auto entry    = std::make_shared<ScheduledEntry>();
        entry->kind    = ScheduledEntry::Kind::OneShot;
        entry->label   = std::move(label);
        entry->oneShot = packaged.task;
        if (auto error = this->arm(entry, Clock::now() + clampDelay(delay)))
            return std::unexpected(std::move(*error));
        return ScheduleHandle<R>(std::move(entry), std::move(packaged.handle));
    }

    template <typename F>
    auto scheduleAtFixedRate(F&& fn, Clock::duration initialDelay, Clock::duration period, TaskOptions options = {})
            -> Expected<ScheduleHandle<void>> {
        return this->schedulePeriodic(ScheduledEntry::Kind::FixedRate, makeBody(std::forward<F>(fn)), initialDelay, period,
                                      std::move(options));
    }

    template <typename F>
    auto scheduleWithFixedDelay(F&& fn, Clock::duration initialDelay, Clock::duration delay, TaskOptions options = {})
            -> Expected<ScheduleHandle<void>> {
        return this->schedulePeriodic(ScheduledEntry::Kind::FixedDelay, makeBody(std::forward<F>(fn)), initialDelay, delay,
                                      std::move(options));
    }

    // Stops accepting registrations and cancels entries the options do not keep alive.
    auto shutdown() -> void;
    // Cancels every entry. Returns the one-shot tasks that had not fired yet.
    auto shutdownNow() -> std::vector<std::shared_ptr<Task>>;
    // Stops and joins the timer thread. Pending entries are cancelled.
    auto stop() -> void;

    // Disarms the entry if it is waiting for its trigger. Returns true if it was armed.
    auto disarm(ScheduledEntry& entry) -> bool;

    [[nodiscard]] auto pending() const -> std::size_t;
    [[nodiscard]] auto armedCount() const -> std::size_t;
    [[nodiscard]] auto options() const -> ScheduleOptions const& { return this->options_; }

private:
    struct Firing;

    Scheduler(ScheduleTarget& target, ScheduleOptions options);

    template <typename F>
    static auto makeBody(F&& fn) -> ScheduledEntry::Body {
        using Fn = std::decay_t<F>;
        return [fn = Fn(std::forward<F>(fn))](CancellationToken const& token) mutable {
            if constexpr (TakesCancellationToken<Fn>)
                fn(token);
            else
                fn();
        };
    }

    static auto clampDelay(Clock::duration delay) -> Clock::duration;

    auto schedulePeriodic(ScheduledEntry::Kind kind, ScheduledEntry::Body body, Clock::duration initialDelay,
                          Clock::duration period, TaskOptions options) -> Expected<ScheduleHandle<void>>;
    auto arm(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point when) -> std::optional<Error>;
    auto rearm(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor, Clock::time_point completedAt)
            -> void;
    auto timerLoop(std::stop_token stopToken) -> void;
    auto fire(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor) -> void;
    auto firePeriodic(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor) -> void;
    auto settleFiring(std::shared_ptr<ScheduledEntry> const& entry, Clock::time_point scheduledFor,
                      std::optional<Error> const& failure, bool ran) -> void;
    auto release(std::size_t count) -> void;
    auto keepsPeriodicLocked() const -> bool;

    ScheduleTarget&  target_;
    ScheduleOptions  options_;

    mutable std::mutex                                                            mutex_;
    std::condition_variable                                                       cv_;
    std::map<std::pair<Clock::time_point, std::uint64_t>, std::shared_ptr<ScheduledEntry>> entries_;
    std::uint64_t                                                                 nextSequence_ = 0;
    bool                                                                          accepting_    = true;
    bool                                                                          stopped_      = false;
    std::atomic<std::size_t>                                                      pending_{0};
    std::atomic<std::uint64_t>                                                    nextEntryId_{1};
    std::jthread                                                                  thread_;
};

} // namespace WP
