#pragma once
#include "schedule/ScheduledTask.hpp"
#include "task/TaskHandle.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace WP {

/**
 * Caller-side view of a schedule registration.
 *
 * For a one-shot entry the result is the task's value. For periodic entries
 * (R = void) the result is only decided when the schedule ends: Cancelled
 * after cancel() or pool shutdown, TaskFailed if a run threw.
 */
template <typename R>
class ScheduleHandle {
public:
    using Clock = std::chrono::steady_clock;

    ScheduleHandle() = default;
    ScheduleHandle(std::shared_ptr<ScheduledEntry> entry, TaskHandle<R> result)
        : entry_(std::move(entry)), result_(std::move(result)) {}

    [[nodiscard]] auto valid() const -> bool { return this->entry_ != nullptr && this->result_.valid(); }

    // Stops future firings. An execution already in flight is left to finish.
    auto cancel() -> bool { return this->entry_ && this->entry_->cancel(); }

    [[nodiscard]] auto isCancelled() const -> bool { return this->result_.isCancelled(); }
    [[nodiscard]] auto isDone() const -> bool { return this->result_.ready(); }

    auto wait() const -> Expected<R> { return this->result_.wait(); }

    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> const& d) const -> Expected<R> {
        return this->result_.wait_for(d);
    }

    [[nodiscard]] auto poll() const -> std::optional<Expected<R>> { return this->result_.poll(); }

    // Number of firings that have started so far.
    [[nodiscard]] auto runCount() const -> std::uint64_t {
        return this->entry_ ? this->entry_->runs.load(std::memory_order_acquire) : 0;
    }

    [[nodiscard]] auto nextFireTime() const -> std::optional<Clock::time_point> {
        if (!this->entry_)
            return std::nullopt;
        return this->entry_->nextFireTime();
    }

    [[nodiscard]] auto kind() const -> ScheduledEntry::Kind {
        return this->entry_ ? this->entry_->kind : ScheduledEntry::Kind::OneShot;
    }

private:
    std::shared_ptr<ScheduledEntry> entry_;
    TaskHandle<R>                   result_;
};

} // namespace WP
