#pragma once
#include "task/CancellationToken.hpp"
#include "task/ResultSlot.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace WP {

class Scheduler;
class Task;

/**
 * One schedule registration: a trigger plus the work it fires.
 *
 * One-shot entries carry a pre-packaged Task that is handed to the pool when
 * the delay elapses. Periodic entries carry a body that each firing wraps in a
 * fresh Task; the next firing is only armed after the previous one finished,
 * so runs of one entry never overlap. `completion` is decided once, when a
 * periodic entry is cancelled or a run fails.
 *
 * Scheduling fields (`key`, `armed`) are guarded by the owning Scheduler's mutex.
 */
struct ScheduledEntry {
    enum class Kind {
        OneShot,
        FixedRate,
        FixedDelay
    };

    using Clock = std::chrono::steady_clock;
    using Body  = std::function<void(CancellationToken const&)>;

    Kind                    kind = Kind::OneShot;
    std::uint64_t           id   = 0;
    std::string             label;
    Clock::duration         period{0};
    std::weak_ptr<Scheduler> owner;

    std::shared_ptr<Task>             oneShot;    // OneShot only
    Body                              body;       // Periodic only
    std::shared_ptr<ResultSlot<void>> completion; // Periodic only

    std::atomic<bool>          cancelled{false};
    std::atomic<std::uint64_t> runs{0};
    std::atomic<Clock::rep>    nextFire{0}; // Clock ticks since epoch; 0 while no firing is armed

    Clock::time_point key{};
    std::uint64_t     sequence = 0;
    bool              armed    = false;

    [[nodiscard]] auto isPeriodic() const -> bool { return this->kind != Kind::OneShot; }

    // Stops future firings. Returns false if the entry already fired (one-shot) or finished (periodic).
    auto cancel() -> bool;

    auto nextFireTime() const -> std::optional<Clock::time_point>;
    auto setNextFireTime(std::optional<Clock::time_point> when) -> void;
};

constexpr std::string_view scheduleKindToString(ScheduledEntry::Kind kind) {
    switch (kind) {
        case ScheduledEntry::Kind::OneShot:
            return "one_shot";
        case ScheduledEntry::Kind::FixedRate:
            return "fixed_rate";
        case ScheduledEntry::Kind::FixedDelay:
            return "fixed_delay";
    }
    return "unknown";
}

} // namespace WP
