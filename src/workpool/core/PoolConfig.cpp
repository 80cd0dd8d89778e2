#include "core/PoolConfig.hpp"

#include <string>

namespace WP {

auto PoolConfig::validate() const -> std::optional<Error> {
    if (this->maxWorkers == 0)
        return Error{Error::Code::InvalidConfig, "max_workers must be at least 1"};
    if (this->coreWorkers > this->maxWorkers)
        return Error{Error::Code::InvalidConfig,
                     "core_workers (" + std::to_string(this->coreWorkers) + ") exceeds max_workers ("
                             + std::to_string(this->maxWorkers) + ")"};
    if (this->keepAlive.count() < 0)
        return Error{Error::Code::InvalidConfig, "keep_alive must not be negative"};
    if (this->allowCoreTimeout && this->keepAlive.count() == 0)
        return Error{Error::Code::InvalidConfig, "allow_core_timeout requires a positive keep_alive"};
    if (this->queue.mode == QueueCapacity::Mode::Bounded && this->queue.capacity == 0)
        return Error{Error::Code::InvalidConfig, "bounded queue needs a capacity of at least 1; use handoff for zero"};
    if (this->handoffTimeout && this->queue.mode != QueueCapacity::Mode::Handoff)
        return Error{Error::Code::InvalidConfig, "handoff_timeout only applies to the handoff queue mode"};
    if (this->handoffTimeout && this->handoffTimeout->count() < 0)
        return Error{Error::Code::InvalidConfig, "handoff_timeout must not be negative"};
    if (this->schedule.driftThreshold.count() < 0)
        return Error{Error::Code::InvalidConfig, "drift_threshold must not be negative"};
    if (this->forkJoin.splitThreshold < 1)
        return Error{Error::Code::InvalidConfig, "split_threshold must be at least 1"};
    if (this->forkJoin.dequeCapacity < 2)
        return Error{Error::Code::InvalidConfig, "deque_capacity must be at least 2"};
    return std::nullopt;
}

auto rejectionKindToString(RejectionKind kind) -> std::string_view {
    switch (kind) {
        case RejectionKind::Abort:
            return "abort";
        case RejectionKind::Discard:
            return "discard";
        case RejectionKind::DiscardOldest:
            return "discard_oldest";
        case RejectionKind::CallerRuns:
            return "caller_runs";
    }
    return "abort";
}

auto rejectionKindFromString(std::string_view text) -> Expected<RejectionKind> {
    if (text == "abort")
        return RejectionKind::Abort;
    if (text == "discard")
        return RejectionKind::Discard;
    if (text == "discard_oldest")
        return RejectionKind::DiscardOldest;
    if (text == "caller_runs")
        return RejectionKind::CallerRuns;
    return std::unexpected(Error{Error::Code::MalformedInput, "unknown rejection policy '" + std::string(text) + "'"});
}

auto queueModeToString(QueueCapacity::Mode mode) -> std::string_view {
    switch (mode) {
        case QueueCapacity::Mode::Handoff:
            return "handoff";
        case QueueCapacity::Mode::Bounded:
            return "bounded";
        case QueueCapacity::Mode::Unbounded:
            return "unbounded";
    }
    return "unbounded";
}

auto queueModeFromString(std::string_view text) -> Expected<QueueCapacity::Mode> {
    if (text == "handoff")
        return QueueCapacity::Mode::Handoff;
    if (text == "bounded")
        return QueueCapacity::Mode::Bounded;
    if (text == "unbounded")
        return QueueCapacity::Mode::Unbounded;
    return std::unexpected(Error{Error::Code::MalformedInput, "unknown queue mode '" + std::string(text) + "'"});
}

auto missedRunPolicyToString(MissedRunPolicy policy) -> std::string_view {
    switch (policy) {
        case MissedRunPolicy::CatchUp:
            return "catch_up";
        case MissedRunPolicy::Skip:
            return "skip";
    }
    return "catch_up";
}

auto missedRunPolicyFromString(std::string_view text) -> Expected<MissedRunPolicy> {
    if (text == "catch_up")
        return MissedRunPolicy::CatchUp;
    if (text == "skip")
        return MissedRunPolicy::Skip;
    return std::unexpected(Error{Error::Code::MalformedInput, "unknown missed-run policy '" + std::string(text) + "'"});
}

} // namespace WP
