#include "pool/RejectionPolicy.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

namespace WP {

namespace {

auto rejectionError(RejectionContext const& context) -> Error {
    return Error{Error::Code::Rejected, "task rejected by pool '" + context.poolName() + "'"};
}

} // namespace

auto AbortPolicy::rejected(std::shared_ptr<Task> const&, RejectionContext& context) -> std::optional<Error> {
    return rejectionError(context);
}

auto DiscardPolicy::rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> {
    wp_log("DiscardPolicy dropping task id=" + std::to_string(task->id()), "Rejection");
    task->cancel(Error{Error::Code::Discarded, "discarded by pool '" + context.poolName() + "'"});
    return std::nullopt;
}

auto DiscardOldestPolicy::rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> {
    if (context.isShutdown())
        return Error{Error::Code::IllegalState, "pool '" + context.poolName() + "' is shut down"};
    if (auto oldest = context.evictOldest()) {
        wp_log("DiscardOldestPolicy evicting task id=" + std::to_string(oldest->id()), "Rejection");
        oldest->cancel(Error{Error::Code::Discarded, "evicted from the queue of pool '" + context.poolName() + "'"});
    }
    if (context.retryAdmission(task))
        return std::nullopt;
    return rejectionError(context);
}

auto CallerRunsPolicy::rejected(std::shared_ptr<Task> const& task, RejectionContext& context) -> std::optional<Error> {
    if (context.isShutdown())
        return Error{Error::Code::IllegalState, "pool '" + context.poolName() + "' is shut down"};
    wp_log("CallerRunsPolicy running task id=" + std::to_string(task->id()) + " on the submitter", "Rejection");
    context.runOnCaller(task);
    return std::nullopt;
}

auto makeRejectionPolicy(RejectionKind kind) -> std::shared_ptr<RejectionPolicy> {
    switch (kind) {
        case RejectionKind::Abort:
            return std::make_shared<AbortPolicy>();
        case RejectionKind::Discard:
            return std::make_shared<DiscardPolicy>();
        case RejectionKind::DiscardOldest:
            return std::make_shared<DiscardOldestPolicy>();
        case RejectionKind::CallerRuns:
            return std::make_shared<CallerRunsPolicy>();
    }
    return std::make_shared<AbortPolicy>();
}

} // namespace WP
