#include "forkjoin/ForkJoinTask.hpp"
#include "forkjoin/ForkJoinPool.hpp"
#include "log/TaggedLogger.hpp"

#include <thread>

namespace WP {

namespace {
thread_local ForkJoinTaskBase* currentTask = nullptr;
} // namespace

auto ForkJoinTaskBase::current() -> ForkJoinTaskBase* {
    return currentTask;
}

auto ForkJoinTaskBase::attach(ForkJoinPool* pool) -> void {
    this->pool_.store(pool, std::memory_order_release);
    // Shared-owned tasks keep themselves alive until a worker has executed them.
    if (auto self = this->weak_from_this().lock())
        this->inFlight_ = std::move(self);
}

auto ForkJoinTaskBase::forkBase() -> void {
    this->parent_ = currentTask;
    auto* pool    = ForkJoinPool::current();
    if (pool == nullptr)
        pool = &ForkJoinPool::Instance();
    pool->fork(this);
}

auto ForkJoinTaskBase::exec() -> void {
    if (!this->state_.tryStart())
        return;

    auto* previous = currentTask;
    currentTask    = this;
    try {
        this->runCompute();
    } catch (...) {
        this->error_ = std::current_exception();
    }
    currentTask = previous;

    if (this->error_)
        this->state_.markFailed();
    else
        this->state_.markCompleted();
    this->finish();
}

auto ForkJoinTaskBase::cancel() -> bool {
    if (!this->state_.markCancelled())
        return false;
    this->finish();
    return true;
}

// After done_ is published a joiner may destroy the task; only the pool is touched afterwards.
auto ForkJoinTaskBase::finish() -> void {
    auto* pool = this->pool_.load(std::memory_order_acquire);
    this->done_.store(true, std::memory_order_seq_cst);
    if (pool != nullptr)
        pool->signalCompletion();
}

auto ForkJoinTaskBase::awaitDone() -> void {
    if (this->isDone())
        return;
    auto* pool = this->pool_.load(std::memory_order_acquire);
    if (pool == nullptr) {
        // Never forked or submitted: compute here.
        this->exec();
        while (!this->isDone())
            std::this_thread::yield();
        return;
    }
    if (ForkJoinPool::current() == pool)
        pool->helpJoin(*this);
    else
        pool->awaitExternal(*this);
}

auto ForkJoinTaskBase::rethrowIfAbnormal() const -> void {
    if (this->state_.isCancelled())
        throw ErrorException(Error{Error::Code::Cancelled, "fork/join task was cancelled"});
    if (this->error_)
        std::rethrow_exception(this->error_);
}

} // namespace WP
