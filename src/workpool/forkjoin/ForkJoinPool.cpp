#include "forkjoin/ForkJoinPool.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

#include <algorithm>
#include <functional>
#include <system_error>

namespace WP {

thread_local ForkJoinPool::Worker* ForkJoinPool::tlsWorker_ = nullptr;

namespace {

thread_local ForkJoinPool* currentPool = nullptr;

auto normalise(PoolConfig config) -> PoolConfig {
    auto& options = config.forkJoin;
    if (options.parallelism == 0)
        options.parallelism = std::max(1u, std::thread::hardware_concurrency());
    if (options.splitThreshold < 1)
        options.splitThreshold = 1;
    if (options.dequeCapacity < 2)
        options.dequeCapacity = 2;
    if (config.name.empty())
        config.name = "forkjoin";
    return config;
}

// Runs a plain Task handed to execute() as a fork/join entry.
class PlainTaskEntry final : public ForkJoinTask<void> {
public:
    PlainTaskEntry(std::shared_ptr<Task> task, std::function<void(Error const&)> onFailure)
        : task_(std::move(task)), onFailure_(std::move(onFailure)) {}

    auto plainTask() const -> std::shared_ptr<Task> override { return this->task_; }

protected:
    auto compute() -> void override {
        if (auto failure = this->task_->run())
            this->onFailure_(*failure);
    }

private:
    std::shared_ptr<Task>              task_;
    std::function<void(Error const&)> onFailure_;
};

} // namespace

auto ForkJoinPool::Create(PoolConfig config) -> Expected<std::unique_ptr<ForkJoinPool>> {
    if (auto error = config.validate())
        return std::unexpected(std::move(*error));
    return std::make_unique<ForkJoinPool>(std::move(config));
}

// Never destroyed: fork() may be called from static destructors of other objects.
auto ForkJoinPool::Instance() -> ForkJoinPool& {
    static ForkJoinPool* instance = [] {
        PoolConfig config;
        config.name = "forkjoin-common";
        return new ForkJoinPool(std::move(config));
    }();
    return *instance;
}

auto ForkJoinPool::current() -> ForkJoinPool* {
    return currentPool;
}

ForkJoinPool::ForkJoinPool(PoolConfig config) : config_(normalise(std::move(config))) {
    this->factory_ = this->config_.workerFactory ? this->config_.workerFactory
                                                 : std::make_shared<DefaultWorkerFactory>(this->config_.workerPriority);
    auto const parallelism = this->config_.forkJoin.parallelism;
    wp_log("ForkJoinPool::ForkJoinPool '" + this->config_.name + "' parallelism=" + std::to_string(parallelism)
                   + " deque=" + std::to_string(this->config_.forkJoin.dequeCapacity),
           "ForkJoin");

    // All workers exist before any thread starts; thieves index workers_ without a lock.
    this->workers_.reserve(parallelism);
    for (std::size_t i = 0; i < parallelism; ++i)
        this->workers_.push_back(std::make_unique<Worker>(i, this->factory_->workerName(this->config_.name, i),
                                                          this->config_.forkJoin.dequeCapacity));

    this->liveWorkers_.store(parallelism, std::memory_order_release);
    for (auto& worker : this->workers_) {
        auto* raw = worker.get();
        try {
            raw->thread = std::jthread([this, raw] { this->runWorker(raw); });
        } catch (std::system_error const& e) {
            wp_log("ForkJoinPool failed to start " + raw->name + ": " + std::string(e.what()), "ForkJoin", "Error");
            this->workerExited();
            continue;
        }
        this->emit(PoolEvent{PoolEvent::Kind::WorkerCreated, this->config_.name, raw->name, {}});
    }
}

ForkJoinPool::~ForkJoinPool() {
    wp_log("ForkJoinPool::~ForkJoinPool '" + this->config_.name + "'", "ForkJoin");
    this->shutdown();
    this->lifecycle_.waitTerminated();
    for (auto& worker : this->workers_) {
        if (worker->thread.joinable())
            worker->thread.join();
    }
}

auto ForkJoinPool::fork(ForkJoinTaskBase* task) -> void {
    task->attach(this);
    if (this->lifecycle_.get() >= PoolState::Stopping) {
        auto keep = std::move(task->inFlight_);
        task->cancel();
        return;
    }
    this->outstanding_.fetch_add(1, std::memory_order_seq_cst);
    this->enqueue(task);
}

auto ForkJoinPool::submitTask(std::shared_ptr<ForkJoinTaskBase> task) -> std::optional<Error> {
    if (!task)
        return Error{Error::Code::InvalidError, "null fork/join task"};
    // Counted before the state check so a worker never exits between the check and the push.
    this->outstanding_.fetch_add(1, std::memory_order_seq_cst);
    if (this->lifecycle_.isShutdown()) {
        this->outstanding_.fetch_sub(1, std::memory_order_seq_cst);
        this->signalWork(true);
        return Error{Error::Code::IllegalState, "fork/join pool '" + this->config_.name + "' is shut down"};
    }
    task->parent_ = nullptr;
    task->attach(this);
    this->enqueue(task.get());

    // shutdownNow() may have drained the queues between the check and the push.
    if (this->lifecycle_.get() >= PoolState::Stopping) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(this->submissionMutex_);
            auto it = std::find(this->submissions_.begin(), this->submissions_.end(), task.get());
            if (it != this->submissions_.end()) {
                this->submissions_.erase(it);
                removed = true;
            }
        }
        if (removed) {
            auto keep = std::move(task->inFlight_);
            task->cancel();
            this->outstanding_.fetch_sub(1, std::memory_order_seq_cst);
            return Error{Error::Code::IllegalState, "fork/join pool '" + this->config_.name + "' is stopping"};
        }
    }
    return std::nullopt;
}

auto ForkJoinPool::enqueue(ForkJoinTaskBase* task) -> void {
    auto* worker = tlsWorker_;
    if (worker == nullptr || currentPool != this || !worker->deque.push(task)) {
        std::lock_guard<std::mutex> lock(this->submissionMutex_);
        this->submissions_.push_back(task);
    }
    this->signalWork();
}

auto ForkJoinPool::execute(std::shared_ptr<Task> task) -> std::optional<Error> {
    if (!task)
        return Error{Error::Code::InvalidError, "null task"};
    auto entry = std::make_shared<PlainTaskEntry>(task, [this, id = task->id()](Error const& failure) {
        wp_log("ForkJoinPool task id=" + std::to_string(id) + " failed: " + describeError(failure), "ForkJoin", "Error");
        auto const* worker = tlsWorker_;
        this->emit(PoolEvent{PoolEvent::Kind::TaskFailed, this->config_.name, worker ? worker->name : std::string{},
                             describeError(failure)});
    });
    return this->submitTask(std::move(entry));
}

auto ForkJoinPool::signalWork(bool all) -> void {
    this->signals_.fetch_add(1, std::memory_order_seq_cst);
    if (this->idle_.load(std::memory_order_seq_cst) == 0)
        return;
    std::lock_guard<std::mutex> lock(this->parkMutex_);
    if (all)
        this->parkCv_.notify_all();
    else
        this->parkCv_.notify_one();
}

auto ForkJoinPool::signalCompletion() -> void {
    if (this->joinWaiters_.load(std::memory_order_seq_cst) == 0)
        return;
    std::lock_guard<std::mutex> lock(this->joinMutex_);
    this->joinCv_.notify_all();
}

auto ForkJoinPool::runWorker(Worker* worker) -> void {
    tlsWorker_  = worker;
    currentPool = this;
    try {
        this->factory_->onWorkerStart(WorkerInfo{this->config_.name, worker->name, worker->index});
    } catch (std::exception const& e) {
        wp_log("ForkJoinPool::runWorker worker factory failed: " + std::string(e.what()), "Worker", "Error");
    }

    for (;;) {
        if (this->lifecycle_.get() >= PoolState::Stopping)
            break;
        if (auto* task = this->findWork(worker)) {
            this->runEntry(worker, task);
            continue;
        }
        if (this->exitRequested())
            break;
        this->park();
    }

    tlsWorker_  = nullptr;
    currentPool = nullptr;
    wp_log("ForkJoinPool::runWorker " + worker->name + " exiting", "Worker");
    this->emit(PoolEvent{PoolEvent::Kind::WorkerRetired, this->config_.name, worker->name, {}});
    this->workerExited();
}

auto ForkJoinPool::findWork(Worker* worker) -> ForkJoinTaskBase* {
    if (auto* task = worker->deque.pop())
        return task;
    if (auto* task = this->pollSubmission())
        return task;
    return this->trySteal(worker);
}

auto ForkJoinPool::pollSubmission() -> ForkJoinTaskBase* {
    std::lock_guard<std::mutex> lock(this->submissionMutex_);
    if (this->submissions_.empty())
        return nullptr;
    auto* task = this->submissions_.front();
    this->submissions_.pop_front();
    return task;
}

auto ForkJoinPool::trySteal(Worker* thief) -> ForkJoinTaskBase* {
    auto const count = this->workers_.size();
    if (count < 2)
        return nullptr;
    auto const start = static_cast<std::size_t>(thief->rng()) % count;
    for (std::size_t i = 0; i < count; ++i) {
        auto& victim = this->workers_[(start + i) % count];
        if (victim.get() == thief)
            continue;
        if (auto* task = victim->deque.steal()) {
            thief->stolen.fetch_add(1, std::memory_order_relaxed);
            return task;
        }
    }
    return nullptr;
}

// The entry may be destroyed by its joiner as soon as exec() returns; it is not touched afterwards.
auto ForkJoinPool::runEntry(Worker* worker, ForkJoinTaskBase* task) -> void {
    auto keep = std::move(task->inFlight_);
    task->exec();
    worker->executed.fetch_add(1, std::memory_order_relaxed);
    keep.reset();
    if (this->outstanding_.fetch_sub(1, std::memory_order_seq_cst) == 1 && this->lifecycle_.isShutdown())
        this->signalWork(true);
}

auto ForkJoinPool::hasVisibleWork() const -> bool {
    for (auto const& worker : this->workers_) {
        if (!worker->deque.empty())
            return true;
    }
    std::lock_guard<std::mutex> lock(this->submissionMutex_);
    return !this->submissions_.empty();
}

auto ForkJoinPool::exitRequested() const -> bool {
    auto const state = this->lifecycle_.get();
    if (state >= PoolState::Stopping)
        return true;
    return state == PoolState::ShuttingDown && this->outstanding_.load(std::memory_order_seq_cst) == 0;
}

auto ForkJoinPool::park() -> void {
    auto const seen = this->signals_.load(std::memory_order_seq_cst);
    this->idle_.fetch_add(1, std::memory_order_seq_cst);
    if (!this->hasVisibleWork() && !this->exitRequested()) {
        std::unique_lock<std::mutex> lock(this->parkMutex_);
        this->parkCv_.wait(lock, [&] { return this->signals_.load(std::memory_order_seq_cst) != seen; });
    }
    this->idle_.fetch_sub(1, std::memory_order_seq_cst);
}

auto ForkJoinPool::helpJoin(ForkJoinTaskBase& task) -> void {
    auto* worker = tlsWorker_;
    while (!task.isDone()) {
        ForkJoinTaskBase* next = worker->deque.pop();
        if (next == nullptr)
            next = this->trySteal(worker);
        if (next == nullptr)
            next = this->pollSubmission();
        if (next != nullptr) {
            this->runEntry(worker, next);
            continue;
        }
        // The joined task is running on another worker.
        this->joinWaiters_.fetch_add(1, std::memory_order_seq_cst);
        {
            std::unique_lock<std::mutex> lock(this->joinMutex_);
            this->joinCv_.wait_for(lock, std::chrono::milliseconds{1}, [&] { return task.isDone(); });
        }
        this->joinWaiters_.fetch_sub(1, std::memory_order_seq_cst);
    }
}

auto ForkJoinPool::awaitExternal(ForkJoinTaskBase& task) -> void {
    this->joinWaiters_.fetch_add(1, std::memory_order_seq_cst);
    {
        std::unique_lock<std::mutex> lock(this->joinMutex_);
        while (!task.isDone())
            this->joinCv_.wait_for(lock, std::chrono::milliseconds{5});
    }
    this->joinWaiters_.fetch_sub(1, std::memory_order_seq_cst);
}

auto ForkJoinPool::workerExited() -> void {
    if (this->liveWorkers_.fetch_sub(1, std::memory_order_acq_rel) != 1)
        return;
    if (this->lifecycle_.markTerminated()) {
        wp_log("ForkJoinPool '" + this->config_.name + "' terminated", "ForkJoin");
        this->emitStateChanged(PoolState::Terminated);
    }
}

auto ForkJoinPool::shutdown() -> void {
    if (this->lifecycle_.advanceTo(PoolState::ShuttingDown)) {
        wp_log("ForkJoinPool::shutdown '" + this->config_.name + "'", "ForkJoin");
        this->emitStateChanged(PoolState::ShuttingDown);
    }
    this->signalWork(true);
    if (this->liveWorkers_.load(std::memory_order_acquire) == 0 && this->lifecycle_.markTerminated())
        this->emitStateChanged(PoolState::Terminated);
}

auto ForkJoinPool::shutdownNow() -> std::vector<std::shared_ptr<Task>> {
    if (this->lifecycle_.advanceTo(PoolState::Stopping)) {
        wp_log("ForkJoinPool::shutdownNow '" + this->config_.name + "'", "ForkJoin");
        this->emitStateChanged(PoolState::Stopping);
    }

    std::vector<ForkJoinTaskBase*> drained;
    {
        std::lock_guard<std::mutex> lock(this->submissionMutex_);
        drained.assign(this->submissions_.begin(), this->submissions_.end());
        this->submissions_.clear();
    }
    for (auto& worker : this->workers_) {
        while (!worker->deque.empty()) {
            if (auto* task = worker->deque.steal())
                drained.push_back(task);
        }
    }

    std::vector<std::shared_ptr<Task>> pending;
    for (auto* task : drained) {
        auto keep = std::move(task->inFlight_);
        if (auto plain = task->plainTask(); plain && plain->isPending())
            pending.push_back(std::move(plain));
        task->cancel();
        this->outstanding_.fetch_sub(1, std::memory_order_seq_cst);
    }
    wp_log("ForkJoinPool::shutdownNow cancelled " + std::to_string(drained.size()) + " entries", "ForkJoin");

    this->signalWork(true);
    if (this->liveWorkers_.load(std::memory_order_acquire) == 0 && this->lifecycle_.markTerminated())
        this->emitStateChanged(PoolState::Terminated);
    return pending;
}

auto ForkJoinPool::awaitTermination(Clock::duration timeout) -> bool {
    return this->lifecycle_.waitTerminatedFor(timeout);
}

auto ForkJoinPool::state() const -> PoolState {
    return this->lifecycle_.get();
}

auto ForkJoinPool::size() const -> size_t {
    return this->liveWorkers_.load(std::memory_order_acquire);
}

auto ForkJoinPool::stats() const -> ForkJoinStats {
    ForkJoinStats stats;
    stats.parallelism = this->workers_.size();
    {
        std::lock_guard<std::mutex> lock(this->submissionMutex_);
        stats.queuedSubmissions = this->submissions_.size();
    }
    for (auto const& worker : this->workers_) {
        ForkJoinWorkerStats entry;
        entry.name     = worker->name;
        entry.executed = worker->executed.load(std::memory_order_relaxed);
        entry.stolen   = worker->stolen.load(std::memory_order_relaxed);
        stats.executed += entry.executed;
        stats.stolen += entry.stolen;
        stats.workers.push_back(std::move(entry));
    }
    return stats;
}

auto ForkJoinPool::describeFailure() -> Error {
    try {
        throw;
    } catch (ErrorException const& e) {
        return e.error();
    } catch (std::exception const& e) {
        return Error{Error::Code::TaskFailed, e.what()};
    } catch (...) {
        return Error{Error::Code::TaskFailed, "unknown exception"};
    }
}

auto ForkJoinPool::emit(PoolEvent event) -> void {
    if (!this->config_.eventSink)
        return;
    try {
        this->config_.eventSink->onEvent(event);
    } catch (std::exception const& e) {
        wp_log("ForkJoinPool event sink threw: " + std::string(e.what()), "ForkJoin", "Error");
    }
}

auto ForkJoinPool::emitStateChanged(PoolState state) -> void {
    PoolEvent event{PoolEvent::Kind::StateChanged, this->config_.name, {}, std::string(poolStateToString(state))};
    event.state = state;
    this->emit(std::move(event));
}

} // namespace WP
