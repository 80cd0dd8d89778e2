#include "pool/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <system_error>

namespace WP {

namespace {

auto normalise(PoolConfig config) -> PoolConfig {
    if (config.maxWorkers == 0)
        config.maxWorkers = 1;
    if (config.coreWorkers > config.maxWorkers)
        config.coreWorkers = config.maxWorkers;
    if (config.keepAlive.count() < 0)
        config.keepAlive = std::chrono::milliseconds{0};
    if (config.queue.mode == QueueCapacity::Mode::Bounded && config.queue.capacity == 0)
        config.queue = QueueCapacity::Handoff();
    if (config.queue.mode != QueueCapacity::Mode::Handoff)
        config.handoffTimeout.reset();
    if (config.name.empty())
        config.name = "workpool";
    return config;
}

auto taskName(Task const& task) -> std::string {
    return task.label().empty() ? std::string("Task") : task.label();
}

} // namespace

auto TaskPool::Create(PoolConfig config) -> Expected<std::unique_ptr<TaskPool>> {
    if (auto error = config.validate())
        return std::unexpected(std::move(*error));
    return std::make_unique<TaskPool>(std::move(config));
}

TaskPool::TaskPool(PoolConfig config) : config_(normalise(std::move(config))), queue_(config_.queue) {
    this->policy_  = this->config_.rejectionPolicy ? this->config_.rejectionPolicy : makeRejectionPolicy(this->config_.rejection);
    this->factory_ = this->config_.workerFactory ? this->config_.workerFactory
                                                 : std::make_shared<DefaultWorkerFactory>(this->config_.workerPriority);
    wp_log("TaskPool::TaskPool '" + this->config_.name + "' core=" + std::to_string(this->config_.coreWorkers)
                   + " max=" + std::to_string(this->config_.maxWorkers) + " queue="
                   + std::string(queueModeToString(this->config_.queue.mode)) + " rejection=" + std::string(this->policy_->name()),
           "TaskPool");
}

TaskPool::~TaskPool() {
    wp_log("TaskPool::~TaskPool '" + this->config_.name + "'", "TaskPool");
    this->shutdown();
    // Entries still waiting for their trigger are cancelled rather than waited for.
    if (auto scheduler = this->currentScheduler())
        scheduler->stop();
    this->lifecycle_.waitTerminated();

    std::vector<std::unique_ptr<Worker>> remaining;
    {
        std::lock_guard<std::mutex> lock(this->workersMutex_);
        for (auto& [index, worker] : this->workers_)
            remaining.push_back(std::move(worker));
        this->workers_.clear();
        for (auto& worker : this->retired_)
            remaining.push_back(std::move(worker));
        this->retired_.clear();
    }
    for (auto& worker : remaining) {
        if (worker->thread.joinable() && worker->thread.get_id() != std::this_thread::get_id())
            worker->thread.join();
        else if (worker->thread.joinable())
            worker->thread.detach();
    }
    std::lock_guard<std::mutex> lock(this->schedulerMutex_);
    this->scheduler_.reset();
}

auto TaskPool::accepts(PoolState state, Admission admission) const -> bool {
    if (state == PoolState::Running)
        return true;
    return state == PoolState::ShuttingDown && admission == Admission::Internal;
}

auto TaskPool::shutdownError() const -> Error {
    return Error{Error::Code::IllegalState, "pool '" + this->config_.name + "' is shut down"};
}

auto TaskPool::execute(std::shared_ptr<Task> task) -> std::optional<Error> {
    if (!task)
        return Error{Error::Code::InvalidError, "null task"};
    this->reapRetired();
    switch (this->admit(task, Admission::External)) {
        case Outcome::Admitted:
            return std::nullopt;
        case Outcome::Closed:
            return this->shutdownError();
        case Outcome::Saturated:
            break;
    }

    this->rejectedTasks_.fetch_add(1, std::memory_order_relaxed);
    wp_log("TaskPool::execute saturated, applying " + std::string(this->policy_->name()) + " to task id="
                   + std::to_string(task->id()),
           "TaskPool");
    PoolEvent event{PoolEvent::Kind::TaskRejected, this->config_.name, {}, std::string(this->policy_->name()) + ":" + taskName(*task)};
    this->emit(std::move(event));
    return this->policy_->rejected(task, *this);
}

auto TaskPool::admit(std::shared_ptr<Task> const& task, Admission admission) -> Outcome {
    if (!this->accepts(this->lifecycle_.get(), admission))
        return Outcome::Closed;

    // 1. A worker is blocked waiting for work.
    this->trace_.queueStart(task->id());
    if (this->queue_.transferToWaiting(task))
        return Outcome::Admitted;

    // 2. Below the core count.
    if (this->workerCount_.load(std::memory_order_acquire) < this->config_.coreWorkers) {
        if (this->addWorker(task, true, admission)) {
            this->trace_.queueCancel(task->id());
            return Outcome::Admitted;
        }
        if (!this->accepts(this->lifecycle_.get(), admission)) {
            this->trace_.queueCancel(task->id());
            return Outcome::Closed;
        }
    }

    // 3. Room in the queue.
    bool const blocking = this->config_.handoffTimeout && admission == Admission::External;
    bool const queued   = blocking ? this->queue_.offerFor(task, *this->config_.handoffTimeout) : this->queue_.offer(task);
    if (queued) {
        if (!this->accepts(this->lifecycle_.get(), admission) && this->queue_.remove(task.get())) {
            this->trace_.queueCancel(task->id());
            return Outcome::Closed;
        }
        if (this->workerCount_.load(std::memory_order_acquire) == 0)
            this->addWorker(nullptr, false, admission);
        return Outcome::Admitted;
    }
    this->trace_.queueCancel(task->id());

    // 4. Below the maximum.
    if (this->addWorker(task, false, admission))
        return Outcome::Admitted;

    return this->accepts(this->lifecycle_.get(), admission) ? Outcome::Saturated : Outcome::Closed;
}

auto TaskPool::addWorker(std::shared_ptr<Task> const& firstTask, bool core, Admission admission) -> bool {
    std::size_t const bound = core ? this->config_.coreWorkers : this->config_.maxWorkers;
    std::size_t       count = this->workerCount_.load(std::memory_order_acquire);
    for (;;) {
        auto const state = this->lifecycle_.get();
        if (state >= PoolState::Stopping)
            return false;
        // While draining, workers are only added for scheduled firings or to finish queued work.
        if (state == PoolState::ShuttingDown && admission != Admission::Internal && (firstTask || this->queue_.empty()))
            return false;
        if (count >= bound)
            return false;
        if (this->workerCount_.compare_exchange_weak(count, count + 1, std::memory_order_acq_rel))
            break;
    }

    auto worker       = std::make_unique<Worker>();
    worker->index     = this->nextWorkerIndex_.fetch_add(1, std::memory_order_relaxed);
    worker->name      = this->factory_->workerName(this->config_.name, worker->index);
    worker->firstTask = firstTask;
    Worker* raw       = worker.get();

    bool started = false;
    {
        std::lock_guard<std::mutex> lock(this->workersMutex_);
        try {
            raw->thread = std::jthread([this, raw] { this->runWorker(raw); });
            started     = true;
            this->workers_.emplace(raw->index, std::move(worker));
        } catch (std::system_error const& e) {
            wp_log("TaskPool::addWorker failed to start thread: " + std::string(e.what()), "TaskPool", "Error");
        }
    }
    if (!started) {
        this->workerCount_.fetch_sub(1, std::memory_order_acq_rel);
        this->tryTerminate();
        return false;
    }

    auto const live = count + 1;
    auto       seen = this->largestWorkers_.load(std::memory_order_relaxed);
    while (seen < live && !this->largestWorkers_.compare_exchange_weak(seen, live, std::memory_order_relaxed)) {
    }
    wp_log("TaskPool::addWorker started " + raw->name + (core ? " (core)" : " (overflow)"), "Worker");
    this->emit(PoolEvent{PoolEvent::Kind::WorkerCreated, this->config_.name, raw->name, core ? "core" : "overflow"});
    return true;
}

auto TaskPool::prestartCoreWorkers() -> std::size_t {
    std::size_t started = 0;
    while (this->addWorker(nullptr, true, Admission::External))
        ++started;
    return started;
}

auto TaskPool::runWorker(Worker* worker) -> void {
    try {
        this->factory_->onWorkerStart(WorkerInfo{this->config_.name, worker->name, worker->index});
    } catch (std::exception const& e) {
        wp_log("TaskPool::runWorker worker factory failed: " + std::string(e.what()), "Worker", "Error");
    }
    this->trace_.threadName(worker->name);

    auto task = std::move(worker->firstTask);
    while (task || (task = this->getTask(worker))) {
        this->runTask(worker, task);
        task.reset();
    }
    this->processWorkerExit(worker);
}

auto TaskPool::getTask(Worker* worker) -> std::shared_ptr<Task> {
    bool timedOut = false;
    for (;;) {
        // Read the wake epoch before the state so a wakeAll() issued after the check is not missed.
        auto const epoch = this->queue_.epoch();
        auto const state = this->lifecycle_.get();
        if (state >= PoolState::Stopping || (state == PoolState::ShuttingDown && this->queue_.empty())) {
            this->workerCount_.fetch_sub(1, std::memory_order_acq_rel);
            return nullptr;
        }

        std::size_t count = this->workerCount_.load(std::memory_order_acquire);
        bool const  timed = this->config_.allowCoreTimeout || count > this->config_.coreWorkers;
        if ((count > this->config_.maxWorkers || (timed && timedOut)) && (count > 1 || this->queue_.empty())) {
            if (this->workerCount_.compare_exchange_strong(count, count - 1, std::memory_order_acq_rel)) {
                wp_log("TaskPool::getTask retiring idle " + worker->name, "Worker");
                return nullptr;
            }
            continue;
        }

        auto task = timed ? this->queue_.poll(this->config_.keepAlive, epoch) : this->queue_.take(epoch);
        if (task) {
            this->trace_.queueEnd(task->id(), task->label());
            return task;
        }
        // Woken through wakeAll() is not a timeout.
        timedOut = timed && this->queue_.epoch() == epoch;
    }
}

auto TaskPool::runTask(Worker* worker, std::shared_ptr<Task> const& task) -> void {
    {
        std::lock_guard<std::mutex> lock(worker->runMutex);
        worker->current = task;
    }
    // shutdownNow() may have run between the dequeue and the publish above.
    if (this->lifecycle_.get() >= PoolState::Stopping)
        task->cancel(Error{Error::Code::Cancelled, "pool '" + this->config_.name + "' stopped before the task started"});

    this->runAndRecord(task, worker->name);
    worker->completed.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(worker->runMutex);
    worker->current.reset();
}

auto TaskPool::runAndRecord(std::shared_ptr<Task> const& task, std::string const& workerName) -> void {
    if (!task->isPending())
        return;
    this->activeTasks_.fetch_add(1, std::memory_order_acq_rel);
    auto const startUs = this->trace_.nowUs();
    auto       failure = task->run();
    if (this->trace_.enabled()) {
        auto const endUs = this->trace_.nowUs();
        this->trace_.span(taskName(*task), "task", task->label(), startUs, endUs > startUs ? endUs - startUs : 0);
    }
    this->activeTasks_.fetch_sub(1, std::memory_order_acq_rel);
    this->completedTasks_.fetch_add(1, std::memory_order_relaxed);

    if (failure) {
        this->failedTasks_.fetch_add(1, std::memory_order_relaxed);
        wp_log("TaskPool task id=" + std::to_string(task->id()) + " failed: " + describeError(*failure), "TaskPool", "Error");
        this->emit(PoolEvent{PoolEvent::Kind::TaskFailed, this->config_.name, workerName, describeError(*failure)});
    }
}

auto TaskPool::processWorkerExit(Worker* worker) -> void {
    std::string const name = worker->name;
    {
        std::lock_guard<std::mutex> lock(this->workersMutex_);
        auto it = this->workers_.find(worker->index);
        if (it != this->workers_.end()) {
            this->retired_.push_back(std::move(it->second));
            this->workers_.erase(it);
        }
    }
    this->emit(PoolEvent{PoolEvent::Kind::WorkerRetired, this->config_.name, name, {}});

    this->tryTerminate();

    // Keep enough workers around for what is still queued.
    if (this->lifecycle_.get() >= PoolState::Stopping)
        return;
    std::size_t minimum = this->config_.allowCoreTimeout ? 0 : this->config_.coreWorkers;
    if (minimum == 0 && !this->queue_.empty())
        minimum = 1;
    if (this->workerCount_.load(std::memory_order_acquire) >= minimum)
        return;
    this->addWorker(nullptr, false, Admission::External);
}

auto TaskPool::tryTerminate() -> void {
    auto const state = this->lifecycle_.get();
    if (state == PoolState::Running || state == PoolState::Terminated)
        return;
    if (state == PoolState::ShuttingDown) {
        if (!this->queue_.empty())
            return;
        if (auto scheduler = this->currentScheduler(); scheduler && scheduler->pending() > 0)
            return;
    }
    if (this->workerCount_.load(std::memory_order_acquire) != 0) {
        // Idle workers re-check the state and exit.
        this->queue_.wakeAll();
        return;
    }
    if (this->lifecycle_.markTerminated()) {
        wp_log("TaskPool '" + this->config_.name + "' terminated", "TaskPool");
        this->emitStateChanged(PoolState::Terminated);
    }
}

auto TaskPool::reapRetired() -> void {
    std::vector<std::unique_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lock(this->workersMutex_);
        if (this->retired_.empty())
            return;
        finished.swap(this->retired_);
    }
    for (auto& worker : finished) {
        if (worker->thread.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(this->workersMutex_);
            this->retired_.push_back(std::move(worker));
            continue;
        }
        if (worker->thread.joinable())
            worker->thread.join();
    }
}

auto TaskPool::shutdown() -> void {
    if (this->lifecycle_.advanceTo(PoolState::ShuttingDown)) {
        wp_log("TaskPool::shutdown '" + this->config_.name + "'", "TaskPool");
        this->emitStateChanged(PoolState::ShuttingDown);
    }
    if (auto scheduler = this->currentScheduler())
        scheduler->shutdown();
    this->queue_.wakeAll();
    this->tryTerminate();
}

auto TaskPool::shutdownNow() -> std::vector<std::shared_ptr<Task>> {
    if (this->lifecycle_.advanceTo(PoolState::Stopping)) {
        wp_log("TaskPool::shutdownNow '" + this->config_.name + "'", "TaskPool");
        this->emitStateChanged(PoolState::Stopping);
    }
    this->queue_.close();
    auto unstarted = this->queue_.drain();
    for (auto const& task : unstarted)
        this->trace_.queueCancel(task->id());
    if (auto scheduler = this->currentScheduler()) {
        auto delayed = scheduler->shutdownNow();
        unstarted.insert(unstarted.end(), delayed.begin(), delayed.end());
    }

    {
        std::lock_guard<std::mutex> lock(this->workersMutex_);
        for (auto& [index, worker] : this->workers_) {
            std::lock_guard<std::mutex> runLock(worker->runMutex);
            if (worker->current)
                worker->current->token().requestStop();
        }
    }
    this->queue_.wakeAll();
    this->tryTerminate();
    return unstarted;
}

auto TaskPool::awaitTermination(Clock::duration timeout) -> bool {
    return this->lifecycle_.waitTerminatedFor(timeout);
}

auto TaskPool::state() const -> PoolState {
    return this->lifecycle_.get();
}

auto TaskPool::isShutdown() const -> bool {
    return this->state() != PoolState::Running;
}

auto TaskPool::size() const -> size_t {
    return this->workerCount_.load(std::memory_order_acquire);
}

auto TaskPool::stats() const -> PoolStats {
    PoolStats stats;
    stats.workers        = this->workerCount_.load(std::memory_order_acquire);
    stats.largestWorkers = this->largestWorkers_.load(std::memory_order_relaxed);
    stats.activeTasks    = this->activeTasks_.load(std::memory_order_acquire);
    stats.queuedTasks    = this->queue_.size();
    stats.completedTasks = this->completedTasks_.load(std::memory_order_relaxed);
    stats.failedTasks    = this->failedTasks_.load(std::memory_order_relaxed);
    stats.rejectedTasks  = this->rejectedTasks_.load(std::memory_order_relaxed);
    stats.state          = this->lifecycle_.get();
    if (auto scheduler = this->currentScheduler())
        stats.scheduled = scheduler->pending();
    return stats;
}

auto TaskPool::emit(PoolEvent event) -> void {
    if (!this->config_.eventSink)
        return;
    try {
        this->config_.eventSink->onEvent(event);
    } catch (std::exception const& e) {
        wp_log("TaskPool event sink threw: " + std::string(e.what()), "TaskPool", "Error");
    }
}

auto TaskPool::emitStateChanged(PoolState state) -> void {
    PoolEvent event{PoolEvent::Kind::StateChanged, this->config_.name, {}, std::string(poolStateToString(state))};
    event.state = state;
    this->emit(std::move(event));
}

auto TaskPool::ensureScheduler() -> Expected<std::shared_ptr<Scheduler>> {
    std::lock_guard<std::mutex> lock(this->schedulerMutex_);
    if (this->lifecycle_.isShutdown())
        return std::unexpected(this->shutdownError());
    if (!this->scheduler_)
        this->scheduler_ = Scheduler::Create(*this, this->config_.schedule);
    return this->scheduler_;
}

auto TaskPool::currentScheduler() const -> std::shared_ptr<Scheduler> {
    std::lock_guard<std::mutex> lock(this->schedulerMutex_);
    return this->scheduler_;
}

auto TaskPool::enableTrace(std::string path) -> void {
    this->trace_.enable(std::move(path));
}

auto TaskPool::enableTraceNdjson(std::string path) -> void {
    this->trace_.enableNdjson(std::move(path));
}

auto TaskPool::flushTrace() -> std::optional<Error> {
    return this->trace_.flush();
}

auto TaskPool::traceScope(std::string name, std::string category, std::string label) -> PoolTrace::Scope {
    return this->trace_.scope(std::move(name), std::move(category), std::move(label));
}

auto TaskPool::poolName() const -> std::string const& {
    return this->config_.name;
}

auto TaskPool::evictOldest() -> std::shared_ptr<Task> {
    auto task = this->queue_.evictOldest();
    if (task)
        this->trace_.queueCancel(task->id());
    return task;
}

auto TaskPool::retryAdmission(std::shared_ptr<Task> const& task) -> bool {
    return this->admit(task, Admission::External) == Outcome::Admitted;
}

auto TaskPool::runOnCaller(std::shared_ptr<Task> const& task) -> void {
    this->runAndRecord(task, {});
}

auto TaskPool::dispatchScheduled(std::shared_ptr<Task> const& task) -> std::optional<Error> {
    switch (this->admit(task, Admission::Internal)) {
        case Outcome::Admitted:
            return std::nullopt;
        case Outcome::Closed:
            return this->shutdownError();
        case Outcome::Saturated:
            break;
    }
    this->rejectedTasks_.fetch_add(1, std::memory_order_relaxed);
    return Error{Error::Code::Rejected, "pool '" + this->config_.name + "' has no capacity for a scheduled task"};
}

auto TaskPool::emitEvent(PoolEvent event) -> void {
    this->emit(std::move(event));
}

auto TaskPool::scheduleDrained() -> void {
    this->tryTerminate();
}

auto TaskPool::targetName() const -> std::string const& {
    return this->config_.name;
}

} // namespace WP
