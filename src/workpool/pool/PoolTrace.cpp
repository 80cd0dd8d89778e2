#include "pool/PoolTrace.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <functional>
#include <thread>

#if defined(__linux__)
#include <sys/syscall.h>
#include <unistd.h>
#endif

using Json = nlohmann::json;

namespace WP {

namespace {

auto steadyMicros() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

auto toJson(PoolTrace::Event const& event) -> Json {
    Json out{{"name", event.name}, {"ph", std::string(1, event.phase)}, {"pid", 1}, {"tid", event.threadId}};
    switch (event.phase) {
        case 'M':
            out["name"] = "thread_name";
            out["args"] = Json{{"name", event.threadName}};
            return out;
        case 'C':
            out["ts"]   = event.startUs;
            out["args"] = Json{{event.name, event.counterValue}};
            return out;
        case 'b':
        case 'e':
            out["cat"]  = event.category;
            out["ts"]   = event.startUs;
            out["id"]   = event.asyncId;
            out["args"] = Json{{"label", event.label}, {"category", event.category}};
            return out;
        default:
            break;
    }
    out["cat"]  = event.category;
    out["ts"]   = event.startUs;
    out["dur"]  = event.durUs;
    out["args"] = Json{{"label", event.label}, {"category", event.category}};
    if (event.hasQueueWait)
        out["args"]["queue_wait_us"] = event.queueWaitUs;
    return out;
}

} // namespace

PoolTrace::Scope::Scope(PoolTrace* trace, std::string name, std::string category, std::string label, std::int64_t startUs)
    : trace(trace), name(std::move(name)), category(std::move(category)), label(std::move(label)), startUs(startUs) {}

PoolTrace::Scope::~Scope() {
    this->finish();
}

PoolTrace::Scope::Scope(Scope&& other) noexcept
    : trace(other.trace), name(std::move(other.name)), category(std::move(other.category)), label(std::move(other.label)),
      startUs(other.startUs) {
    other.trace = nullptr;
}

PoolTrace::Scope& PoolTrace::Scope::operator=(Scope&& other) noexcept {
    if (this == &other)
        return *this;
    this->finish();
    this->trace    = other.trace;
    this->name     = std::move(other.name);
    this->category = std::move(other.category);
    this->label    = std::move(other.label);
    this->startUs  = other.startUs;
    other.trace    = nullptr;
    return *this;
}

auto PoolTrace::Scope::finish() -> void {
    if (!this->trace)
        return;
    auto endUs = this->trace->nowUs();
    if (endUs >= this->startUs && endUs != 0)
        this->trace->span(std::move(this->name), std::move(this->category), std::move(this->label), this->startUs,
                          endUs - this->startUs);
    this->trace = nullptr;
}

auto PoolTrace::enable(std::string path) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->path_   = std::move(path);
        this->ndjson_ = false;
    }
    this->startMicros_.store(steadyMicros(), std::memory_order_relaxed);
    this->enabled_.store(true, std::memory_order_release);
}

auto PoolTrace::enableNdjson(std::string path) -> void {
    this->enable(std::move(path));
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->ndjson_ = true;
}

auto PoolTrace::disable() -> void {
    this->enabled_.store(false, std::memory_order_release);
}

auto PoolTrace::enabled() const -> bool {
    return this->enabled_.load(std::memory_order_acquire);
}

auto PoolTrace::nowUs() const -> std::int64_t {
    if (!this->enabled())
        return 0;
    auto const elapsed = steadyMicros() - this->startMicros_.load(std::memory_order_relaxed);
    return elapsed > 0 ? elapsed : 0;
}

auto PoolTrace::currentThreadId() -> std::uint64_t {
#if defined(__linux__)
    return static_cast<std::uint64_t>(::syscall(SYS_gettid));
#else
    return static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

auto PoolTrace::push(Event event) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->events_.push_back(std::move(event));
}

auto PoolTrace::threadName(std::string const& name) -> void {
    if (!this->enabled())
        return;
    this->recordThreadName(currentThreadId(), name);
}

auto PoolTrace::recordThreadName(std::uint64_t threadId, std::string const& name) -> void {
    if (!this->enabled())
        return;
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (!this->namedThreads_.insert(threadId).second)
        return;
    Event event;
    event.phase      = 'M';
    event.threadId   = threadId;
    event.threadName = name;
    this->events_.push_back(std::move(event));
}

auto PoolTrace::span(std::string name, std::string category, std::string label, std::int64_t startUs,
                     std::int64_t durUs, std::uint64_t threadId) -> void {
    if (!this->enabled())
        return;
    Event event;
    event.name     = std::move(name);
    event.category = std::move(category);
    event.label    = std::move(label);
    event.startUs  = startUs;
    event.durUs    = durUs;
    event.threadId = threadId != 0 ? threadId : currentThreadId();
    this->push(std::move(event));
}

auto PoolTrace::recordSpan(std::string name, std::string label, std::string category, std::int64_t startUs,
                           std::int64_t durUs, std::uint64_t threadId, std::int64_t queueWaitUs) -> void {
    if (!this->enabled())
        return;
    Event event;
    event.name         = std::move(name);
    event.label        = std::move(label);
    event.category     = std::move(category);
    event.startUs      = startUs;
    event.durUs        = durUs;
    event.threadId     = threadId;
    event.hasQueueWait = true;
    event.queueWaitUs  = queueWaitUs;
    this->push(std::move(event));
}

auto PoolTrace::recordAsync(std::string name, std::string label, std::string category, std::int64_t timestampUs,
                            char phase, std::uint64_t asyncId) -> void {
    if (!this->enabled())
        return;
    Event event;
    event.name     = std::move(name);
    event.label    = std::move(label);
    event.category = std::move(category);
    event.startUs  = timestampUs;
    event.phase    = phase;
    event.asyncId  = asyncId;
    this->push(std::move(event));
}

auto PoolTrace::counter(std::string name, double value) -> void {
    if (!this->enabled())
        return;
    Event event;
    event.name         = std::move(name);
    event.phase        = 'C';
    event.startUs      = this->nowUs();
    event.threadId     = currentThreadId();
    event.hasCounter   = true;
    event.counterValue = value;
    this->push(std::move(event));
}

auto PoolTrace::scope(std::string name, std::string category, std::string label) -> Scope {
    if (!this->enabled())
        return Scope{};
    return Scope{this, std::move(name), std::move(category), std::move(label), this->nowUs()};
}

auto PoolTrace::queueStart(std::uint64_t taskId) -> void {
    if (!this->enabled())
        return;
    auto const now = this->nowUs();
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->queuedAt_[taskId] = now;
}

auto PoolTrace::queueCancel(std::uint64_t taskId) -> void {
    if (!this->enabled())
        return;
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->queuedAt_.erase(taskId);
}

auto PoolTrace::queueEnd(std::uint64_t taskId, std::string const& label) -> std::optional<std::int64_t> {
    if (!this->enabled())
        return std::nullopt;
    auto const   now = this->nowUs();
    std::int64_t queuedAt = 0;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        auto it = this->queuedAt_.find(taskId);
        if (it == this->queuedAt_.end())
            return std::nullopt;
        queuedAt = it->second;
        this->queuedAt_.erase(it);
    }
    auto const name = "Wait " + (label.empty() ? std::string("Task") : label);
    this->recordAsync(name, label, "queue", queuedAt, 'b', taskId);
    this->recordAsync(name, label, "queue", now, 'e', taskId);
    return now > queuedAt ? now - queuedAt : 0;
}

auto PoolTrace::flush() -> std::optional<Error> {
    std::vector<Event> snapshot;
    std::string        path;
    bool               ndjson = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        snapshot = this->events_;
        path     = this->path_;
        ndjson   = this->ndjson_;
    }
    if (path.empty())
        return Error{Error::Code::IllegalState, "tracing was never enabled"};

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return Error{Error::Code::UnknownError, "cannot open trace file " + path};

    if (ndjson) {
        for (auto const& event : snapshot)
            out << toJson(event).dump() << '\n';
    } else {
        Json document{{"traceEvents", Json::array()}};
        auto& list = document["traceEvents"];
        for (auto const& event : snapshot)
            list.push_back(toJson(event));
        document["displayTimeUnit"] = "ms";
        out << document.dump();
    }
    if (!out.good())
        return Error{Error::Code::UnknownError, "failed writing trace file " + path};
    wp_log("PoolTrace::flush wrote " + std::to_string(snapshot.size()) + " events to " + path, "Trace");
    return std::nullopt;
}

auto PoolTrace::events() const -> std::vector<Event> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->events_;
}

auto PoolTrace::eventCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->events_.size();
}

} // namespace WP
