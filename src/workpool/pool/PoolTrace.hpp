#pragma once
#include "core/Error.hpp"

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WP {

/**
 * PoolTrace: Chrome trace recorder shared by a pool and its workers.
 *
 * Events are buffered in memory while tracing is enabled and written by
 * flush() either as one `{"traceEvents": [...]}` JSON document or as
 * newline-delimited JSON. When tracing is disabled every recording call
 * returns after a single atomic load.
 */
class PoolTrace {
public:
    struct Event {
        std::string   name;
        std::string   category;
        std::string   label;
        std::string   threadName;
        std::int64_t  startUs      = 0;
        std::int64_t  durUs        = 0;
        std::uint64_t threadId     = 0;
        std::uint64_t asyncId      = 0;
        std::int64_t  queueWaitUs  = 0;
        double        counterValue = 0.0;
        char          phase        = 'X';
        bool          hasQueueWait = false;
        bool          hasCounter   = false;
    };

    // RAII span: records a complete ('X') event covering its lifetime.
    class Scope {
    public:
        Scope() = default;
        Scope(PoolTrace* trace, std::string name, std::string category, std::string label, std::int64_t startUs);
        ~Scope();

        Scope(Scope const&)            = delete;
        Scope& operator=(Scope const&) = delete;
        Scope(Scope&& other) noexcept;
        Scope& operator=(Scope&& other) noexcept;

        [[nodiscard]] auto active() const -> bool { return this->trace != nullptr; }

    private:
        auto finish() -> void;

        PoolTrace*   trace = nullptr;
        std::string  name;
        std::string  category;
        std::string  label;
        std::int64_t startUs = 0;
    };

    PoolTrace() = default;

    PoolTrace(PoolTrace const&)            = delete;
    PoolTrace& operator=(PoolTrace const&) = delete;

    auto enable(std::string path) -> void;
    auto enableNdjson(std::string path) -> void;
    auto disable() -> void;
    [[nodiscard]] auto enabled() const -> bool;

    // Microseconds since enable(); 0 when disabled.
    [[nodiscard]] auto nowUs() const -> std::int64_t;

    // Records a thread-name metadata event once per thread.
    auto threadName(std::string const& name) -> void;
    auto recordThreadName(std::uint64_t threadId, std::string const& name) -> void;
    auto span(std::string name, std::string category, std::string label, std::int64_t startUs, std::int64_t durUs,
              std::uint64_t threadId = 0) -> void;
    auto recordSpan(std::string name, std::string label, std::string category, std::int64_t startUs,
                    std::int64_t durUs, std::uint64_t threadId, std::int64_t queueWaitUs) -> void;
    auto recordAsync(std::string name, std::string label, std::string category, std::int64_t timestampUs, char phase,
                     std::uint64_t asyncId) -> void;
    auto counter(std::string name, double value) -> void;
    auto scope(std::string name, std::string category, std::string label = {}) -> Scope;

    // Queue wait bookkeeping keyed by task id. The async begin/end pair is
    // recorded when the wait ends; a cancelled wait leaves no events.
    auto queueStart(std::uint64_t taskId) -> void;
    auto queueCancel(std::uint64_t taskId) -> void;
    // Returns the time the task spent queued, or nullopt if no start was recorded.
    auto queueEnd(std::uint64_t taskId, std::string const& label) -> std::optional<std::int64_t>;

    [[nodiscard]] auto flush() -> std::optional<Error>;

    [[nodiscard]] auto events() const -> std::vector<Event>;
    [[nodiscard]] auto eventCount() const -> std::size_t;

    static auto currentThreadId() -> std::uint64_t;

private:
    auto push(Event event) -> void;

    std::atomic<bool>         enabled_{false};
    std::atomic<std::int64_t> startMicros_{0};
    bool                      ndjson_ = false;
    std::string               path_;

    mutable std::mutex                                mutex_;
    std::vector<Event>                                events_;
    phmap::flat_hash_set<std::uint64_t>               namedThreads_;
    phmap::flat_hash_map<std::uint64_t, std::int64_t> queuedAt_;
};

} // namespace WP
