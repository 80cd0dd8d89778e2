#ifdef WP_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace WP {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

[[nodiscard]] auto logLevelToString(LogLevel level) -> std::string_view;

/**
 * TaggedLogger: asynchronous stderr logger for pool internals.
 *
 * wp_log() records the message, its tags, the calling thread's name and the
 * source location, and hands the record to a writer thread. Tags named after a
 * severity ("Error", "Warning", "Info") set the record's level instead of
 * appearing in the tag list.
 *
 * Filtering happens on the writer thread: a record is dropped when its level
 * is below the minimum, when one of its tags is in the skip set, or when an
 * enabled set is configured and the record carries a tag outside it. Under
 * bursts the backlog is capped; records beyond the cap are counted and
 * reported once the writer catches up.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Debug;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    explicit TaggedLogger(std::size_t maxBacklog = 65536);
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto isLoggingEnabled() const -> bool;
    auto setMinimumLevel(LogLevel level) -> void;

    // Restrict output to records whose tags are all in this set; empty means no restriction.
    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;

    // Blocks until every record accepted so far has been written or filtered.
    auto flush() -> void;
    [[nodiscard]] auto droppedCount() const -> std::uint64_t;

    static std::mutex coutMutex;

private:
    auto enqueue(Record record) -> void;
    auto writerLoop(std::stop_token stopToken) -> void;
    auto accepts(Record const& record) const -> bool;
    auto write(Record const& record) const -> void;
    auto threadName() -> std::string;
    static auto addTag(Record& record, std::string tag) -> void;
    static auto shortPath(const char* filepath) -> std::string;

    std::size_t const maxBacklog_;

    mutable std::mutex          queueMutex_;
    std::condition_variable_any queueCv_;
    std::condition_variable     drainedCv_;
    std::deque<Record>          backlog_;
    std::uint64_t               accepted_ = 0;
    std::uint64_t               written_  = 0;

    std::atomic<bool>          enabled_{false};
    std::atomic<LogLevel>      minimumLevel_{LogLevel::Debug};
    std::atomic<std::uint64_t> dropped_{0};
    std::uint64_t              droppedReported_ = 0;

    mutable std::mutex    filterMutex_;
    std::set<std::string> skipTags_{"Task", "Queue", "Worker", "Steal"};
    std::set<std::string> enabledTags_;

    std::mutex                                       namesMutex_;
    std::unordered_map<std::thread::id, std::string> threadNames_;
    int                                              nextThreadNumber_ = 0;

    std::jthread writer_;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled_.load(std::memory_order_relaxed))
        return;

    Record record{.timestamp  = std::chrono::system_clock::now(),
                  .level      = LogLevel::Debug,
                  .tags       = {},
                  .message    = message,
                  .threadName = this->threadName(),
                  .location   = location};
    (addTag(record, std::string(std::forward<Tags>(tags))), ...);
    this->enqueue(std::move(record));
}

#define wp_log(message, ...) ::WP::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace WP

#else
#define wp_log(message, ...) ((void)0)
#endif // WP_LOG_DEBUG
