#ifdef WP_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace WP {

std::mutex TaggedLogger::coutMutex;

auto logLevelToString(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "DEBUG";
}

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger(std::size_t maxBacklog)
    : maxBacklog_(std::max<std::size_t>(maxBacklog, 1)),
      writer_([this](std::stop_token stopToken) { this->writerLoop(stopToken); }) {}

// The jthread member stops and joins the writer, which drains the backlog first.
TaggedLogger::~TaggedLogger() = default;

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->namesMutex_);
    this->threadNames_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return this->enabled_.load(std::memory_order_relaxed);
}

auto TaggedLogger::setMinimumLevel(LogLevel level) -> void {
    this->minimumLevel_.store(level, std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex_);
    this->enabledTags_ = std::move(tags);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex_);
    this->skipTags_ = std::move(tags);
}

auto TaggedLogger::droppedCount() const -> std::uint64_t {
    return this->dropped_.load(std::memory_order_relaxed);
}

auto TaggedLogger::addTag(Record& record, std::string tag) -> void {
    std::string lowered(tag.size(), '\0');
    std::transform(tag.begin(), tag.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "error" || lowered == "failure") {
        record.level = std::max(record.level, LogLevel::Error);
    } else if (lowered == "warning" || lowered == "warn") {
        record.level = std::max(record.level, LogLevel::Warning);
    } else if (lowered == "info" || lowered == "success") {
        record.level = std::max(record.level, LogLevel::Info);
    } else {
        record.tags.insert(std::move(tag));
    }
}

auto TaggedLogger::enqueue(Record record) -> void {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex_);
        if (this->backlog_.size() >= this->maxBacklog_) {
            this->dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        this->backlog_.push_back(std::move(record));
        ++this->accepted_;
    }
    this->queueCv_.notify_one();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex_);
    auto const target = this->accepted_;
    this->drainedCv_.wait(lock, [&] { return this->written_ >= target; });
}

auto TaggedLogger::writerLoop(std::stop_token stopToken) -> void {
    std::deque<Record> batch;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(this->queueMutex_);
            this->queueCv_.wait(lock, stopToken, [this] { return !this->backlog_.empty(); });
            if (this->backlog_.empty() && stopToken.stop_requested())
                return;
            batch.swap(this->backlog_);
        }

        auto const dropped = this->dropped_.load(std::memory_order_relaxed);
        if (dropped != this->droppedReported_) {
            std::lock_guard<std::mutex> lock(coutMutex);
            std::cerr << "[TaggedLogger] dropped " << (dropped - this->droppedReported_) << " records\n";
            this->droppedReported_ = dropped;
        }
        for (auto const& record : batch) {
            if (this->accepts(record))
                this->write(record);
        }

        {
            std::lock_guard<std::mutex> lock(this->queueMutex_);
            this->written_ += batch.size();
        }
        this->drainedCv_.notify_all();
        batch.clear();
    }
}

auto TaggedLogger::accepts(Record const& record) const -> bool {
    if (record.level < this->minimumLevel_.load(std::memory_order_relaxed))
        return false;
    std::lock_guard<std::mutex> lock(this->filterMutex_);
    for (auto const& tag : record.tags) {
        if (this->skipTags_.contains(tag))
            return false;
        if (!this->enabledTags_.empty() && !this->enabledTags_.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::shortPath(const char* filepath) -> std::string {
    std::filesystem::path path{filepath};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto TaggedLogger::write(Record const& record) const -> void {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    auto const seconds = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' '
         << std::setfill(' ') << std::left << std::setw(5) << logLevelToString(record.level) << ' ';
    for (auto const& tag : record.tags)
        line << '[' << tag << ']';
    line << " [" << record.threadName << "] [" << shortPath(record.location.file_name()) << ':'
         << record.location.line() << "] " << record.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadName() -> std::string {
    std::lock_guard<std::mutex> lock(this->namesMutex_);
    auto [it, inserted] = this->threadNames_.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThreadNumber_++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace WP
#endif // WP_LOG_DEBUG
