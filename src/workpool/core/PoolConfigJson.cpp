#include "core/PoolConfigJson.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace WP {

namespace {

auto malformed(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::MalformedInput, std::move(message)});
}

template <typename T>
auto readUnsigned(json const& object, char const* key, T& out) -> std::optional<Error> {
    if (!object.contains(key))
        return std::nullopt;
    auto const& value = object[key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<std::int64_t>() >= 0))
        return Error{Error::Code::MalformedInput, std::string(key) + " must be a non-negative integer"};
    out = static_cast<T>(value.get<std::uint64_t>());
    return std::nullopt;
}

auto readMillis(json const& object, char const* key, std::chrono::milliseconds& out) -> std::optional<Error> {
    if (!object.contains(key))
        return std::nullopt;
    auto const& value = object[key];
    if (!value.is_number_integer())
        return Error{Error::Code::MalformedInput, std::string(key) + " must be an integer number of milliseconds"};
    out = std::chrono::milliseconds{value.get<std::int64_t>()};
    return std::nullopt;
}

auto readBool(json const& object, char const* key, bool& out) -> std::optional<Error> {
    if (!object.contains(key))
        return std::nullopt;
    auto const& value = object[key];
    if (!value.is_boolean())
        return Error{Error::Code::MalformedInput, std::string(key) + " must be a boolean"};
    out = value.get<bool>();
    return std::nullopt;
}

auto readString(json const& object, char const* key) -> Expected<std::optional<std::string>> {
    if (!object.contains(key))
        return std::optional<std::string>{};
    auto const& value = object[key];
    if (!value.is_string())
        return malformed(std::string(key) + " must be a string");
    return std::optional<std::string>{value.get<std::string>()};
}

auto parseQueue(json const& object, PoolConfig& config) -> std::optional<Error> {
    if (!object.contains("queue"))
        return std::nullopt;
    auto const& queue = object["queue"];
    if (!queue.is_object())
        return Error{Error::Code::MalformedInput, "queue must be an object"};
    auto mode = readString(queue, "mode");
    if (!mode)
        return mode.error();
    if (*mode) {
        auto parsed = queueModeFromString(**mode);
        if (!parsed)
            return parsed.error();
        config.queue.mode = *parsed;
    }
    return readUnsigned(queue, "capacity", config.queue.capacity);
}

auto parseSchedule(json const& object, ScheduleOptions& schedule) -> std::optional<Error> {
    if (!object.contains("schedule"))
        return std::nullopt;
    auto const& section = object["schedule"];
    if (!section.is_object())
        return Error{Error::Code::MalformedInput, "schedule must be an object"};
    auto missed = readString(section, "missed_runs");
    if (!missed)
        return missed.error();
    if (*missed) {
        auto parsed = missedRunPolicyFromString(**missed);
        if (!parsed)
            return parsed.error();
        schedule.missedRuns = *parsed;
    }
    if (auto error = readMillis(section, "drift_threshold_ms", schedule.driftThreshold))
        return error;
    if (auto error = readBool(section, "run_delayed_after_shutdown", schedule.runDelayedAfterShutdown))
        return error;
    return readBool(section, "continue_periodic_after_shutdown", schedule.continuePeriodicAfterShutdown);
}

auto parseForkJoin(json const& object, ForkJoinOptions& forkJoin) -> std::optional<Error> {
    if (!object.contains("fork_join"))
        return std::nullopt;
    auto const& section = object["fork_join"];
    if (!section.is_object())
        return Error{Error::Code::MalformedInput, "fork_join must be an object"};
    if (auto error = readUnsigned(section, "parallelism", forkJoin.parallelism))
        return error;
    if (section.contains("split_threshold")) {
        if (!section["split_threshold"].is_number_integer())
            return Error{Error::Code::MalformedInput, "split_threshold must be an integer"};
        forkJoin.splitThreshold = section["split_threshold"].get<std::int64_t>();
    }
    return readUnsigned(section, "deque_capacity", forkJoin.dequeCapacity);
}

} // namespace

auto parsePoolConfig(std::string_view text) -> Expected<PoolConfig> {
    auto document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded())
        return malformed("pool configuration is not valid JSON");
    if (!document.is_object())
        return malformed("pool configuration must be a JSON object");

    PoolConfig config;
    auto       name = readString(document, "name");
    if (!name)
        return std::unexpected(name.error());
    if (*name)
        config.name = **name;

    if (auto error = readUnsigned(document, "core_workers", config.coreWorkers))
        return std::unexpected(*error);
    if (auto error = readUnsigned(document, "max_workers", config.maxWorkers))
        return std::unexpected(*error);
    if (auto error = readMillis(document, "keep_alive_ms", config.keepAlive))
        return std::unexpected(*error);
    if (auto error = readBool(document, "allow_core_timeout", config.allowCoreTimeout))
        return std::unexpected(*error);
    if (auto error = parseQueue(document, config))
        return std::unexpected(*error);

    if (document.contains("handoff_timeout_ms")) {
        std::chrono::milliseconds timeout{0};
        if (auto error = readMillis(document, "handoff_timeout_ms", timeout))
            return std::unexpected(*error);
        config.handoffTimeout = timeout;
    }

    auto rejection = readString(document, "rejection");
    if (!rejection)
        return std::unexpected(rejection.error());
    if (*rejection) {
        auto parsed = rejectionKindFromString(**rejection);
        if (!parsed)
            return std::unexpected(parsed.error());
        config.rejection = *parsed;
    }

    if (document.contains("worker_priority")) {
        if (!document["worker_priority"].is_number_integer())
            return malformed("worker_priority must be an integer nice value");
        config.workerPriority = document["worker_priority"].get<int>();
    }

    if (auto error = parseSchedule(document, config.schedule))
        return std::unexpected(*error);
    if (auto error = parseForkJoin(document, config.forkJoin))
        return std::unexpected(*error);

    if (auto error = config.validate())
        return std::unexpected(*error);
    wp_log("parsePoolConfig loaded pool '" + config.name + "'", "Config");
    return config;
}

auto loadPoolConfig(std::filesystem::path const& path) -> Expected<PoolConfig> {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open())
        return std::unexpected(Error{Error::Code::InvalidConfig, "cannot open pool configuration " + path.string()});
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto config = parsePoolConfig(buffer.str());
    if (!config) {
        auto error = config.error();
        error.message = path.string() + ": " + error.message.value_or("");
        return std::unexpected(std::move(error));
    }
    return config;
}

auto poolConfigToJson(PoolConfig const& config) -> std::string {
    json document{{"name", config.name},
                  {"core_workers", config.coreWorkers},
                  {"max_workers", config.maxWorkers},
                  {"keep_alive_ms", config.keepAlive.count()},
                  {"allow_core_timeout", config.allowCoreTimeout},
                  {"queue", {{"mode", std::string(queueModeToString(config.queue.mode))}, {"capacity", config.queue.capacity}}},
                  {"rejection", std::string(rejectionKindToString(config.rejection))},
                  {"schedule",
                   {{"missed_runs", std::string(missedRunPolicyToString(config.schedule.missedRuns))},
                    {"drift_threshold_ms", config.schedule.driftThreshold.count()},
                    {"run_delayed_after_shutdown", config.schedule.runDelayedAfterShutdown},
                    {"continue_periodic_after_shutdown", config.schedule.continuePeriodicAfterShutdown}}},
                  {"fork_join",
                   {{"parallelism", config.forkJoin.parallelism},
                    {"split_threshold", config.forkJoin.splitThreshold},
                    {"deque_capacity", config.forkJoin.dequeCapacity}}}};
    if (config.handoffTimeout)
        document["handoff_timeout_ms"] = config.handoffTimeout->count();
    if (config.workerPriority)
        document["worker_priority"] = *config.workerPriority;
    return document.dump(2);
}

} // namespace WP
