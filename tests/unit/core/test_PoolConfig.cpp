#include "core/PoolConfig.hpp"
#include "core/PoolConfigJson.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace WP;
using namespace std::chrono_literals;

TEST_SUITE("core.config") {
TEST_CASE("PoolConfig validation") {
    SUBCASE("Defaults are valid") {
        PoolConfig config;
        CHECK_FALSE(config.validate().has_value());
    }
    SUBCASE("Core above max") {
        PoolConfig config;
        config.coreWorkers = 5;
        config.maxWorkers  = 2;
        auto error         = config.validate();
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidConfig);
    }
    SUBCASE("Zero max workers") {
        PoolConfig config;
        config.coreWorkers = 0;
        config.maxWorkers  = 0;
        CHECK(config.validate().has_value());
    }
    SUBCASE("Bounded queue without capacity") {
        PoolConfig config;
        config.queue = QueueCapacity::Bounded(0);
        CHECK(config.validate().has_value());
    }
    SUBCASE("Handoff timeout outside handoff mode") {
        PoolConfig config;
        config.handoffTimeout = 10ms;
        CHECK(config.validate().has_value());
        config.queue = QueueCapacity::Handoff();
        CHECK_FALSE(config.validate().has_value());
    }
    SUBCASE("Core timeout needs keep-alive") {
        PoolConfig config;
        config.allowCoreTimeout = true;
        config.keepAlive        = 0ms;
        CHECK(config.validate().has_value());
    }
    SUBCASE("Fork/join limits") {
        PoolConfig config;
        config.forkJoin.splitThreshold = 0;
        CHECK(config.validate().has_value());
        config.forkJoin.splitThreshold = 1;
        config.forkJoin.dequeCapacity  = 1;
        CHECK(config.validate().has_value());
    }
}

TEST_CASE("Enum string conversions") {
    for (auto kind : {RejectionKind::Abort, RejectionKind::Discard, RejectionKind::DiscardOldest, RejectionKind::CallerRuns}) {
        auto parsed = rejectionKindFromString(rejectionKindToString(kind));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == kind);
    }
    CHECK_FALSE(rejectionKindFromString("drop_everything").has_value());
    CHECK(queueModeFromString("bounded").value() == QueueCapacity::Mode::Bounded);
    CHECK(queueModeFromString("ring").error().code == Error::Code::MalformedInput);
    CHECK(missedRunPolicyFromString("skip").value() == MissedRunPolicy::Skip);
    CHECK(missedRunPolicyToString(MissedRunPolicy::CatchUp) == "catch_up");
}

TEST_CASE("parsePoolConfig reads every section") {
    auto text = R"({
        "name": "ingest",
        "core_workers": 2,
        "max_workers": 6,
        "keep_alive_ms": 1500,
        "queue": { "mode": "bounded", "capacity": 32 },
        "rejection": "caller_runs",
        "worker_priority": 5,
        "schedule": { "missed_runs": "skip", "drift_threshold_ms": 20, "continue_periodic_after_shutdown": true },
        "fork_join": { "parallelism": 3, "split_threshold": 64, "deque_capacity": 128 },
        "unknown_key": "ignored"
    })";
    auto config = parsePoolConfig(text);
    REQUIRE(config.has_value());
    CHECK(config->name == "ingest");
    CHECK(config->coreWorkers == 2);
    CHECK(config->maxWorkers == 6);
    CHECK(config->keepAlive == 1500ms);
    CHECK(config->queue.mode == QueueCapacity::Mode::Bounded);
    CHECK(config->queue.capacity == 32);
    CHECK(config->rejection == RejectionKind::CallerRuns);
    CHECK(config->workerPriority == std::optional<int>{5});
    CHECK(config->schedule.missedRuns == MissedRunPolicy::Skip);
    CHECK(config->schedule.driftThreshold == 20ms);
    CHECK(config->schedule.runDelayedAfterShutdown);
    CHECK(config->schedule.continuePeriodicAfterShutdown);
    CHECK(config->forkJoin.parallelism == 3);
    CHECK(config->forkJoin.splitThreshold == 64);
    CHECK(config->forkJoin.dequeCapacity == 128);
}

TEST_CASE("parsePoolConfig failures") {
    CHECK(parsePoolConfig("{not json").error().code == Error::Code::MalformedInput);
    CHECK(parsePoolConfig("[1, 2]").error().code == Error::Code::MalformedInput);
    CHECK(parsePoolConfig(R"({"core_workers": -1})").error().code == Error::Code::MalformedInput);
    CHECK(parsePoolConfig(R"({"queue": {"mode": "ring"}})").error().code == Error::Code::MalformedInput);
    CHECK(parsePoolConfig(R"({"allow_core_timeout": "yes"})").error().code == Error::Code::MalformedInput);
    // Well-formed but inconsistent.
    CHECK(parsePoolConfig(R"({"core_workers": 8, "max_workers": 2})").error().code == Error::Code::InvalidConfig);
}

TEST_CASE("poolConfigToJson output parses back") {
    PoolConfig config;
    config.name           = "roundtrip";
    config.coreWorkers    = 3;
    config.maxWorkers     = 3;
    config.queue          = QueueCapacity::Handoff();
    config.handoffTimeout = 250ms;
    config.rejection      = RejectionKind::DiscardOldest;

    auto document = nlohmann::json::parse(poolConfigToJson(config));
    CHECK(document["queue"]["mode"] == "handoff");
    CHECK(document["handoff_timeout_ms"] == 250);
    CHECK(document["rejection"] == "discard_oldest");
    CHECK_FALSE(document.contains("worker_priority"));

    auto parsed = parsePoolConfig(poolConfigToJson(config));
    REQUIRE(parsed.has_value());
    CHECK(parsed->handoffTimeout == std::optional<std::chrono::milliseconds>{250ms});
    CHECK(parsed->rejection == RejectionKind::DiscardOldest);
}

TEST_CASE("loadPoolConfig reads files and reports missing ones") {
    auto path = std::filesystem::temp_directory_path() / "workpool_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"name": "from-file", "max_workers": 2, "core_workers": 1})";
    }
    auto config = loadPoolConfig(path);
    REQUIRE(config.has_value());
    CHECK(config->name == "from-file");
    std::filesystem::remove(path);

    auto missing = loadPoolConfig(path);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::InvalidConfig);
}
}
