#include "pool/PoolTrace.hpp"
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

using namespace WP;
using namespace std::chrono_literals;

namespace {

auto readFile(std::filesystem::path const& path) -> std::string {
    std::ifstream      in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TEST_SUITE("pool.trace") {
TEST_CASE("Disabled trace records nothing") {
    PoolTrace trace;
    CHECK_FALSE(trace.enabled());
    CHECK(trace.nowUs() == 0);
    trace.threadName("main");
    trace.span("work", "task", "", 0, 10);
    trace.counter("queued", 3);
    trace.queueStart(1);
    CHECK_FALSE(trace.queueEnd(1, "x").has_value());
    {
        auto scope = trace.scope("ignored", "test");
        CHECK_FALSE(scope.active());
    }
    CHECK(trace.eventCount() == 0);

    auto error = trace.flush();
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::IllegalState);
}

TEST_CASE("Thread names are recorded once per thread") {
    PoolTrace trace;
    trace.enable((std::filesystem::temp_directory_path() / "workpool_trace_names.json").string());
    trace.threadName("main");
    trace.threadName("main again");
    std::jthread other([&] { trace.threadName("other"); });
    other.join();

    auto events = trace.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].phase == 'M');
    CHECK(events[0].threadName == "main");
    CHECK(events[1].threadName == "other");
    CHECK(events[0].threadId != events[1].threadId);
}

TEST_CASE("Queue wait produces an async pair only when the wait ends") {
    PoolTrace trace;
    trace.enable((std::filesystem::temp_directory_path() / "workpool_trace_queue.json").string());
    trace.queueStart(7);
    trace.queueStart(8);
    trace.queueCancel(8);
    std::this_thread::sleep_for(2ms);
    auto waited = trace.queueEnd(7, "fetch");
    REQUIRE(waited.has_value());
    CHECK(*waited >= 1000);
    CHECK_FALSE(trace.queueEnd(8, "cancelled").has_value());

    auto events = trace.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].phase == 'b');
    CHECK(events[1].phase == 'e');
    CHECK(events[0].name == "Wait fetch");
    CHECK(events[0].asyncId == 7);
    CHECK(events[1].startUs - events[0].startUs == *waited);
}

TEST_CASE("Scope records a complete span") {
    PoolTrace trace;
    trace.enable((std::filesystem::temp_directory_path() / "workpool_trace_scope.json").string());
    std::this_thread::sleep_for(1ms);
    {
        auto scope = trace.scope("phase", "test", "outer");
        CHECK(scope.active());
        auto moved = std::move(scope);
        CHECK_FALSE(scope.active());
        std::this_thread::sleep_for(2ms);
    }
    auto events = trace.events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].phase == 'X');
    CHECK(events[0].name == "phase");
    CHECK(events[0].label == "outer");
    CHECK(events[0].durUs >= 1000);
}

TEST_CASE("flush writes a Chrome trace document") {
    auto      path = std::filesystem::temp_directory_path() / "workpool_trace_flush.json";
    PoolTrace trace;
    trace.enable(path.string());
    trace.threadName("main");
    trace.recordSpan("Task", "resize", "task", 10, 20, PoolTrace::currentThreadId(), 5);
    trace.counter("queued", 2);
    REQUIRE_FALSE(trace.flush().has_value());

    auto document = nlohmann::json::parse(readFile(path));
    CHECK(document["displayTimeUnit"] == "ms");
    auto const& list = document["traceEvents"];
    REQUIRE(list.size() == 3);
    CHECK(list[0]["ph"] == "M");
    CHECK(list[0]["name"] == "thread_name");
    CHECK(list[0]["args"]["name"] == "main");
    CHECK(list[1]["ph"] == "X");
    CHECK(list[1]["dur"] == 20);
    CHECK(list[1]["args"]["label"] == "resize");
    CHECK(list[1]["args"]["queue_wait_us"] == 5);
    CHECK(list[2]["ph"] == "C");
    CHECK(list[2]["args"]["queued"] == 2.0);
    std::filesystem::remove(path);
}

TEST_CASE("flush writes one JSON object per line in NDJSON mode") {
    auto      path = std::filesystem::temp_directory_path() / "workpool_trace_flush.ndjson";
    PoolTrace trace;
    trace.enableNdjson(path.string());
    trace.span("a", "test", "", 1, 1);
    trace.span("b", "test", "", 2, 1);
    REQUIRE_FALSE(trace.flush().has_value());

    std::ifstream in(path);
    std::string   line;
    int           lines = 0;
    while (std::getline(in, line)) {
        auto event = nlohmann::json::parse(line);
        CHECK(event["ph"] == "X");
        ++lines;
    }
    CHECK(lines == 2);
    std::filesystem::remove(path);
}
}
