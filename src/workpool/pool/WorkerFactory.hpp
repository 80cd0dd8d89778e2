#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace WP {

struct WorkerInfo {
    std::string poolName;
    std::string name;
    std::size_t index = 0;
};

/**
 * Naming and per-thread setup for pool workers.
 *
 * workerName() runs on the thread that creates the worker; onWorkerStart()
 * runs first thing on the new worker thread, before it takes any task.
 */
struct WorkerFactory {
    virtual ~WorkerFactory() = default;

    virtual auto workerName(std::string_view poolName, std::size_t index) -> std::string = 0;
    virtual auto onWorkerStart(WorkerInfo const&) -> void {}
};

// Names workers "<pool>-<index>", sets the OS thread name and optionally a nice value.
class DefaultWorkerFactory final : public WorkerFactory {
public:
    explicit DefaultWorkerFactory(std::optional<int> niceValue = std::nullopt);

    auto workerName(std::string_view poolName, std::size_t index) -> std::string override;
    auto onWorkerStart(WorkerInfo const& info) -> void override;

private:
    std::optional<int> niceValue;
};

} // namespace WP
