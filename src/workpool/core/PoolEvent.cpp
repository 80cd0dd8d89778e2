#include "PoolEvent.hpp"
#include "log/TaggedLogger.hpp"

namespace WP {

auto describeEvent(PoolEvent const& event) -> std::string {
    std::string text;
    text.append(poolEventKindToString(event.kind));
    text.append(" pool=");
    text.append(event.pool);
    if (!event.worker.empty()) {
        text.append(" worker=");
        text.append(event.worker);
    }
    switch (event.kind) {
        case PoolEvent::Kind::ScheduleDrift:
            text.append(" drift_us=");
            text.append(std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(event.drift).count()));
            break;
        case PoolEvent::Kind::StateChanged:
            text.append(" state=");
            text.append(poolStateToString(event.state));
            break;
        default:
            break;
    }
    if (!event.detail.empty()) {
        text.append(" detail=");
        text.append(event.detail);
    }
    return text;
}

void LoggingEventSink::onEvent([[maybe_unused]] PoolEvent const& event) {
    wp_log(describeEvent(event), "WorkPool", std::string(poolEventKindToString(event.kind)));
}

} // namespace WP
