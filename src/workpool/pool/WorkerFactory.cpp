#include "pool/WorkerFactory.hpp"
#include "log/TaggedLogger.hpp"

#if defined(__linux__)
#include <pthread.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace WP {

DefaultWorkerFactory::DefaultWorkerFactory(std::optional<int> niceValue) : niceValue(niceValue) {}

auto DefaultWorkerFactory::workerName(std::string_view poolName, std::size_t index) -> std::string {
    std::string name{poolName};
    name.push_back('-');
    name.append(std::to_string(index));
    return name;
}

auto DefaultWorkerFactory::onWorkerStart([[maybe_unused]] WorkerInfo const& info) -> void {
#ifdef WP_LOG_DEBUG
    set_thread_name(info.name);
#endif
#if defined(__linux__)
    // The kernel limits thread names to 15 characters plus the terminator.
    std::string osName = info.name.substr(0, 15);
    pthread_setname_np(pthread_self(), osName.c_str());
    if (this->niceValue) {
        auto const tid = static_cast<id_t>(::syscall(SYS_gettid));
        if (::setpriority(PRIO_PROCESS, tid, *this->niceValue) != 0) {
            wp_log("DefaultWorkerFactory failed to apply nice value to " + info.name, "Worker");
        }
    }
#endif
}

} // namespace WP
