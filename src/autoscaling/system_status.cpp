#include "system_status.hpp"
#include <stdexcept>

#include "snapshotter.hpp"

namespace Trawl {
namespace Autoscaling {

namespace {
void check_ratio(double ratio, const char* name) {
    if (ratio < 0 || ratio > 1)
        throw std::invalid_argument(std::string("SystemStatus: ") + name + " must be in [0, 1]");
}
}  // namespace

SystemStatus::SystemStatus(const Snapshotter& snapshotter, SystemStatusOptions options)
    : snapshotter_(snapshotter), options_(options) {
    if (options_.current_history_secs <= 0)
        throw std::invalid_argument("SystemStatus: current_history_secs must be positive");
    check_ratio(options_.max_memory_overloaded_ratio, "max_memory_overloaded_ratio");
    check_ratio(options_.max_event_loop_overloaded_ratio, "max_event_loop_overloaded_ratio");
    check_ratio(options_.max_cpu_overloaded_ratio, "max_cpu_overloaded_ratio");
    check_ratio(options_.max_client_overloaded_ratio, "max_client_overloaded_ratio");
}

double SystemStatus::limit_ratio(ResourceKind kind) const {
    switch (kind) {
    case ResourceKind::Cpu:
        return options_.max_cpu_overloaded_ratio;
    case ResourceKind::Memory:
        return options_.max_memory_overloaded_ratio;
    case ResourceKind::SchedulerLatency:
        return options_.max_event_loop_overloaded_ratio;
    case ResourceKind::ClientErrors:
        return options_.max_client_overloaded_ratio;
    }
    return 0.0;
}

LoadInfo SystemStatus::load_info(ResourceKind kind, std::optional<std::chrono::milliseconds> window) const {
    const auto snapshots = snapshotter_.history(kind, window);

    LoadInfo info;
    info.limit_ratio = limit_ratio(kind);
    if (snapshots.empty()) {
        info.is_overloaded = options_.empty_window_is_overloaded;
        info.actual_ratio  = options_.empty_window_is_overloaded ? 1.0 : 0.0;
        return info;
    }

    std::size_t overloaded = 0;
    for (const auto& snapshot : snapshots) {
        if (snapshot.is_overloaded)
            ++overloaded;
    }
    info.actual_ratio  = static_cast<double>(overloaded) / static_cast<double>(snapshots.size());
    info.is_overloaded = info.actual_ratio > info.limit_ratio;
    return info;
}

bool SystemStatus::is_overloaded(ResourceKind kind, std::optional<std::chrono::milliseconds> window) const {
    return load_info(kind, window).is_overloaded;
}

SystemInfo SystemStatus::is_healthy(std::optional<std::chrono::milliseconds> window) const {
    SystemInfo info;
    for (auto kind : ALL_RESOURCE_KINDS) {
        auto load = load_info(kind, window);
        if (load.is_overloaded)
            info.is_healthy = false;
        info.loads[kind] = load;
    }
    return info;
}

SystemInfo SystemStatus::current_status() const {
    return is_healthy(Core::to_millis(options_.current_history_secs));
}

SystemInfo SystemStatus::historical_status() const {
    return is_healthy(std::nullopt);
}

}  // namespace Autoscaling
}  // namespace Trawl
