#pragma once
#include <chrono>
#include <map>
#include <optional>

#include "../core/types/constants.hpp"
#include "snapshot.hpp"

namespace Trawl {
namespace Autoscaling {

class Snapshotter;

struct SystemStatusOptions {
    double current_history_secs            = Core::Constants::DEFAULT_CURRENT_HISTORY_SECS;
    double max_memory_overloaded_ratio     = Core::Constants::DEFAULT_MAX_MEMORY_OVERLOADED_RATIO;
    double max_event_loop_overloaded_ratio = Core::Constants::DEFAULT_MAX_EVENT_LOOP_OVERLOADED_RATIO;
    double max_cpu_overloaded_ratio        = Core::Constants::DEFAULT_MAX_CPU_OVERLOADED_RATIO;
    double max_client_overloaded_ratio     = Core::Constants::DEFAULT_MAX_CLIENT_OVERLOADED_RATIO;
    // A window without snapshots counts as healthy unless this is set.
    bool empty_window_is_overloaded = false;
};

struct LoadInfo {
    bool   is_overloaded = false;
    double limit_ratio   = 0.0;
    double actual_ratio  = 0.0;
};

struct SystemInfo {
    bool                             is_healthy = true;
    std::map<ResourceKind, LoadInfo> loads;
};

// Turns snapshot history into overload verdicts over a short "current"
// window and the whole retained "historical" window.
class SystemStatus {
public:
    SystemStatus(const Snapshotter& snapshotter, SystemStatusOptions options = {});

    bool     is_overloaded(ResourceKind kind, std::optional<std::chrono::milliseconds> window) const;
    LoadInfo load_info(ResourceKind kind, std::optional<std::chrono::milliseconds> window) const;

    SystemInfo is_healthy(std::optional<std::chrono::milliseconds> window) const;
    SystemInfo current_status() const;
    SystemInfo historical_status() const;

    double limit_ratio(ResourceKind kind) const;

    const SystemStatusOptions& options() const {
        return options_;
    }

private:
    const Snapshotter&  snapshotter_;
    SystemStatusOptions options_;
};

}  // namespace Autoscaling
}  // namespace Trawl
