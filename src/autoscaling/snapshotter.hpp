#pragma once
#include <array>
#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../core/async/interval.hpp"
#include "../core/types/constants.hpp"
#include "snapshot.hpp"
#include "system_probe.hpp"

namespace Trawl {
namespace Autoscaling {

using Core::Constants;

struct SnapshotterOptions {
    double event_loop_snapshot_interval_secs = Constants::DEFAULT_EVENT_LOOP_SNAPSHOT_INTERVAL_SECS;
    double client_snapshot_interval_secs     = Constants::DEFAULT_CLIENT_SNAPSHOT_INTERVAL_SECS;
    double system_info_interval_secs         = Constants::DEFAULT_SYSTEM_INFO_INTERVAL_SECS;
    double snapshot_history_secs             = Constants::DEFAULT_SNAPSHOT_HISTORY_SECS;
    int    max_blocked_millis                = Constants::DEFAULT_MAX_BLOCKED_MILLIS;
    double max_used_memory_ratio             = Constants::DEFAULT_MAX_USED_MEMORY_RATIO;
    double max_used_cpu_ratio                = Constants::DEFAULT_MAX_USED_CPU_RATIO;
    int    max_client_errors                 = Constants::DEFAULT_MAX_CLIENT_ERRORS;
    // Memory budget in megabytes. 0 derives it from the host total.
    std::uint64_t memory_mbytes          = 0;
    double        available_memory_ratio = Constants::DEFAULT_AVAILABLE_MEMORY_RATIO;
};

// Samples CPU, memory, scheduler latency and client errors on independent
// timers and keeps a bounded history per kind.
class Snapshotter {
public:
    Snapshotter(boost::asio::any_io_executor executor,
                SnapshotterOptions           options = {},
                std::shared_ptr<SystemProbe> probe   = nullptr);

    Snapshotter(const Snapshotter&)            = delete;
    Snapshotter& operator=(const Snapshotter&) = delete;

    void start();
    void stop();
    bool running() const {
        return running_;
    }

    void sample(ResourceKind kind);
    void snapshot_cpu();
    void snapshot_memory();
    void snapshot_event_loop();
    void snapshot_client();

    // Records an externally produced snapshot; pruning is relative to now.
    void add_snapshot(const ResourceSnapshot& snapshot);

    // Snapshots captured within `window` of now, or the whole retained
    // history when no window is given.
    std::vector<ResourceSnapshot> history(ResourceKind                             kind,
                                          std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    // Counts one rate limited or failed client operation.
    void report_client_error() {
        ++client_errors_;
    }
    std::uint64_t client_errors() const {
        return client_errors_;
    }

    const SnapshotterOptions& options() const {
        return options_;
    }

private:
    void record(ResourceKind kind, bool is_overloaded, double value);
    void warn_critical_memory(std::uint64_t used, std::uint64_t budget);

    boost::asio::any_io_executor executor_;
    SnapshotterOptions           options_;
    std::shared_ptr<SystemProbe> probe_;

    mutable std::mutex             mutex_;
    std::array<SnapshotHistory, 4> histories_;

    std::optional<TimePoint>   last_event_loop_sample_;
    std::optional<TimePoint>   last_critical_memory_warning_;
    std::atomic<std::uint64_t> client_errors_{0};
    std::uint64_t              client_errors_at_last_sample_ = 0;
    bool                       running_                      = false;

    Core::Interval system_info_interval_;
    Core::Interval event_loop_interval_;
    Core::Interval client_interval_;
};

}  // namespace Autoscaling
}  // namespace Trawl
