#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace Trawl {
namespace Autoscaling {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum class ResourceKind { Cpu = 0, Memory, SchedulerLatency, ClientErrors };

constexpr std::array<ResourceKind, 4> ALL_RESOURCE_KINDS = {
    ResourceKind::Cpu, ResourceKind::Memory, ResourceKind::SchedulerLatency, ResourceKind::ClientErrors};

std::string to_string(ResourceKind kind);

struct ResourceSnapshot {
    ResourceKind kind          = ResourceKind::Cpu;
    TimePoint    captured_at   = {};
    bool         is_overloaded = false;
    // Kind specific: used ratio for Cpu, bytes for Memory, delay in
    // milliseconds for SchedulerLatency, error delta for ClientErrors.
    double value = 0.0;
};

// Time ordered snapshots of one resource kind. Every insert drops the
// entries older than the retention window, so the size follows the
// sampling rate instead of growing with uptime.
class SnapshotHistory {
public:
    explicit SnapshotHistory(std::chrono::milliseconds retention);

    // A timestamp older than the newest entry is clamped to it.
    void add(ResourceSnapshot snapshot, TimePoint now);

    std::vector<ResourceSnapshot> since(TimePoint cutoff) const;
    std::vector<ResourceSnapshot> all() const;

    std::size_t size() const {
        return entries_.size();
    }
    bool empty() const {
        return entries_.empty();
    }
    std::chrono::milliseconds retention() const {
        return retention_;
    }

private:
    std::chrono::milliseconds    retention_;
    std::deque<ResourceSnapshot> entries_;
};

}  // namespace Autoscaling
}  // namespace Trawl
