#include "snapshot.hpp"
#include <algorithm>

namespace Trawl {
namespace Autoscaling {

std::string to_string(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Cpu:
        return "cpu";
    case ResourceKind::Memory:
        return "memory";
    case ResourceKind::SchedulerLatency:
        return "eventLoop";
    case ResourceKind::ClientErrors:
        return "client";
    }
    return "unknown";
}

SnapshotHistory::SnapshotHistory(std::chrono::milliseconds retention) : retention_(retention) {
}

void SnapshotHistory::add(ResourceSnapshot snapshot, TimePoint now) {
    if (!entries_.empty() && snapshot.captured_at < entries_.back().captured_at)
        snapshot.captured_at = entries_.back().captured_at;
    entries_.push_back(snapshot);

    const TimePoint cutoff = now - retention_;
    while (!entries_.empty() && entries_.front().captured_at < cutoff) {
        entries_.pop_front();
    }
}

std::vector<ResourceSnapshot> SnapshotHistory::since(TimePoint cutoff) const {
    auto first = std::lower_bound(entries_.begin(), entries_.end(), cutoff,
                                  [](const ResourceSnapshot& s, TimePoint t) { return s.captured_at < t; });
    return std::vector<ResourceSnapshot>(first, entries_.end());
}

std::vector<ResourceSnapshot> SnapshotHistory::all() const {
    return std::vector<ResourceSnapshot>(entries_.begin(), entries_.end());
}

}  // namespace Autoscaling
}  // namespace Trawl
