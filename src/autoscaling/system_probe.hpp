#pragma once
#include <cstdint>
#include <mutex>
#include <optional>

namespace Trawl {
namespace Autoscaling {

// Source of raw host measurements. An empty optional means the reading
// failed; the Snapshotter turns that into an overloaded sample.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    // Busy share of all CPU time since the previous call, in [0, 1].
    virtual std::optional<double>        cpu_used_ratio()     = 0;
    virtual std::optional<std::uint64_t> memory_used_bytes()  = 0;
    virtual std::optional<std::uint64_t> memory_total_bytes() = 0;
};

// Linux implementation backed by /proc/stat, /proc/meminfo and
// /proc/self/statm.
class ProcSystemProbe : public SystemProbe {
public:
    std::optional<double>        cpu_used_ratio() override;
    std::optional<std::uint64_t> memory_used_bytes() override;
    std::optional<std::uint64_t> memory_total_bytes() override;

private:
    std::mutex    mutex_;
    bool          has_prev_   = false;
    std::uint64_t prev_total_ = 0;
    std::uint64_t prev_idle_  = 0;
};

}  // namespace Autoscaling
}  // namespace Trawl
