#include "system_probe.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace Trawl {
namespace Autoscaling {

std::optional<double> ProcSystemProbe::cpu_used_ratio() {
    std::ifstream file("/proc/stat");
    std::string   line;
    if (!file.is_open() || !std::getline(file, line))
        return std::nullopt;

    std::istringstream stream(line);
    std::string        label;
    stream >> label;
    if (label != "cpu")
        return std::nullopt;

    // user nice system idle iowait irq softirq steal
    std::uint64_t values[8] = {};
    for (auto& value : values) {
        if (!(stream >> value))
            return std::nullopt;
    }

    const std::uint64_t idle  = values[3] + values[4];
    const std::uint64_t busy  = values[0] + values[1] + values[2] + values[5] + values[6] + values[7];
    const std::uint64_t total = idle + busy;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_prev_) {
        has_prev_   = true;
        prev_total_ = total;
        prev_idle_  = idle;
        return total == 0 ? 0.0 : static_cast<double>(busy) / static_cast<double>(total);
    }

    const std::uint64_t total_delta = total >= prev_total_ ? total - prev_total_ : 0;
    const std::uint64_t idle_delta  = idle >= prev_idle_ ? idle - prev_idle_ : 0;
    prev_total_ = total;
    prev_idle_  = idle;

    if (total_delta == 0)
        return 0.0;
    const std::uint64_t busy_delta = total_delta >= idle_delta ? total_delta - idle_delta : 0;
    return static_cast<double>(busy_delta) / static_cast<double>(total_delta);
}

std::optional<std::uint64_t> ProcSystemProbe::memory_used_bytes() {
    std::ifstream file("/proc/self/statm");
    std::uint64_t size_pages     = 0;
    std::uint64_t resident_pages = 0;
    if (!file.is_open() || !(file >> size_pages >> resident_pages))
        return std::nullopt;

    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0)
        return std::nullopt;
    return resident_pages * static_cast<std::uint64_t>(page_size);
}

std::optional<std::uint64_t> ProcSystemProbe::memory_total_bytes() {
    std::ifstream file("/proc/meminfo");
    if (!file.is_open())
        return std::nullopt;

    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("MemTotal:", 0) != 0)
            continue;
        std::istringstream stream(line.substr(9));
        std::uint64_t      kilobytes = 0;
        if (!(stream >> kilobytes))
            return std::nullopt;
        return kilobytes * 1024;
    }
    return std::nullopt;
}

}  // namespace Autoscaling
}  // namespace Trawl
