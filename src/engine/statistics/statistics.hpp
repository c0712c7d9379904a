#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "error_tracker.hpp"

namespace Trawl {
namespace Engine {

// Per-crawl request counters and timings. Jobs are keyed by request unique
// key; a job lasts from fetch to its final outcome, retries included.
class Statistics {
public:
    using Clock = std::chrono::steady_clock;

    void start();
    void stop();
    void reset();

    void start_job(const std::string& id);
    void finish_job(const std::string& id, int retry_count);
    void fail_job(const std::string& id, int retry_count);

    std::size_t requests_finished() const;
    std::size_t requests_failed() const;
    std::size_t requests_retries() const;
    std::vector<std::size_t> retry_histogram() const;
    std::chrono::milliseconds runtime() const;

    // Snapshot including derived averages and per-minute rates.
    nlohmann::json calculate() const;

    ErrorTracker& errors() {
        return errors_;
    }
    ErrorTracker& retry_errors() {
        return retry_errors_;
    }

private:
    double take_duration(const std::string& id);
    void   record_retries(int retry_count);
    std::chrono::milliseconds runtime_locked() const;

    mutable std::mutex                     mutex_;
    std::map<std::string, Clock::time_point> jobs_;
    std::optional<Clock::time_point>       started_at_;
    std::optional<Clock::time_point>       finished_at_;

    std::size_t              finished_              = 0;
    std::size_t              failed_                = 0;
    std::size_t              retries_               = 0;
    double                   finished_duration_ms_  = 0;
    double                   failed_duration_ms_    = 0;
    std::optional<double>    min_duration_ms_;
    std::optional<double>    max_duration_ms_;
    std::vector<std::size_t> retry_histogram_;

    ErrorTracker errors_;
    ErrorTracker retry_errors_;
};

}  // namespace Engine
}  // namespace Trawl
