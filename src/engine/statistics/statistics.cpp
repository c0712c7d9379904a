#include "statistics.hpp"
#include <algorithm>

namespace Trawl {
namespace Engine {

void Statistics::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_at_ = Clock::now();
    finished_at_.reset();
}

void Statistics::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_at_ = Clock::now();
}

void Statistics::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.clear();
        started_at_.reset();
        finished_at_.reset();
        finished_             = 0;
        failed_               = 0;
        retries_              = 0;
        finished_duration_ms_ = 0;
        failed_duration_ms_   = 0;
        min_duration_ms_.reset();
        max_duration_ms_.reset();
        retry_histogram_.clear();
    }
    errors_.reset();
    retry_errors_.reset();
}

void Statistics::start_job(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A retry restarts the clock; durations cover the last attempt only.
    jobs_.insert_or_assign(id, Clock::now());
}

void Statistics::finish_job(const std::string& id, int retry_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double duration = take_duration(id);
    ++finished_;
    finished_duration_ms_ += duration;
    min_duration_ms_ = min_duration_ms_ ? std::min(*min_duration_ms_, duration) : duration;
    max_duration_ms_ = max_duration_ms_ ? std::max(*max_duration_ms_, duration) : duration;
    record_retries(retry_count);
}

void Statistics::fail_job(const std::string& id, int retry_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_duration_ms_ += take_duration(id);
    ++failed_;
    record_retries(retry_count);
}

double Statistics::take_duration(const std::string& id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return 0.0;
    const double duration = std::chrono::duration<double, std::milli>(Clock::now() - it->second).count();
    jobs_.erase(it);
    return duration;
}

void Statistics::record_retries(int retry_count) {
    const auto retries = static_cast<std::size_t>(std::max(0, retry_count));
    retries_ += retries;
    if (retry_histogram_.size() <= retries)
        retry_histogram_.resize(retries + 1, 0);
    ++retry_histogram_[retries];
}

std::size_t Statistics::requests_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

std::size_t Statistics::requests_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

std::size_t Statistics::requests_retries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retries_;
}

std::vector<std::size_t> Statistics::retry_histogram() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_histogram_;
}

std::chrono::milliseconds Statistics::runtime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_locked();
}

std::chrono::milliseconds Statistics::runtime_locked() const {
    if (!started_at_)
        return std::chrono::milliseconds(0);
    const auto end = finished_at_ ? *finished_at_ : Clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at_);
}

nlohmann::json Statistics::calculate() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto   runtime_ms = runtime_locked().count();
    const double minutes    = static_cast<double>(runtime_ms) / 60000.0;
    const auto   per_minute = [minutes](std::size_t count) {
        return minutes > 0 ? static_cast<double>(count) / minutes : 0.0;
    };

    return {
        {"requestsFinished", finished_},
        {"requestsFailed", failed_},
        {"requestsTotal", finished_ + failed_},
        {"requestsRetries", retries_},
        {"requestsFinishedPerMinute", per_minute(finished_)},
        {"requestsFailedPerMinute", per_minute(failed_)},
        {"requestAvgFinishedDurationMillis", finished_ > 0 ? finished_duration_ms_ / finished_ : 0.0},
        {"requestAvgFailedDurationMillis", failed_ > 0 ? failed_duration_ms_ / failed_ : 0.0},
        {"requestMinDurationMillis", min_duration_ms_.value_or(0.0)},
        {"requestMaxDurationMillis", max_duration_ms_.value_or(0.0)},
        {"retryHistogram", retry_histogram_},
        {"crawlerRuntimeMillis", runtime_ms},
    };
}

}  // namespace Engine
}  // namespace Trawl
