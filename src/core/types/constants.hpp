#pragma once
#include <chrono>
#include <cstddef>

namespace Trawl {
namespace Core {

struct Constants {
    static constexpr const char* VERSION            = "0.1.0";
    static constexpr const char* USER_AGENT         = "Trawl-Crawler/0.1";
    static constexpr const char* DEFAULT_OUTPUT_DIR = "storage";
    static constexpr int         DEFAULT_THREADS    = 1;
    static constexpr int         DEFAULT_MAX_DEPTH      = 0;

    // AutoscaledPool
    static constexpr int    DEFAULT_MIN_CONCURRENCY          = 1;
    static constexpr int    DEFAULT_MAX_CONCURRENCY          = 200;
    static constexpr double DEFAULT_DESIRED_CONCURRENCY_RATIO = 0.95;
    static constexpr double DEFAULT_SCALE_UP_STEP_RATIO      = 0.05;
    static constexpr double DEFAULT_SCALE_DOWN_STEP_RATIO    = 0.05;
    static constexpr double DEFAULT_MAYBE_RUN_INTERVAL_SECS  = 0.5;
    static constexpr double DEFAULT_AUTOSCALE_INTERVAL_SECS  = 10.0;
    static constexpr double DEFAULT_LOGGING_INTERVAL_SECS    = 60.0;

    // Snapshotter
    static constexpr double DEFAULT_EVENT_LOOP_SNAPSHOT_INTERVAL_SECS = 0.5;
    static constexpr double DEFAULT_CLIENT_SNAPSHOT_INTERVAL_SECS     = 1.0;
    static constexpr double DEFAULT_SYSTEM_INFO_INTERVAL_SECS         = 1.0;
    static constexpr double DEFAULT_SNAPSHOT_HISTORY_SECS             = 30.0;
    static constexpr int    DEFAULT_MAX_BLOCKED_MILLIS                = 50;
    static constexpr double DEFAULT_MAX_USED_MEMORY_RATIO             = 0.7;
    static constexpr double DEFAULT_MAX_USED_CPU_RATIO                = 0.95;
    static constexpr int    DEFAULT_MAX_CLIENT_ERRORS                 = 3;
    static constexpr double DEFAULT_AVAILABLE_MEMORY_RATIO            = 0.25;

    // SystemStatus
    static constexpr double DEFAULT_CURRENT_HISTORY_SECS            = 5.0;
    static constexpr double DEFAULT_MAX_MEMORY_OVERLOADED_RATIO     = 0.2;
    static constexpr double DEFAULT_MAX_EVENT_LOOP_OVERLOADED_RATIO = 0.6;
    static constexpr double DEFAULT_MAX_CPU_OVERLOADED_RATIO        = 0.4;
    static constexpr double DEFAULT_MAX_CLIENT_OVERLOADED_RATIO     = 0.3;

    // BasicCrawler
    static constexpr int    DEFAULT_MAX_REQUEST_RETRIES          = 3;
    static constexpr double DEFAULT_REQUEST_HANDLER_TIMEOUT_SECS = 60.0;
    static constexpr double MIN_INTERNAL_TIMEOUT_SECS            = 300.0;
    static constexpr int    DEFAULT_STORE_OPERATION_RETRIES      = 3;
    static constexpr double DEFAULT_STATS_LOG_INTERVAL_SECS      = 60.0;
    static constexpr int    REQUEST_TIMEOUT_SECONDS              = 30;
    static constexpr int    CONNECT_TIMEOUT_MILLIS               = 5000;
};

inline std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

}  // namespace Core
}  // namespace Trawl
