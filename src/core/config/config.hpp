#pragma once
#include <string>
#include <vector>

#include "../../autoscaling/autoscaled_pool.hpp"
#include "../types/constants.hpp"

namespace Trawl {
namespace Core {

struct Config {
    Autoscaling::AutoscaledPoolOptions pool;

    int         max_request_retries          = Constants::DEFAULT_MAX_REQUEST_RETRIES;
    int         max_requests_per_crawl       = 0;  // 0 = unlimited
    double      request_handler_timeout_secs = Constants::DEFAULT_REQUEST_HANDLER_TIMEOUT_SECS;
    double      stats_log_interval_secs      = Constants::DEFAULT_STATS_LOG_INTERVAL_SECS;
    int         max_depth                    = Constants::DEFAULT_MAX_DEPTH;
    bool        same_domain                  = true;
    bool        keep_alive                   = false;
    int         threads                      = Constants::DEFAULT_THREADS;
    std::string output_dir                   = Constants::DEFAULT_OUTPUT_DIR;
    std::string log_level                    = "info";
    std::string config_path;
    std::string url_list;

    std::vector<std::string> urls;

    static Config parse(int argc, char* argv[]);
};

// Applies the keys of a YAML file on top of `config`. Throws
// std::runtime_error when the file cannot be read or parsed.
void load_yaml(Config& config, const std::string& path);

// Appends the non-empty, non-comment lines of `path` to `urls`.
void load_url_list(std::vector<std::string>& urls, const std::string& path);

}  // namespace Core
}  // namespace Trawl
