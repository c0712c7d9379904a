#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Trawl {
namespace Core {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& target) {
    if (node[key])
        target = node[key].as<T>();
}

void load_snapshotter(const YAML::Node& node, Autoscaling::SnapshotterOptions& options) {
    read(node, "event_loop_snapshot_interval_secs", options.event_loop_snapshot_interval_secs);
    read(node, "client_snapshot_interval_secs", options.client_snapshot_interval_secs);
    read(node, "system_info_interval_secs", options.system_info_interval_secs);
    read(node, "snapshot_history_secs", options.snapshot_history_secs);
    read(node, "max_blocked_millis", options.max_blocked_millis);
    read(node, "max_used_memory_ratio", options.max_used_memory_ratio);
    read(node, "max_used_cpu_ratio", options.max_used_cpu_ratio);
    read(node, "max_client_errors", options.max_client_errors);
    read(node, "memory_mbytes", options.memory_mbytes);
    read(node, "available_memory_ratio", options.available_memory_ratio);
}

void load_system_status(const YAML::Node& node, Autoscaling::SystemStatusOptions& options) {
    read(node, "current_history_secs", options.current_history_secs);
    read(node, "max_memory_overloaded_ratio", options.max_memory_overloaded_ratio);
    read(node, "max_event_loop_overloaded_ratio", options.max_event_loop_overloaded_ratio);
    read(node, "max_cpu_overloaded_ratio", options.max_cpu_overloaded_ratio);
    read(node, "max_client_overloaded_ratio", options.max_client_overloaded_ratio);
    read(node, "empty_window_is_overloaded", options.empty_window_is_overloaded);
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        auto&      pool = config.pool;

        read(yaml, "min_concurrency", pool.min_concurrency);
        read(yaml, "max_concurrency", pool.max_concurrency);
        if (yaml["desired_concurrency"])
            pool.desired_concurrency = yaml["desired_concurrency"].as<int>();
        read(yaml, "desired_concurrency_ratio", pool.desired_concurrency_ratio);
        read(yaml, "scale_up_step_ratio", pool.scale_up_step_ratio);
        read(yaml, "scale_down_step_ratio", pool.scale_down_step_ratio);
        read(yaml, "maybe_run_interval_secs", pool.maybe_run_interval_secs);
        read(yaml, "autoscale_interval_secs", pool.autoscale_interval_secs);
        if (yaml["logging_interval_secs"]) {
            if (yaml["logging_interval_secs"].IsNull())
                pool.logging_interval_secs.reset();
            else
                pool.logging_interval_secs = yaml["logging_interval_secs"].as<double>();
        }
        read(yaml, "task_timeout_secs", pool.task_timeout_secs);
        read(yaml, "max_tasks_per_minute", pool.max_tasks_per_minute);

        if (yaml["snapshotter"] && yaml["snapshotter"].IsMap())
            load_snapshotter(yaml["snapshotter"], pool.snapshotter);
        if (yaml["system_status"] && yaml["system_status"].IsMap())
            load_system_status(yaml["system_status"], pool.system_status);

        read(yaml, "max_request_retries", config.max_request_retries);
        read(yaml, "max_requests_per_crawl", config.max_requests_per_crawl);
        read(yaml, "request_handler_timeout_secs", config.request_handler_timeout_secs);
        read(yaml, "stats_log_interval_secs", config.stats_log_interval_secs);
        read(yaml, "max_depth", config.max_depth);
        read(yaml, "depth", config.max_depth);
        read(yaml, "same_domain", config.same_domain);
        read(yaml, "keep_alive", config.keep_alive);
        read(yaml, "threads", config.threads);
        read(yaml, "output", config.output_dir);
        read(yaml, "output_dir", config.output_dir);
        read(yaml, "log_level", config.log_level);
        read(yaml, "url_list", config.url_list);

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void load_url_list(std::vector<std::string>& urls, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open URL list: " + path);

    std::string line;
    while (std::getline(file, line)) {
        size_t f = line.find_first_not_of(" \t\r\n");
        if (f == std::string::npos || line[f] == '#')
            continue;
        size_t last = line.find_last_not_of(" \t\r\n");
        urls.push_back(line.substr(f, last - f + 1));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Trawl - adaptive concurrency web crawler"};

    int    desired_concurrency = 0;
    double logging_interval    = -1;
    auto&  pool                = config.pool;

    app.add_option("--min-concurrency", pool.min_concurrency, "Lowest number of parallel requests");
    app.add_option("--max-concurrency", pool.max_concurrency, "Highest number of parallel requests");
    app.add_option("--desired-concurrency", desired_concurrency, "Initial number of parallel requests");
    app.add_option("--desired-concurrency-ratio", pool.desired_concurrency_ratio,
                   "Saturation required before scaling up");
    app.add_option("--scale-up-step-ratio", pool.scale_up_step_ratio, "Relative scale up step");
    app.add_option("--scale-down-step-ratio", pool.scale_down_step_ratio, "Relative scale down step");
    app.add_option("--autoscale-interval", pool.autoscale_interval_secs, "Seconds between scaling decisions");
    app.add_option("--logging-interval", logging_interval, "Seconds between pool state logs, 0 disables");
    app.add_option("--max-tasks-per-minute", pool.max_tasks_per_minute, "Request rate limit, 0 disables");
    app.add_option("--memory-mbytes", pool.snapshotter.memory_mbytes, "Memory budget in megabytes");

    app.add_option("-r,--max-retries", config.max_request_retries, "Retries per failed request");
    app.add_option("-m,--max-requests", config.max_requests_per_crawl, "Stop after this many requests, 0 disables");
    app.add_option("--handler-timeout", config.request_handler_timeout_secs, "Seconds allowed per request");
    app.add_option("-d,--depth", config.max_depth, "Link depth to follow from the start URLs");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("--log-level", config.log_level, "none, error, warn, info or debug");
    app.add_option("--url-list", config.url_list, "File with one URL per line");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag(
        "--any-domain",
        [&](size_t count) {
            if (count > 0)
                config.same_domain = false;
        },
        "Follow links to other domains");

    app.add_flag(
        "--keep-alive",
        [&](size_t count) {
            if (count > 0)
                config.keep_alive = true;
        },
        "Keep running on an empty queue until interrupted");

    app.add_option("urls", config.urls, "URLs to crawl");
    app.set_version_flag("-V,--version", Constants::VERSION);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (desired_concurrency > 0)
        pool.desired_concurrency = desired_concurrency;
    if (logging_interval == 0)
        pool.logging_interval_secs.reset();
    else if (logging_interval > 0)
        pool.logging_interval_secs = logging_interval;

    if (!config.url_list.empty())
        load_url_list(config.urls, config.url_list);

    return config;
}

}  // namespace Core
}  // namespace Trawl
