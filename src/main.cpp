#include <memory>
#include "trawl/trawl.hpp"

namespace {

using Trawl::Core::Config;
using Trawl::Core::Logger;

Trawl::Engine::CrawlerOptions to_crawler_options(const Config& config) {
    Trawl::Engine::CrawlerOptions options;
    options.pool                         = config.pool;
    options.max_request_retries          = config.max_request_retries;
    options.max_requests_per_crawl       = config.max_requests_per_crawl;
    options.request_handler_timeout_secs = config.request_handler_timeout_secs;
    options.stats_log_interval_secs      = config.stats_log_interval_secs;
    options.max_depth                    = config.max_depth;
    options.threads                      = config.threads;
    options.handle_signals               = true;
    options.keep_alive                   = config.keep_alive;

    options.request_list  = std::make_shared<Trawl::Storage::RequestList>(config.urls);
    options.request_queue = std::make_shared<Trawl::Storage::RequestQueue>();
    options.dataset       = std::make_shared<Trawl::Storage::Dataset>(config.output_dir);

    auto client = std::make_shared<Trawl::Network::Http::BeastClient>();
    client->set_connect_timeout(std::chrono::milliseconds(Trawl::Core::Constants::CONNECT_TIMEOUT_MILLIS));
    options.request_handler = Trawl::Engine::PageHandler(client, config.same_domain);
    return options;
}

int run_crawler(const Config& config) {
    Trawl::Engine::BasicCrawler crawler(to_crawler_options(config));
    auto                        state = crawler.run();
    Logger::info("Output written to " + crawler.dataset()->file_path().string());
    return state == Trawl::Autoscaling::PoolState::Finished ? 0 : 130;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
        Logger::set_level(Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.urls.empty()) {
        Logger::error("No URLs provided.");
        return 1;
    }

    try {
        return run_crawler(config);
    } catch (const std::exception& e) {
        Logger::error("Crawl failed: " + std::string(e.what()));
        return 1;
    }
}
