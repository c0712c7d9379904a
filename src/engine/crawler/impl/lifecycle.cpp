#include <thread>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/encoding.hpp"
#include "../crawler.hpp"

namespace Trawl {
namespace Engine {

PoolState BasicCrawler::run() {
    if (running_.exchange(true))
        throw std::logic_error("BasicCrawler: run() is already in progress");

    if (ioc_.stopped())
        ioc_.restart();
    started_requests_ = 0;
    in_flight_        = 0;
    cap_logged_       = false;
    statistics_.reset();
    statistics_.start();

    pool_ = std::make_shared<Autoscaling::AutoscaledPool>(ioc_.get_executor(), *this, options_.pool);
    if (options_.handle_signals)
        init_signals();
    if (options_.stats_log_interval_secs > 0) {
        stats_interval_ = std::make_unique<Core::Interval>(pool_->get_executor(),
                                                           to_millis(options_.stats_log_interval_secs),
                                                           [this]() { log_statistics("BasicCrawler: statistics"); });
        stats_interval_->start();
    }

    Logger::info("BasicCrawler: starting the crawl");

    PoolState          final_state = PoolState::Idle;
    std::exception_ptr error;
    boost::asio::co_spawn(pool_->get_executor(), run_pool(),
                          [this, &final_state, &error](std::exception_ptr e, PoolState state) {
                              error       = e;
                              final_state = state;
                              if (stats_interval_)
                                  stats_interval_->stop();
                              boost::system::error_code ec;
                              signals_.cancel(ec);
                          });

    std::vector<std::thread> io_threads;
    for (int i = 1; i < options_.threads; ++i) {
        io_threads.emplace_back([this]() { run_io(); });
    }
    run_io();
    for (auto& t : io_threads) {
        if (t.joinable())
            t.join();
    }

    statistics_.stop();
    log_statistics("BasicCrawler: final statistics");
    running_ = false;

    if (error) {
        Logger::error("BasicCrawler: the crawl stopped on an unrecoverable error");
        std::rethrow_exception(error);
    }
    Logger::success("BasicCrawler: crawl " + Autoscaling::to_string(final_state) + ", "
                    + std::to_string(statistics_.requests_finished()) + " request(s) succeeded, "
                    + std::to_string(statistics_.requests_failed()) + " failed");
    return final_state;
}

boost::asio::awaitable<PoolState> BasicCrawler::run_pool() {
    co_await merge_sources();
    co_return co_await pool_->run();
}

void BasicCrawler::abort() {
    if (!pool_)
        return;
    Logger::info("BasicCrawler: aborting the crawl");
    pool_->abort();
}

void BasicCrawler::run_io() {
    try {
        ioc_.run();
    } catch (const std::exception& e) {
        Logger::error("IO Thread Exception: " + std::string(e.what()));
    }
}

void BasicCrawler::init_signals() {
    boost::system::error_code ec;
    signals_.clear(ec);
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number) + " received. Aborting the crawl...");
            abort();
        }
    });
}

// Reporting only; a failure here never changes the outcome of the crawl.
void BasicCrawler::log_statistics(const std::string& title) {
    using Utils::Text::dump_json;
    try {
        Logger::info(title + " " + dump_json(statistics_.calculate()));
        if (statistics_.errors().total() > 0)
            Logger::info("BasicCrawler: final errors " + dump_json(statistics_.errors().to_json()));
        if (statistics_.retry_errors().total() > 0)
            Logger::info("BasicCrawler: retried errors " + dump_json(statistics_.retry_errors().to_json()));
    } catch (const std::exception& e) {
        Logger::error("BasicCrawler: could not log statistics: " + std::string(e.what()));
    }
}

}  // namespace Engine
}  // namespace Trawl
