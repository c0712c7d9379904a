#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../autoscaling/autoscaled_pool.hpp"
#include "../../core/async/interval.hpp"
#include "../../core/types/constants.hpp"
#include "../../storage/dataset.hpp"
#include "../../storage/request_list.hpp"
#include "../../storage/request_queue.hpp"
#include "../statistics/statistics.hpp"

class BasicCrawlerTest_MergeRunsOnce_Test;
class BasicCrawlerTest_CapStopsFetching_Test;

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
using Trawl::Autoscaling::PoolState;
using Trawl::Autoscaling::TaskResult;

class BasicCrawler;

// Handed to user handlers, one per attempt of a request.
struct CrawlingContext {
    std::shared_ptr<Storage::Request> request;
    BasicCrawler*                     crawler = nullptr;

    // Enqueues links found on the page one level deeper than the request.
    boost::asio::awaitable<std::vector<Storage::AddRequestResult>> add_requests(std::vector<std::string> urls);
    void push_data(const nlohmann::json& data);
    void report_client_error();
};

using RequestHandler = std::function<boost::asio::awaitable<void>(std::shared_ptr<CrawlingContext>)>;
using ErrorHandler =
    std::function<boost::asio::awaitable<void>(std::shared_ptr<CrawlingContext>, std::exception_ptr)>;

struct CrawlerOptions {
    Autoscaling::AutoscaledPoolOptions pool;

    RequestHandler request_handler;
    // Runs before a failed request is retried.
    ErrorHandler error_handler;
    // Runs once per request that ran out of retries.
    ErrorHandler failed_request_handler;

    std::shared_ptr<Storage::RequestList>  request_list;
    std::shared_ptr<Storage::RequestQueue> request_queue;
    std::shared_ptr<Storage::Dataset>      dataset;

    int                max_request_retries          = Constants::DEFAULT_MAX_REQUEST_RETRIES;
    int                max_requests_per_crawl       = 0;  // 0 = unlimited
    double             request_handler_timeout_secs = Constants::DEFAULT_REQUEST_HANDLER_TIMEOUT_SECS;
    double             stats_log_interval_secs      = Constants::DEFAULT_STATS_LOG_INTERVAL_SECS;
    std::optional<int> max_depth;
    int                threads        = Constants::DEFAULT_THREADS;
    bool               handle_signals = false;
    // Keeps the pool running on an empty source until abort().
    bool keep_alive = false;
};

// Binds an AutoscaledPool to a request source: fetches requests, runs the
// request handler under a timeout and turns handler failures into retries
// or terminal failures. Only store failures and CriticalError stop the crawl.
class BasicCrawler : public Autoscaling::PoolTaskSource {
#ifndef CPPCHECK
    friend class ::BasicCrawlerTest_MergeRunsOnce_Test;
    friend class ::BasicCrawlerTest_CapStopsFetching_Test;
#endif

public:
    explicit BasicCrawler(CrawlerOptions options);
    ~BasicCrawler() override;

    BasicCrawler(const BasicCrawler&)            = delete;
    BasicCrawler& operator=(const BasicCrawler&) = delete;

    // Blocks until the crawl finishes or is aborted. Rethrows the error
    // that stopped the crawl.
    PoolState run();
    void      abort();

    boost::asio::awaitable<std::vector<Storage::AddRequestResult>> add_requests(std::vector<Storage::Request> requests);

    // Drains the request list into the request queue. Runs at most once.
    boost::asio::awaitable<void> merge_sources();

    void report_client_error();

    boost::asio::awaitable<TaskResult> run_task() override;
    boost::asio::awaitable<bool>       is_task_ready() override;
    boost::asio::awaitable<bool>       is_finished() override;

    Statistics& statistics() {
        return statistics_;
    }
    const CrawlerOptions& options() const {
        return options_;
    }
    std::shared_ptr<Storage::Dataset> dataset() const {
        return options_.dataset;
    }
    std::shared_ptr<Autoscaling::AutoscaledPool> pool() const {
        return pool_;
    }

private:
    Storage::RequestSource& source();
    bool                    cap_reached();
    bool can_be_retried(const Storage::Request& request, const std::exception_ptr& error) const;

    boost::asio::awaitable<PoolState>  run_pool();
    boost::asio::awaitable<TaskResult> process_request(std::shared_ptr<CrawlingContext> context);
    boost::asio::awaitable<TaskResult> handle_request_error(std::shared_ptr<CrawlingContext> context,
                                                            std::exception_ptr               error);
    boost::asio::awaitable<void>       run_user_error_handler(const ErrorHandler&              handler,
                                                              std::shared_ptr<CrawlingContext> context,
                                                              std::exception_ptr               error,
                                                              std::string                      name);

    boost::asio::awaitable<std::shared_ptr<Storage::Request>> fetch_next();
    boost::asio::awaitable<void> mark_handled(std::shared_ptr<Storage::Request> request);
    boost::asio::awaitable<void> reclaim(std::shared_ptr<Storage::Request> request);

    void init_signals();
    void run_io();
    void log_statistics(const std::string& title);

    CrawlerOptions            options_;
    std::chrono::milliseconds handler_timeout_;
    std::chrono::milliseconds internal_timeout_;

    boost::asio::io_context                      ioc_;
    boost::asio::signal_set                      signals_{ioc_};
    std::shared_ptr<Autoscaling::AutoscaledPool> pool_;
    std::unique_ptr<Core::Interval>              stats_interval_;
    Statistics                                   statistics_;

    std::atomic<bool> running_{false};
    std::atomic<int>  started_requests_{0};
    std::atomic<int>  in_flight_{0};
    bool              merged_     = false;
    int               merge_runs_ = 0;
    bool              cap_logged_ = false;
};

}  // namespace Engine
}  // namespace Trawl
