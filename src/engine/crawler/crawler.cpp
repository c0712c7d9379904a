#include "crawler.hpp"
#include <algorithm>
#include <stdexcept>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

namespace {
template <typename E>
bool holds(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
}
}  // namespace

BasicCrawler::BasicCrawler(CrawlerOptions options)
    : options_(std::move(options)),
      handler_timeout_(to_millis(options_.request_handler_timeout_secs)),
      internal_timeout_(to_millis(std::max(options_.request_handler_timeout_secs * 2,
                                           Constants::MIN_INTERNAL_TIMEOUT_SECS))) {
    if (!options_.request_handler)
        throw std::invalid_argument("BasicCrawler: request_handler is required");
    if (!options_.request_list && !options_.request_queue)
        throw std::invalid_argument("BasicCrawler: a request_list or a request_queue is required");
    if (options_.max_request_retries < 0)
        throw std::invalid_argument("BasicCrawler: max_request_retries must not be negative");
    if (options_.max_requests_per_crawl < 0)
        throw std::invalid_argument("BasicCrawler: max_requests_per_crawl must not be negative");
    if (options_.request_handler_timeout_secs < 0)
        throw std::invalid_argument("BasicCrawler: request_handler_timeout_secs must not be negative");
    if (options_.threads < 1)
        throw std::invalid_argument("BasicCrawler: threads must be at least 1");
}

BasicCrawler::~BasicCrawler() {
    if (stats_interval_)
        stats_interval_->stop();
}

Storage::RequestSource& BasicCrawler::source() {
    if (options_.request_queue)
        return *options_.request_queue;
    return *options_.request_list;
}

bool BasicCrawler::cap_reached() {
    if (options_.max_requests_per_crawl <= 0 || started_requests_ < options_.max_requests_per_crawl)
        return false;

    if (!cap_logged_) {
        cap_logged_ = true;
        Logger::info("BasicCrawler: reached the maximum of " + std::to_string(options_.max_requests_per_crawl)
                     + " requests per crawl. Ongoing requests will finish, then the crawl stops.");
    }
    return true;
}

bool BasicCrawler::can_be_retried(const Storage::Request& request, const std::exception_ptr& error) const {
    if (request.no_retry)
        return false;

    if (holds<NonRetryableError>(error))
        return false;
    if (holds<RetryRequestError>(error))
        return true;

    const int max_retries = request.max_retries.value_or(options_.max_request_retries);
    return request.retry_count < max_retries;
}

void BasicCrawler::report_client_error() {
    if (pool_)
        pool_->report_client_error();
}

boost::asio::awaitable<std::vector<Storage::AddRequestResult>>
BasicCrawler::add_requests(std::vector<Storage::Request> requests) {
    if (!options_.request_queue)
        throw std::logic_error("BasicCrawler: add_requests needs a request_queue");
    co_return co_await options_.request_queue->add_requests(std::move(requests));
}

boost::asio::awaitable<std::vector<Storage::AddRequestResult>>
CrawlingContext::add_requests(std::vector<std::string> urls) {
    const int  depth     = request->depth + 1;
    const auto max_depth = crawler->options().max_depth;
    if (max_depth && depth > *max_depth)
        co_return std::vector<Storage::AddRequestResult>{};

    std::vector<Storage::Request> requests;
    requests.reserve(urls.size());
    for (auto& url : urls) {
        Storage::Request next(std::move(url));
        next.depth = depth;
        requests.push_back(std::move(next));
    }
    co_return co_await crawler->add_requests(std::move(requests));
}

void CrawlingContext::push_data(const nlohmann::json& data) {
    auto dataset = crawler->dataset();
    if (!dataset)
        throw std::logic_error("BasicCrawler: push_data needs a dataset");
    dataset->push_data(data);
}

void CrawlingContext::report_client_error() {
    crawler->report_client_error();
}

}  // namespace Engine
}  // namespace Trawl
