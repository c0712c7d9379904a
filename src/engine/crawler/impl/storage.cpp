#include "../../../core/async/timeout.hpp"
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Trawl {
namespace Engine {

boost::asio::awaitable<std::shared_ptr<Storage::Request>> BasicCrawler::fetch_next() {
    auto        operation = [this]() { return source().fetch_next_request(); };
    std::string message   = "BasicCrawler: fetching the next request timed out";
    co_return co_await retry_with_timeout<std::shared_ptr<Storage::Request>>(operation, internal_timeout_, message);
}

boost::asio::awaitable<void> BasicCrawler::mark_handled(std::shared_ptr<Storage::Request> request) {
    auto        operation = [this, request]() { return source().mark_request_handled(request); };
    std::string message   = "BasicCrawler: marking " + request->url + " as handled timed out";
    co_await retry_with_timeout<void>(operation, internal_timeout_, message);
}

boost::asio::awaitable<void> BasicCrawler::reclaim(std::shared_ptr<Storage::Request> request) {
    auto        operation = [this, request]() { return source().reclaim_request(request, false); };
    std::string message   = "BasicCrawler: reclaiming " + request->url + " timed out";
    co_await retry_with_timeout<void>(operation, internal_timeout_, message);
}

boost::asio::awaitable<void> BasicCrawler::merge_sources() {
    if (merged_ || !options_.request_list || !options_.request_queue)
        co_return;
    merged_ = true;
    ++merge_runs_;

    auto& list  = *options_.request_list;
    auto& queue = *options_.request_queue;

    std::size_t added      = 0;
    std::size_t duplicates = 0;
    while (auto request = co_await list.fetch_next_request()) {
        Storage::AddRequestResult result;
        std::exception_ptr        error;
        try {
            Storage::Request copy = *request;
            copy.state            = Storage::RequestState::Available;
            result                = co_await queue.add_request(std::move(copy));
        } catch (...) {
            error = std::current_exception();
        }

        if (error) {
            co_await list.reclaim_request(request, true);
            std::rethrow_exception(error);
        }

        co_await list.mark_request_handled(request);
        if (result.was_already_present)
            ++duplicates;
        else
            ++added;
    }

    Logger::info("BasicCrawler: moved " + std::to_string(added) + " request(s) from the list to the queue ("
                 + std::to_string(duplicates) + " already present)");
}

}  // namespace Engine
}  // namespace Trawl
