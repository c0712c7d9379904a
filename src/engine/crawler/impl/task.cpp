#include "../../../core/async/timeout.hpp"
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Trawl {
namespace Engine {

namespace {
std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

bool is_critical(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const CriticalError&) {
        return true;
    } catch (...) {
        return false;
    }
}
}  // namespace

boost::asio::awaitable<bool> BasicCrawler::is_task_ready() {
    if (cap_reached())
        co_return false;
    auto        operation = [this]() { return source().is_empty(); };
    std::string message   = "BasicCrawler: checking the request source timed out";
    const bool  empty     = co_await retry_with_timeout<bool>(operation, internal_timeout_, message);
    co_return !empty;
}

boost::asio::awaitable<bool> BasicCrawler::is_finished() {
    if (options_.keep_alive)
        co_return false;
    if (cap_reached())
        co_return in_flight_ == 0;
    auto        operation = [this]() { return source().is_finished(); };
    std::string message   = "BasicCrawler: checking the request source timed out";
    const bool  finished  = co_await retry_with_timeout<bool>(operation, internal_timeout_, message);
    co_return finished && in_flight_ == 0;
}

boost::asio::awaitable<TaskResult> BasicCrawler::run_task() {
    if (cap_reached())
        co_return TaskResult::ok();

    // Reserve the slot before suspending so parallel tasks cannot overshoot the cap.
    ++started_requests_;

    std::shared_ptr<Storage::Request> request;
    std::exception_ptr                store_error;
    try {
        request = co_await fetch_next();
    } catch (...) {
        store_error = std::current_exception();
    }

    if (store_error || !request) {
        --started_requests_;
        if (store_error)
            co_return TaskResult::fatal(store_error);
        co_return TaskResult::ok();
    }

    ++in_flight_;
    statistics_.start_job(request->unique_key);

    auto context     = std::make_shared<CrawlingContext>();
    context->request = request;
    context->crawler = this;

    TaskResult result = co_await process_request(context);
    --in_flight_;
    co_return result;
}

boost::asio::awaitable<TaskResult> BasicCrawler::process_request(std::shared_ptr<CrawlingContext> context) {
    auto request = context->request;
    Logger::debug("BasicCrawler: processing " + request->url + " (retry " + std::to_string(request->retry_count)
                  + ")");

    std::exception_ptr handler_error;
    try {
        co_await with_timeout(options_.request_handler(context), handler_timeout_,
                              "Request handler timed out after " + std::to_string(handler_timeout_.count())
                                  + " ms");
    } catch (...) {
        handler_error = std::current_exception();
    }

    if (handler_error)
        co_return co_await handle_request_error(context, handler_error);

    std::exception_ptr store_error;
    try {
        co_await mark_handled(request);
    } catch (...) {
        store_error = std::current_exception();
    }
    if (store_error)
        co_return TaskResult::fatal(store_error);

    statistics_.finish_job(request->unique_key, request->retry_count);
    co_return TaskResult::ok();
}

boost::asio::awaitable<TaskResult> BasicCrawler::handle_request_error(std::shared_ptr<CrawlingContext> context,
                                                                      std::exception_ptr               error) {
    auto request = context->request;
    if (is_critical(error)) {
        Logger::error("BasicCrawler: critical error while processing " + request->url + ": " + describe(error));
        co_return TaskResult::fatal(error);
    }

    const std::string message = describe(error);
    request->push_error_message(message);

    std::exception_ptr store_error;
    if (can_be_retried(*request, error)) {
        statistics_.retry_errors().add(error);
        co_await run_user_error_handler(options_.error_handler, context, error, "error_handler");
        ++request->retry_count;

        Logger::warn("BasicCrawler: reclaiming failed request back to the source. " + message + " {\"url\":\""
                     + request->url + "\",\"retryCount\":" + std::to_string(request->retry_count) + "}");
        try {
            co_await reclaim(request);
        } catch (...) {
            store_error = std::current_exception();
        }
        if (store_error)
            co_return TaskResult::fatal(store_error);
        co_return TaskResult::retryable(error);
    }

    statistics_.errors().add(error);
    if (options_.failed_request_handler) {
        co_await run_user_error_handler(options_.failed_request_handler, context, error, "failed_request_handler");
    }
    else {
        Logger::error("BasicCrawler: request " + request->url + " failed after "
                      + std::to_string(request->retry_count + 1) + " attempt(s): " + message);
    }

    try {
        co_await mark_handled(request);
    } catch (...) {
        store_error = std::current_exception();
    }
    if (store_error)
        co_return TaskResult::fatal(store_error);

    statistics_.fail_job(request->unique_key, request->retry_count);
    co_return TaskResult::ok();
}

boost::asio::awaitable<void> BasicCrawler::run_user_error_handler(const ErrorHandler&              handler,
                                                                  std::shared_ptr<CrawlingContext> context,
                                                                  std::exception_ptr               error,
                                                                  std::string                      name) {
    if (!handler)
        co_return;

    std::exception_ptr handler_error;
    try {
        co_await with_timeout(handler(context, error), handler_timeout_,
                              "BasicCrawler: " + name + " timed out");
    } catch (...) {
        handler_error = std::current_exception();
    }

    if (handler_error) {
        Logger::error("BasicCrawler: " + name + " threw while handling " + context->request->url + ": "
                      + describe(handler_error));
    }
}

}  // namespace Engine
}  // namespace Trawl
