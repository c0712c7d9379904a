#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <vector>
#include "../../src/core/errors/errors.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "fake_probe.hpp"

using namespace Trawl::Engine;
using namespace Trawl::Storage;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class BasicCrawlerTest : public ::testing::Test {
protected:
    CrawlerOptions get_default_options() {
        CrawlerOptions options;
        options.pool.min_concurrency         = 1;
        options.pool.max_concurrency         = 1;
        options.pool.maybe_run_interval_secs = 0.05;
        options.pool.logging_interval_secs.reset();
        options.pool.probe              = std::make_shared<FakeProbe>();
        options.stats_log_interval_secs = 0;
        options.request_handler         = [this](std::shared_ptr<CrawlingContext> context)
            -> boost::asio::awaitable<void> {
            ++calls[context->request->url];
            co_return;
        };
        options.failed_request_handler = [this](std::shared_ptr<CrawlingContext> context,
                                                std::exception_ptr)
            -> boost::asio::awaitable<void> {
            ++failed[context->request->url];
            co_return;
        };
        return options;
    }

    static std::shared_ptr<RequestList> list_of(const std::vector<std::string>& urls) {
        return std::make_shared<RequestList>(urls);
    }

    void TearDown() override {
        if (fs::exists("test_crawler_out"))
            fs::remove_all("test_crawler_out");
    }

    std::map<std::string, int> calls;
    std::map<std::string, int> failed;
};

TEST_F(BasicCrawlerTest, RequiresHandlerAndSource) {
    auto options            = get_default_options();
    options.request_handler = nullptr;
    options.request_list    = list_of({"https://a.example"});
    EXPECT_THROW(BasicCrawler crawler(options), std::invalid_argument);

    options = get_default_options();
    EXPECT_THROW(BasicCrawler crawler(options), std::invalid_argument);

    options                     = get_default_options();
    options.request_list        = list_of({"https://a.example"});
    options.max_request_retries = -1;
    EXPECT_THROW(BasicCrawler crawler(options), std::invalid_argument);
}

TEST_F(BasicCrawlerTest, MixedOutcomesFinishTheCrawl) {
    auto options                = get_default_options();
    options.max_request_retries = 0;
    options.request_list        = list_of({"https://a.example/", "https://b.example/", "https://c.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        if (context->request->url == "https://b.example/")
            throw std::runtime_error("b is broken");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);

    EXPECT_EQ(calls.size(), 3);
    EXPECT_EQ(calls["https://a.example/"], 1);
    EXPECT_EQ(calls["https://b.example/"], 1);
    EXPECT_EQ(calls["https://c.example/"], 1);
    ASSERT_EQ(failed.size(), 1);
    EXPECT_EQ(failed["https://b.example/"], 1);
    EXPECT_EQ(crawler.statistics().requests_finished(), 2);
    EXPECT_EQ(crawler.statistics().requests_failed(), 1);
    EXPECT_EQ(options.request_list->handled_count(), 3);
}

TEST_F(BasicCrawlerTest, RetriesUntilLimitThenFailsOnce) {
    int  error_handler_calls    = 0;
    auto options                = get_default_options();
    options.max_request_retries = 2;
    options.request_list        = list_of({"https://flaky.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        throw std::runtime_error("always failing");
        co_return;
    };
    options.error_handler = [&error_handler_calls](std::shared_ptr<CrawlingContext>,
                                                   std::exception_ptr) -> boost::asio::awaitable<void> {
        ++error_handler_calls;
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);

    EXPECT_EQ(calls["https://flaky.example/"], 3);
    EXPECT_EQ(failed["https://flaky.example/"], 1);
    EXPECT_EQ(error_handler_calls, 2);
    EXPECT_EQ(crawler.statistics().requests_failed(), 1);
    EXPECT_EQ(crawler.statistics().requests_retries(), 2);
    EXPECT_EQ(crawler.statistics().errors().total(), 1);
    EXPECT_EQ(crawler.statistics().retry_errors().total(), 2);
}

TEST_F(BasicCrawlerTest, SucceedsAfterRetry) {
    auto options                = get_default_options();
    options.max_request_retries = 3;
    options.request_list        = list_of({"https://retry.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        if (++calls[context->request->url] < 2)
            throw std::runtime_error("first attempt fails");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls["https://retry.example/"], 2);
    EXPECT_TRUE(failed.empty());
    EXPECT_EQ(crawler.statistics().requests_finished(), 1);
    EXPECT_EQ(crawler.statistics().retry_histogram(), std::vector<std::size_t>({0, 1}));
}

TEST_F(BasicCrawlerTest, NonRetryableErrorSkipsRetries) {
    auto options                = get_default_options();
    options.max_request_retries = 5;
    options.request_list        = list_of({"https://gone.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        throw Trawl::Core::NonRetryableError("404");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls["https://gone.example/"], 1);
    EXPECT_EQ(failed["https://gone.example/"], 1);
}

TEST_F(BasicCrawlerTest, RetryRequestErrorIgnoresLimit) {
    auto options                = get_default_options();
    options.max_request_retries = 0;
    options.request_list        = list_of({"https://again.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        if (++calls[context->request->url] < 3)
            throw Trawl::Core::RetryRequestError();
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls["https://again.example/"], 3);
    EXPECT_TRUE(failed.empty());
}

TEST_F(BasicCrawlerTest, PerRequestRetrySettings) {
    Request once("https://once.example/");
    once.no_retry = true;
    Request twice("https://twice.example/");
    twice.max_retries = 1;

    auto options                = get_default_options();
    options.max_request_retries = 4;
    options.request_list        = std::make_shared<RequestList>(std::vector<Request>{once, twice});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        throw std::runtime_error("failing");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls["https://once.example/"], 1);
    EXPECT_EQ(calls["https://twice.example/"], 2);
    EXPECT_EQ(failed.size(), 2);
}

TEST_F(BasicCrawlerTest, CriticalErrorStopsCrawl) {
    auto options                = get_default_options();
    options.max_request_retries = 3;
    options.request_list        = list_of({"https://a.example/", "https://b.example/", "https://c.example/"});
    options.request_handler     = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        if (context->request->url == "https://b.example/")
            throw Trawl::Core::CriticalError("disk full");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_THROW(crawler.run(), Trawl::Core::CriticalError);
    EXPECT_EQ(calls["https://b.example/"], 1);
    EXPECT_EQ(calls.count("https://c.example/"), 0);
}

TEST_F(BasicCrawlerTest, ThrowingErrorHandlersAreContained) {
    auto options                   = get_default_options();
    options.max_request_retries    = 1;
    options.request_list           = list_of({"https://a.example/"});
    options.request_handler        = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        throw std::runtime_error("handler failure");
        co_return;
    };
    options.error_handler = [](std::shared_ptr<CrawlingContext>, std::exception_ptr) -> boost::asio::awaitable<void> {
        throw std::runtime_error("error handler failure");
        co_return;
    };
    options.failed_request_handler = [](std::shared_ptr<CrawlingContext>,
                                        std::exception_ptr) -> boost::asio::awaitable<void> {
        throw std::runtime_error("failed request handler failure");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls["https://a.example/"], 2);
    EXPECT_EQ(options.request_list->handled_count(), 1);
}

TEST_F(BasicCrawlerTest, HandlerTimeoutCountsAsFailure) {
    auto options                         = get_default_options();
    options.max_request_retries          = 0;
    options.request_handler_timeout_secs = 0.05;
    options.request_list                 = list_of({"https://slow.example/"});
    options.request_handler = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, 300ms);
        co_await timer.async_wait(boost::asio::use_awaitable);
    };

    std::vector<std::string> messages;
    options.failed_request_handler = [&messages](std::shared_ptr<CrawlingContext> context,
                                                 std::exception_ptr) -> boost::asio::awaitable<void> {
        messages = context->request->error_messages;
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    ASSERT_EQ(messages.size(), 1);
    EXPECT_NE(messages[0].find("timed out"), std::string::npos);
}

TEST_F(BasicCrawlerTest, MergeRunsOnce) {
    auto options          = get_default_options();
    options.request_list  = list_of({"https://a.example/", "https://b.example/", "https://c.example/"});
    options.request_queue = std::make_shared<RequestQueue>();

    boost::asio::io_context io_context;
    boost::asio::co_spawn(io_context, options.request_queue->add_request(Request("https://b.example/")),
                          boost::asio::detached);
    io_context.run();

    BasicCrawler crawler(options);
    io_context.restart();
    boost::asio::co_spawn(
        io_context,
        [&crawler]() -> boost::asio::awaitable<void> {
            co_await crawler.merge_sources();
            co_await crawler.merge_sources();
        },
        boost::asio::detached);
    io_context.run();

    EXPECT_EQ(crawler.merge_runs_, 1);
    EXPECT_EQ(options.request_queue->total_count(), 3);
    EXPECT_EQ(options.request_queue->pending_count(), 3);
    EXPECT_EQ(options.request_list->handled_count(), 3);
}

TEST_F(BasicCrawlerTest, MergedSourcesCrawlEachKeyOnce) {
    auto options          = get_default_options();
    options.request_list  = list_of({"https://a.example/", "https://b.example/"});
    options.request_queue = std::make_shared<RequestQueue>();

    boost::asio::io_context io_context;
    boost::asio::co_spawn(io_context, options.request_queue->add_request(Request("https://B.example")),
                          boost::asio::detached);
    io_context.run();

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls.size(), 2);
    EXPECT_EQ(options.request_queue->handled_count(), 2);
}

TEST_F(BasicCrawlerTest, CapStopsFetching) {
    auto options                   = get_default_options();
    options.pool.max_concurrency     = 3;
    options.pool.desired_concurrency = 3;
    options.max_requests_per_crawl   = 2;
    options.request_list             = list_of({"https://1.example/", "https://2.example/", "https://3.example/",
                                                "https://4.example/", "https://5.example/"});

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls.size(), 2);
    EXPECT_EQ(crawler.started_requests_.load(), 2);
    EXPECT_TRUE(crawler.cap_logged_);
    EXPECT_EQ(options.request_list->handled_count(), 2);
}

TEST_F(BasicCrawlerTest, ContextAddsDeeperRequests) {
    auto options          = get_default_options();
    options.max_depth     = 1;
    options.request_queue = std::make_shared<RequestQueue>();
    std::map<std::string, int> depths;
    options.request_handler = [this, &depths](std::shared_ptr<CrawlingContext> context)
        -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        depths[context->request->url] = context->request->depth;
        std::vector<std::string> urls{context->request->url + "x", "https://root.example/"};
        auto results = co_await context->add_requests(std::move(urls));
        if (context->request->depth == 0) {
            EXPECT_EQ(results.size(), 2);
            EXPECT_TRUE(results[1].was_already_present);
        }
        else {
            EXPECT_TRUE(results.empty());
        }
    };

    boost::asio::io_context io_context;
    boost::asio::co_spawn(io_context, options.request_queue->add_request(Request("https://root.example/")),
                          boost::asio::detached);
    io_context.run();

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(calls.size(), 2);
    EXPECT_EQ(depths["https://root.example/"], 0);
    EXPECT_EQ(depths["https://root.example/x"], 1);
}

TEST_F(BasicCrawlerTest, ContextPushesToDataset) {
    auto options            = get_default_options();
    options.dataset         = std::make_shared<Dataset>("test_crawler_out");
    options.request_list    = list_of({"https://a.example/", "https://b.example/"});
    options.request_handler = [](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        context->push_data({{"url", context->request->url}});
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(options.dataset->item_count(), 2);
    EXPECT_EQ(options.dataset->read_items()[0]["url"], "https://a.example/");
}

TEST_F(BasicCrawlerTest, AddRequestsNeedsQueue) {
    auto options         = get_default_options();
    options.request_list = list_of({"https://a.example/"});
    BasicCrawler crawler(options);

    boost::asio::io_context io_context;
    std::exception_ptr      error;
    boost::asio::co_spawn(io_context, crawler.add_requests({Request("https://b.example/")}),
                          [&error](std::exception_ptr e, std::vector<AddRequestResult>) { error = e; });
    io_context.run();

    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), std::logic_error);
}

TEST_F(BasicCrawlerTest, AbortFromHandler) {
    auto options            = get_default_options();
    options.request_list    = list_of({"https://1.example/", "https://2.example/", "https://3.example/"});
    options.request_handler = [this](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        ++calls[context->request->url];
        context->crawler->abort();
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Aborted);
    EXPECT_EQ(calls.size(), 1);
}

TEST_F(BasicCrawlerTest, PlainCrawlReleasesRequests) {
    auto options         = get_default_options();
    options.request_list = list_of({"https://a.example/", "https://b.example/"});

    std::vector<std::shared_ptr<Request>> seen;
    options.request_handler = [&seen](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        seen.push_back(context->request);
        co_return;
    };

    {
        BasicCrawler crawler(options);
        EXPECT_EQ(crawler.run(), PoolState::Finished);
    }

    ASSERT_EQ(seen.size(), 2);
    for (const auto& request : seen) {
        // Held by the list and by this test, nothing else.
        EXPECT_EQ(request.use_count(), 2);
        EXPECT_EQ(request->state, RequestState::Handled);
    }
    options.request_list.reset();
    for (const auto& request : seen)
        EXPECT_EQ(request.use_count(), 1);
}

TEST_F(BasicCrawlerTest, LongNonAsciiErrorStillFinishes) {
    auto options                = get_default_options();
    options.max_request_retries = 0;
    options.request_list        = list_of({"https://a.example/"});
    options.request_handler     = [](std::shared_ptr<CrawlingContext>) -> boost::asio::awaitable<void> {
        throw std::runtime_error(std::string(199, 'x') + "\xC3\xA9 tail");
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_EQ(crawler.statistics().requests_failed(), 1);
    EXPECT_EQ(failed["https://a.example/"], 1);
    EXPECT_NO_THROW(crawler.statistics().errors().to_json().dump());
}

TEST_F(BasicCrawlerTest, InvalidUtf8RecordIsStored) {
    auto options            = get_default_options();
    options.dataset         = std::make_shared<Dataset>("test_crawler_out");
    options.request_list    = list_of({"https://a.example/"});
    options.request_handler = [](std::shared_ptr<CrawlingContext> context) -> boost::asio::awaitable<void> {
        context->push_data({{"url", context->request->url}, {"title", std::string("caf\xE9")}});
        co_return;
    };

    BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), PoolState::Finished);
    EXPECT_TRUE(failed.empty());
    ASSERT_EQ(options.dataset->item_count(), 1);
    EXPECT_EQ(options.dataset->read_items()[0]["title"], "caf\xEF\xBF\xBD");
}

TEST_F(BasicCrawlerTest, KeepAliveWaitsForAbort) {
    auto options          = get_default_options();
    options.keep_alive    = true;
    options.request_queue = std::make_shared<RequestQueue>();
    options.request_list  = list_of({"https://a.example/"});

    BasicCrawler crawler(options);
    std::thread  feeder([&crawler]() {
        std::this_thread::sleep_for(300ms);
        std::vector<Request> late{Request("https://late.example/")};
        boost::asio::co_spawn(crawler.pool()->get_executor(), crawler.add_requests(late), boost::asio::detached);
        std::this_thread::sleep_for(400ms);
        crawler.abort();
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(crawler.run(), PoolState::Aborted);
    feeder.join();

    EXPECT_GE(std::chrono::steady_clock::now() - started, 650ms);
    EXPECT_EQ(calls["https://a.example/"], 1);
    EXPECT_EQ(calls["https://late.example/"], 1);
}
