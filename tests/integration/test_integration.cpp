#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#ifndef CPPCHECK
#include <gtest/gtest.h>
#else
#define TEST(a, b) void a##_##b()
#define TEST_F(a, b) void a##_##b()
#define EXPECT_EQ(a, b)
#define EXPECT_TRUE(a)
#define EXPECT_FALSE(a)
#define EXPECT_GE(a, b)
namespace testing { class Test {}; }
#endif
#include <httplib.h>
#include <set>
#include <thread>
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/handlers/page_handler.hpp"
#include "network/http/beast_client.hpp"

namespace fs = std::filesystem;
using namespace Trawl;

class TestServer {
public:
    TestServer() {
    }

    void set_route(const std::string& path,
                   const std::string& content,
                   const std::string& type = "text/html") {
        server_.Get(path, [content, type](const httplib::Request&, httplib::Response& res) {
            res.set_content(content, type.c_str());
        });
    }

    // Answers `failures` times with `status` before serving `content`.
    void set_flaky_route(const std::string& path, int status, int failures, const std::string& content) {
        auto hits = std::make_shared<std::atomic<int>>(0);
        hit_counters_[path] = hits;
        server_.Get(path, [hits, status, failures, content](const httplib::Request&, httplib::Response& res) {
            if (++(*hits) <= failures) {
                res.status = status;
                res.set_content("unavailable", "text/plain");
                return;
            }
            res.set_content(content, "text/html");
        });
    }

    int hits(const std::string& path) const {
        auto it = hit_counters_.find(path);
        return it == hit_counters_.end() ? 0 : it->second->load();
    }

    void start(int port, const std::string& host = "127.0.0.1") {
        port_   = port;
        host_   = host;
        thread_ = std::thread([this, host, port]() { server_.listen(host.c_str(), port); });
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    void stop() {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    std::string url() const {
        return "http://" + host_ + ":" + std::to_string(port_);
    }

private:
    httplib::Server                                          server_;
    std::thread                                              thread_;
    int                                                      port_ = 0;
    std::string                                              host_ = "127.0.0.1";
    std::map<std::string, std::shared_ptr<std::atomic<int>>> hit_counters_;
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_INFO);
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
        fs::create_directory("test_output");
    }

    void TearDown() override {
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
    }

    Engine::CrawlerOptions make_options(const std::string& start_url, int max_depth, bool same_domain = true) {
        Engine::CrawlerOptions options;
        options.pool.max_concurrency = 4;
        options.pool.logging_interval_secs.reset();
        options.max_depth               = max_depth;
        options.max_request_retries     = 2;
        options.stats_log_interval_secs = 0;
        options.request_queue           = std::make_shared<Storage::RequestQueue>();
        options.request_list            = std::make_shared<Storage::RequestList>(std::vector<std::string>{start_url});
        options.dataset                 = std::make_shared<Storage::Dataset>("test_output");

        auto client = std::make_shared<Network::Http::BeastClient>();
        client->set_connect_timeout(std::chrono::milliseconds(2000));
        options.request_handler = Engine::PageHandler(client, same_domain);
        return options;
    }

    static std::set<std::string> stored_urls(const Storage::Dataset& dataset) {
        std::set<std::string> urls;
        for (const auto& item : dataset.read_items())
            urls.insert(item["url"].get<std::string>());
        return urls;
    }
};

TEST_F(IntegrationTest, BasicCrawlDiscovery) {
    TestServer server;
    server.set_route("/", "<html><head><title>Home</title></head><body><a href='/a'>A</a></body></html>");
    server.set_route("/a", "<html><body><a href='/b'>B</a><a href='/'>Home</a></body></html>");
    server.set_route("/b", "<html><body>Done</body></html>");
    server.start(8091);

    auto                 options = make_options(server.url() + "/", 2);
    Engine::BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), Autoscaling::PoolState::Finished);

    auto urls = stored_urls(*options.dataset);
    EXPECT_EQ(urls.size(), 3);
    EXPECT_TRUE(urls.count(server.url() + "/"));
    EXPECT_TRUE(urls.count(server.url() + "/a"));
    EXPECT_TRUE(urls.count(server.url() + "/b"));

    auto items = options.dataset->read_items();
    for (const auto& item : items) {
        EXPECT_EQ(item["statusCode"], 200);
        if (item["url"] == server.url() + "/")
            EXPECT_EQ(item["title"], "Home");
    }

    server.stop();
}

TEST_F(IntegrationTest, DepthLimit) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/a'>A</a></body></html>");
    server.set_route("/a", "<html><body><a href='/b'>B</a></body></html>");
    server.set_route("/b", "<html><body>Too deep</body></html>");
    server.start(8092);

    auto                 options = make_options(server.url() + "/", 1);
    Engine::BasicCrawler crawler(options);
    crawler.run();

    auto urls = stored_urls(*options.dataset);
    EXPECT_EQ(urls.size(), 2);
    EXPECT_FALSE(urls.count(server.url() + "/b"));

    server.stop();
}

TEST_F(IntegrationTest, DomainRestriction) {
    TestServer server1;
    server1.set_route("/", "<html><body><a href='http://localhost:8094/ext'>External</a></body></html>");
    server1.start(8093, "127.0.0.1");

    TestServer server2;
    server2.set_route("/ext", "<html><body>External Page</body></html>");
    server2.start(8094, "localhost");

    auto                 options = make_options(server1.url() + "/", 1);
    Engine::BasicCrawler crawler(options);
    crawler.run();

    auto urls = stored_urls(*options.dataset);
    EXPECT_EQ(urls.size(), 1);
    EXPECT_FALSE(urls.count("http://localhost:8094/ext"));

    server1.stop();
    server2.stop();
}

TEST_F(IntegrationTest, RetryLogic) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/flaky'>Flaky</a></body></html>");
    server.set_flaky_route("/flaky", 503, 1, "<html><body>Success after retry</body></html>");
    server.start(8095);

    auto                 options = make_options(server.url() + "/", 1);
    Engine::BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), Autoscaling::PoolState::Finished);

    EXPECT_EQ(server.hits("/flaky"), 2);
    EXPECT_TRUE(stored_urls(*options.dataset).count(server.url() + "/flaky"));
    EXPECT_EQ(crawler.statistics().requests_finished(), 2);
    EXPECT_EQ(crawler.statistics().requests_retries(), 1);

    server.stop();
}

TEST_F(IntegrationTest, NotFoundIsNotRetried) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/missing'>Missing</a></body></html>");
    server.set_flaky_route("/missing", 404, 100, "");
    server.start(8096);

    auto                 options = make_options(server.url() + "/", 1);
    Engine::BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), Autoscaling::PoolState::Finished);

    EXPECT_EQ(server.hits("/missing"), 1);
    EXPECT_EQ(crawler.statistics().requests_failed(), 1);
    EXPECT_FALSE(stored_urls(*options.dataset).count(server.url() + "/missing"));

    server.stop();
}

TEST_F(IntegrationTest, RateLimitedPagesAreRetried) {
    TestServer server;
    server.set_flaky_route("/", 429, 100, "");
    server.start(8097);

    auto options                = make_options(server.url() + "/", 0);
    options.max_request_retries = 1;
    Engine::BasicCrawler crawler(options);
    EXPECT_EQ(crawler.run(), Autoscaling::PoolState::Finished);

    EXPECT_EQ(server.hits("/"), 2);
    EXPECT_EQ(crawler.statistics().requests_failed(), 1);
    EXPECT_GE(crawler.pool()->snapshotter().client_errors(), 2u);

    server.stop();
}
