#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>

#include "../../network/http/http_client.hpp"
#include "../crawler/crawler.hpp"

namespace Trawl {
namespace Engine {

// Request handler for plain HTTP crawls: downloads the page, stores one
// record per page in the dataset and enqueues the links it finds.
class PageHandler {
public:
    PageHandler(std::shared_ptr<Network::Http::HttpClient> client, bool same_domain);

    boost::asio::awaitable<void> operator()(std::shared_ptr<CrawlingContext> context) const;

private:
    std::vector<std::string> collect_links(const std::string& page_url, const std::string& html) const;

    std::shared_ptr<Network::Http::HttpClient> client_;
    bool                                       same_domain_;
};

}  // namespace Engine
}  // namespace Trawl
