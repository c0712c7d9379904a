#include "page_handler.hpp"
#include <set>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/converter.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

using Network::Http::Response;
using Utils::Url;
using Utils::Text::Converter;

PageHandler::PageHandler(std::shared_ptr<Network::Http::HttpClient> client, bool same_domain)
    : client_(std::move(client)), same_domain_(same_domain) {
}

boost::asio::awaitable<void> PageHandler::operator()(std::shared_ptr<CrawlingContext> context) const {
    auto     request  = context->request;
    Response response = co_await client_->get(request->url);

    if (response.is_rate_limited()) {
        context->report_client_error();
        throw std::runtime_error("Rate limited (HTTP 429) on " + request->url);
    }
    if (!response.error.empty())
        throw std::runtime_error("Request failed for " + request->url + ": " + response.error);
    if (response.status_code >= 500)
        throw std::runtime_error("Server error " + std::to_string(response.status_code) + " on " + request->url);
    if (response.status_code >= 400)
        throw NonRetryableError("HTTP " + std::to_string(response.status_code) + " on " + request->url);

    const bool is_html = response.content_type.find("html") != std::string::npos;

    nlohmann::json record = {
        {"url", request->url},
        {"loadedUrl", response.effective_url},
        {"statusCode", response.status_code},
        {"contentType", response.content_type},
        {"depth", request->depth},
    };

    if (is_html) {
        record["title"]    = Converter::extract_title(response.body);
        record["markdown"] = Converter::to_markdown(response.body);

        auto links = collect_links(response.effective_url, response.body);
        if (!links.empty()) {
            auto        results = co_await context->add_requests(std::move(links));
            std::size_t added = 0;
            for (const auto& result : results) {
                if (!result.was_already_present)
                    ++added;
            }
            Logger::debug("PageHandler: " + std::to_string(added) + " new link(s) from " + request->url);
        }
    }

    context->push_data(record);
    Logger::success("Saved: " + request->url);
}

std::vector<std::string> PageHandler::collect_links(const std::string& page_url, const std::string& html) const {
    std::vector<std::string> links;
    std::set<std::string>    seen;
    for (const auto& href : Converter::extract_links(html)) {
        std::string absolute = Url::resolve(page_url, href);
        if (absolute.empty() || !Url::is_http(absolute))
            continue;

        auto fragment = absolute.find('#');
        if (fragment != std::string::npos)
            absolute = absolute.substr(0, fragment);

        if (same_domain_ && !Url::is_same_domain(page_url, absolute))
            continue;
        if (seen.insert(absolute).second)
            links.push_back(absolute);
    }
    return links;
}

}  // namespace Engine
}  // namespace Trawl
