#include "beast_client.hpp"
#include <utility>
#include <boost/algorithm/string/predicate.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {
template <typename Body>
void fill_response(Response& response, http::response<Body>& res) {
    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = (response.status_code >= 200 && response.status_code < 300);
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto location = res.find(http::field::location);
    if (location != res.end())
        response.location = std::string(location->value());
}

// One request/response round trip on an already connected stream.
template <typename Stream>
net::awaitable<Response> exchange(Stream& stream, http::verb method, const std::string& host, const std::string& target) {
    http::request<http::empty_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, Trawl::Core::Constants::USER_AGENT);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                      buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    parser.skip(method == http::verb::head);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    Response response;
    auto     res = parser.release();
    fill_response(response, res);
    co_return response;
}
}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_max_redirects(int max_redirects) {
    max_redirects_ = max_redirects;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    co_return co_await do_request(http::verb::get, url);
}

net::awaitable<Response> BeastClient::head(const std::string& url) {
    co_return co_await do_request(http::verb::head, url);
}

net::awaitable<Response> BeastClient::do_request(http::verb method, std::string url) {
    Response response = co_await do_request_once(method, url);
    for (int hop = 0; hop < max_redirects_ && response.is_redirect(); ++hop) {
        url = Trawl::Utils::Url::resolve(url, response.location);
        if (url.empty() || !Trawl::Utils::Url::is_http(url))
            break;
        Trawl::Core::Logger::debug("BeastClient: redirected to " + url);
        response = co_await do_request_once(method, url);
    }
    co_return response;
}

net::awaitable<Response> BeastClient::do_request_once(http::verb method, std::string url) {
    Response failed;
    failed.effective_url = url;
    failed.error_type    = ErrorType::Other;

    auto parsed = Trawl::Utils::Url::parse(url);
    if (parsed.host.empty() || !Trawl::Utils::Url::is_http(url)) {
        failed.error = "Invalid URL";
        co_return failed;
    }

    Endpoint endpoint;
    endpoint.tls    = boost::algorithm::iequals(parsed.scheme, "https");
    endpoint.host   = parsed.host;
    endpoint.port   = !parsed.port.empty() ? parsed.port : (endpoint.tls ? "443" : "80");
    endpoint.target = parsed.path;
    if (!parsed.query.empty())
        endpoint.target += "?" + parsed.query;

    try {
        Response response;
        if (endpoint.tls)
            response = co_await fetch_tls(endpoint, method);
        else
            response = co_await fetch_plain(endpoint, method);
        response.effective_url = url;
        co_return response;
    } catch (const beast::system_error& e) {
        failed.error      = e.what();
        failed.error_type = e.code() == beast::error::timeout ? ErrorType::Timeout : ErrorType::Network;
    } catch (const std::exception& e) {
        failed.error      = e.what();
        failed.error_type = ErrorType::Network;
    }
    co_return failed;
}

net::awaitable<Response> BeastClient::fetch_plain(const Endpoint& endpoint, http::verb method) {
    auto          executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto          results = co_await resolver.async_resolve(endpoint.host, endpoint.port, net::use_awaitable);

    beast::tcp_stream stream(executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(std::chrono::seconds(Trawl::Core::Constants::REQUEST_TIMEOUT_SECONDS));
    Response response = co_await exchange(stream, method, endpoint.host, endpoint.target);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::fetch_tls(const Endpoint& endpoint, http::verb method) {
    auto          executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto          results = co_await resolver.async_resolve(endpoint.host, endpoint.port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    auto& layer = beast::get_lowest_layer(stream);
    layer.expires_after(connect_timeout_);
    co_await layer.async_connect(results, net::use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    layer.expires_after(std::chrono::seconds(Trawl::Core::Constants::REQUEST_TIMEOUT_SECONDS));
    Response response = co_await exchange(stream, method, endpoint.host, endpoint.target);

    // Servers commonly drop the connection without a close_notify.
    beast::error_code ec;
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
