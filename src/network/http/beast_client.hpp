#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Trawl {
namespace Network {
namespace Http {

// Plain HTTP/1.1 client over Boost.Beast. Follows up to `max_redirects`
// redirects; transport failures are reported in the Response, not thrown.
class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_max_redirects(int max_redirects);
    boost::asio::awaitable<Response> get(const std::string& url) override;
    boost::asio::awaitable<Response> head(const std::string& url) override;

private:
    std::chrono::milliseconds connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MILLIS};
    int                       max_redirects_ = 5;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> do_request(boost::beast::http::verb method, std::string url);
    boost::asio::awaitable<Response> do_request_once(boost::beast::http::verb method, std::string url);

    struct Endpoint {
        std::string host;
        std::string port;
        std::string target;
        bool        tls = false;
    };

    boost::asio::awaitable<Response> fetch_plain(const Endpoint& endpoint, boost::beast::http::verb method);
    boost::asio::awaitable<Response> fetch_tls(const Endpoint& endpoint, boost::beast::http::verb method);
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
