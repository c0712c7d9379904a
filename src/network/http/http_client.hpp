#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>

namespace Trawl {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Other };

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string location;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;

    bool is_rate_limited() const {
        return status_code == 429;
    }
    bool is_redirect() const {
        return status_code >= 300 && status_code < 400 && !location.empty();
    }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual boost::asio::awaitable<Response> get(const std::string& url)  = 0;
    virtual boost::asio::awaitable<Response> head(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
