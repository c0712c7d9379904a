#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "../crawler/crawler.hpp"

namespace Trawl {
namespace Engine {

// Dispatches requests to handlers by Request::label. Copies share their
// routes, so a Router can be registered as the request handler and still
// gain routes afterwards.
class Router {
public:
    Router();

    // Throws std::invalid_argument if the label already has a handler.
    Router& add_handler(const std::string& label, RequestHandler handler);
    Router& add_default_handler(RequestHandler handler);

    // Handler for `label`, else the default one. Throws MissingRouteError
    // when neither exists. The reference stays valid while any copy of
    // this Router lives; routes are never removed.
    const RequestHandler& get_handler(const std::string& label) const;

    boost::asio::awaitable<void> operator()(std::shared_ptr<CrawlingContext> context) const;

private:
    struct Routes {
        std::mutex                            mutex;
        std::map<std::string, RequestHandler> by_label;
        RequestHandler                        fallback;
    };

    std::shared_ptr<Routes> routes_;
};

}  // namespace Engine
}  // namespace Trawl
