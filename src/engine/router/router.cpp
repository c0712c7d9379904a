#include "router.hpp"
#include <stdexcept>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

Router::Router() : routes_(std::make_shared<Routes>()) {
}

Router& Router::add_handler(const std::string& label, RequestHandler handler) {
    if (label.empty())
        throw std::invalid_argument("Router: labels must not be empty, use add_default_handler");
    if (!handler)
        throw std::invalid_argument("Router: handler for '" + label + "' is empty");

    std::lock_guard<std::mutex> lock(routes_->mutex);
    if (!routes_->by_label.emplace(label, std::move(handler)).second)
        throw std::invalid_argument("Router: route for label '" + label + "' is already defined");
    return *this;
}

Router& Router::add_default_handler(RequestHandler handler) {
    if (!handler)
        throw std::invalid_argument("Router: default handler is empty");

    std::lock_guard<std::mutex> lock(routes_->mutex);
    if (routes_->fallback)
        throw std::invalid_argument("Router: default route is already defined");
    routes_->fallback = std::move(handler);
    return *this;
}

const RequestHandler& Router::get_handler(const std::string& label) const {
    std::lock_guard<std::mutex> lock(routes_->mutex);
    if (!label.empty()) {
        auto it = routes_->by_label.find(label);
        if (it != routes_->by_label.end())
            return it->second;
    }
    if (routes_->fallback)
        return routes_->fallback;

    if (label.empty())
        throw MissingRouteError("Router: no default route set up");
    throw MissingRouteError("Router: route not found for label '" + label + "' and no default route set up");
}

// Not a coroutine: a missing route throws from the call itself, which the
// crawler treats like a handler failure.
boost::asio::awaitable<void> Router::operator()(std::shared_ptr<CrawlingContext> context) const {
    const auto& request = *context->request;
    Logger::debug("Router: " + request.url + (request.label.empty() ? "" : " [" + request.label + "]"));
    return get_handler(request.label)(std::move(context));
}

}  // namespace Engine
}  // namespace Trawl
