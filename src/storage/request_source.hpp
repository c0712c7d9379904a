#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <memory>

#include "request.hpp"

namespace Trawl {
namespace Storage {

// Contract of a work store as seen by the crawler. Implementations own the
// request lifecycle: Available -> InFlight -> Handled, or back to Available
// through reclaim_request().
class RequestSource {
public:
    virtual ~RequestSource() = default;

    // Null when nothing is available right now.
    virtual boost::asio::awaitable<std::shared_ptr<Request>> fetch_next_request() = 0;
    virtual boost::asio::awaitable<void> mark_request_handled(std::shared_ptr<Request> request) = 0;
    virtual boost::asio::awaitable<void> reclaim_request(std::shared_ptr<Request> request, bool forefront) = 0;

    // No Available request at the moment.
    virtual boost::asio::awaitable<bool> is_empty() = 0;
    // No request can ever become Available again.
    virtual boost::asio::awaitable<bool> is_finished() = 0;

    virtual std::size_t handled_count() const = 0;
};

}  // namespace Storage
}  // namespace Trawl
