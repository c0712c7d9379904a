#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "request_source.hpp"

namespace Trawl {
namespace Storage {

struct AddRequestResult {
    std::string              unique_key;
    bool                     was_already_present = false;
    bool                     was_already_handled = false;
    std::shared_ptr<Request> request;
};

// Dynamic in-memory queue. Requests are deduplicated by unique key for the
// whole lifetime of the queue, handled ones included.
class RequestQueue : public RequestSource {
public:
    RequestQueue() = default;

    boost::asio::awaitable<AddRequestResult> add_request(Request request, bool forefront = false);
    boost::asio::awaitable<std::vector<AddRequestResult>> add_requests(std::vector<Request> requests,
                                                                       bool                 forefront = false);

    boost::asio::awaitable<std::shared_ptr<Request>> fetch_next_request() override;
    boost::asio::awaitable<void> mark_request_handled(std::shared_ptr<Request> request) override;
    boost::asio::awaitable<void> reclaim_request(std::shared_ptr<Request> request, bool forefront) override;
    boost::asio::awaitable<bool> is_empty() override;
    boost::asio::awaitable<bool> is_finished() override;

    std::size_t handled_count() const override;
    std::size_t total_count() const;
    std::size_t pending_count() const;
    std::size_t in_progress_count() const;

private:
    AddRequestResult add(Request request, bool forefront);

    mutable std::mutex                              mutex_;
    std::map<std::string, std::shared_ptr<Request>> requests_;
    std::deque<std::string>                         pending_;
    std::set<std::string>                           in_progress_;
    std::size_t                                     handled_ = 0;
};

}  // namespace Storage
}  // namespace Trawl
