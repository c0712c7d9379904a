#pragma once
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "request_source.hpp"

namespace Trawl {
namespace Storage {

// Fixed, in-memory list of requests. Duplicated unique keys are dropped
// at construction; the first occurrence wins.
class RequestList : public RequestSource {
public:
    explicit RequestList(const std::vector<Request>& requests);
    explicit RequestList(const std::vector<std::string>& urls);

    boost::asio::awaitable<std::shared_ptr<Request>> fetch_next_request() override;
    boost::asio::awaitable<void> mark_request_handled(std::shared_ptr<Request> request) override;
    boost::asio::awaitable<void> reclaim_request(std::shared_ptr<Request> request, bool forefront) override;
    boost::asio::awaitable<bool> is_empty() override;
    boost::asio::awaitable<bool> is_finished() override;

    std::size_t handled_count() const override;
    std::size_t total_count() const;
    std::size_t pending_count() const;

private:
    void add(const Request& request);

    mutable std::mutex                    mutex_;
    std::vector<std::shared_ptr<Request>> requests_;
    std::set<std::string>                 unique_keys_;
    std::deque<std::shared_ptr<Request>>  reclaimed_;
    std::set<std::string>                 in_progress_;
    std::size_t                           next_index_ = 0;
    std::size_t                           handled_    = 0;
};

}  // namespace Storage
}  // namespace Trawl
