#include "request_list.hpp"
#include <stdexcept>

namespace Trawl {
namespace Storage {

RequestList::RequestList(const std::vector<Request>& requests) {
    for (const auto& request : requests) {
        add(request);
    }
}

RequestList::RequestList(const std::vector<std::string>& urls) {
    for (const auto& url : urls) {
        add(Request(url));
    }
}

void RequestList::add(const Request& request) {
    if (request.url.empty())
        throw std::invalid_argument("RequestList: request url must not be empty");
    if (!unique_keys_.insert(request.unique_key).second)
        return;
    requests_.push_back(std::make_shared<Request>(request));
}

boost::asio::awaitable<std::shared_ptr<Request>> RequestList::fetch_next_request() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<Request> request;
    if (!reclaimed_.empty()) {
        request = reclaimed_.front();
        reclaimed_.pop_front();
    }
    else if (next_index_ < requests_.size()) {
        request = requests_[next_index_++];
    }
    else {
        co_return nullptr;
    }

    request->state = RequestState::InFlight;
    in_progress_.insert(request->unique_key);
    co_return request;
}

boost::asio::awaitable<void> RequestList::mark_request_handled(std::shared_ptr<Request> request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_progress_.erase(request->unique_key) == 0)
        throw std::logic_error("RequestList: cannot mark a request that is not in progress: " + request->unique_key);
    request->state = RequestState::Handled;
    ++handled_;
    co_return;
}

boost::asio::awaitable<void> RequestList::reclaim_request(std::shared_ptr<Request> request, bool forefront) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_progress_.erase(request->unique_key) == 0)
        throw std::logic_error("RequestList: cannot reclaim a request that is not in progress: " + request->unique_key);
    request->state = RequestState::Available;
    if (forefront)
        reclaimed_.push_front(request);
    else
        reclaimed_.push_back(request);
    co_return;
}

boost::asio::awaitable<bool> RequestList::is_empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return reclaimed_.empty() && next_index_ >= requests_.size();
}

boost::asio::awaitable<bool> RequestList::is_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return reclaimed_.empty() && next_index_ >= requests_.size() && in_progress_.empty();
}

std::size_t RequestList::handled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handled_;
}

std::size_t RequestList::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::size_t RequestList::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reclaimed_.size() + (requests_.size() - next_index_);
}

}  // namespace Storage
}  // namespace Trawl
