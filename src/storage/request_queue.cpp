#include "request_queue.hpp"
#include <stdexcept>

namespace Trawl {
namespace Storage {

AddRequestResult RequestQueue::add(Request request, bool forefront) {
    if (request.url.empty())
        throw std::invalid_argument("RequestQueue: request url must not be empty");

    AddRequestResult result;
    result.unique_key = request.unique_key;

    auto it = requests_.find(request.unique_key);
    if (it != requests_.end()) {
        result.was_already_present = true;
        result.was_already_handled = it->second->state == RequestState::Handled;
        result.request             = it->second;
        return result;
    }

    request.state  = RequestState::Available;
    auto stored    = std::make_shared<Request>(std::move(request));
    result.request = stored;
    requests_.emplace(stored->unique_key, stored);
    if (forefront)
        pending_.push_front(stored->unique_key);
    else
        pending_.push_back(stored->unique_key);
    return result;
}

boost::asio::awaitable<AddRequestResult> RequestQueue::add_request(Request request, bool forefront) {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return add(std::move(request), forefront);
}

boost::asio::awaitable<std::vector<AddRequestResult>> RequestQueue::add_requests(std::vector<Request> requests,
                                                                                 bool                 forefront) {
    std::lock_guard<std::mutex>   lock(mutex_);
    std::vector<AddRequestResult> results;
    results.reserve(requests.size());
    for (auto& request : requests) {
        results.push_back(add(std::move(request), forefront));
    }
    co_return results;
}

boost::asio::awaitable<std::shared_ptr<Request>> RequestQueue::fetch_next_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_.empty()) {
        const std::string key = pending_.front();
        pending_.pop_front();

        auto it = requests_.find(key);
        if (it == requests_.end() || it->second->state != RequestState::Available)
            continue;

        it->second->state = RequestState::InFlight;
        in_progress_.insert(key);
        co_return it->second;
    }
    co_return nullptr;
}

boost::asio::awaitable<void> RequestQueue::mark_request_handled(std::shared_ptr<Request> request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_progress_.erase(request->unique_key) == 0)
        throw std::logic_error("RequestQueue: cannot mark a request that is not in progress: " + request->unique_key);

    auto it = requests_.find(request->unique_key);
    if (it != requests_.end() && it->second != request)
        *it->second = *request;
    request->state = RequestState::Handled;
    if (it != requests_.end())
        it->second->state = RequestState::Handled;
    ++handled_;
    co_return;
}

boost::asio::awaitable<void> RequestQueue::reclaim_request(std::shared_ptr<Request> request, bool forefront) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_progress_.erase(request->unique_key) == 0)
        throw std::logic_error("RequestQueue: cannot reclaim a request that is not in progress: " + request->unique_key);

    auto it = requests_.find(request->unique_key);
    if (it == requests_.end()) {
        it = requests_.emplace(request->unique_key, request).first;
    }
    else if (it->second != request) {
        *it->second = *request;
    }
    it->second->state = RequestState::Available;
    request->state    = RequestState::Available;

    if (forefront)
        pending_.push_front(request->unique_key);
    else
        pending_.push_back(request->unique_key);
    co_return;
}

boost::asio::awaitable<bool> RequestQueue::is_empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return pending_.empty();
}

boost::asio::awaitable<bool> RequestQueue::is_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return pending_.empty() && in_progress_.empty();
}

std::size_t RequestQueue::handled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handled_;
}

std::size_t RequestQueue::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::size_t RequestQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t RequestQueue::in_progress_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_progress_.size();
}

}  // namespace Storage
}  // namespace Trawl
