#include "error_tracker.hpp"
#include <algorithm>
#include <utility>
#include <boost/core/demangle.hpp>
#include <typeinfo>
#include "../../utils/text/encoding.hpp"

namespace Trawl {
namespace Engine {

namespace {
constexpr std::size_t MAX_MESSAGE_LENGTH = 200;
}

void ErrorTracker::add(const std::exception_ptr& error) {
    if (!error)
        return;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        add(e);
    } catch (...) {
        add("unknown", "non-standard exception");
    }
}

void ErrorTracker::add(const std::exception& error) {
    add(boost::core::demangle(typeid(error).name()), error.what());
}

void ErrorTracker::add(const std::string& type, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string           trimmed = message.size() > MAX_MESSAGE_LENGTH
                                              ? Utils::Text::truncate_utf8(message, MAX_MESSAGE_LENGTH) + "..."
                                              : message;
    ++groups_[{type, trimmed}];
    ++total_;
}

std::size_t ErrorTracker::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::size_t ErrorTracker::unique_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

std::vector<ErrorGroup> ErrorTracker::most_common(std::size_t limit) const {
    std::vector<ErrorGroup> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, count] : groups_) {
            result.push_back({key.first, key.second, count});
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ErrorGroup& a, const ErrorGroup& b) { return a.count > b.count; });
    if (result.size() > limit)
        result.resize(limit);
    return result;
}

nlohmann::json ErrorTracker::to_json() const {
    nlohmann::json groups = nlohmann::json::array();
    for (const auto& group : most_common(unique_count())) {
        groups.push_back({{"type", group.type}, {"message", group.message}, {"count", group.count}});
    }
    return groups;
}

void ErrorTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.clear();
    total_ = 0;
}

}  // namespace Engine
}  // namespace Trawl
