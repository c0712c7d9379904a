#pragma once
#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Trawl {
namespace Engine {

struct ErrorGroup {
    std::string type;
    std::string message;
    std::size_t count = 0;
};

// Counts errors grouped by exception type and message.
class ErrorTracker {
public:
    void add(const std::exception_ptr& error);
    void add(const std::exception& error);

    std::size_t             total() const;
    std::size_t             unique_count() const;
    std::vector<ErrorGroup> most_common(std::size_t limit) const;
    nlohmann::json          to_json() const;
    void                    reset();

private:
    void add(const std::string& type, const std::string& message);

    mutable std::mutex                                         mutex_;
    std::map<std::pair<std::string, std::string>, std::size_t> groups_;
    std::size_t                                                total_ = 0;
};

}  // namespace Engine
}  // namespace Trawl
