#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Trawl {
namespace Storage {

enum class RequestState { Available, InFlight, Handled };

// One unit of crawlable work together with its retry ledger.
struct Request {
    Request() = default;
    explicit Request(std::string url, std::optional<std::string> unique_key = std::nullopt);

    std::string        url;
    std::string        unique_key;
    std::string        method      = "GET";
    int                retry_count = 0;
    std::optional<int> max_retries;  // overrides the crawler-wide limit
    bool               no_retry = false;
    int                depth    = 0;
    RequestState       state    = RequestState::Available;

    // Selects the Router handler; empty goes to the default handler.
    std::string label;

    std::vector<std::string> error_messages;
    nlohmann::json           user_data = nlohmann::json::object();

    void push_error_message(const std::string& message) {
        error_messages.push_back(message);
    }

    nlohmann::json to_json() const;
};

std::string to_string(RequestState state);

}  // namespace Storage
}  // namespace Trawl
