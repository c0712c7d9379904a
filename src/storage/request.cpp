#include "request.hpp"
#include "../utils/url/url.hpp"

namespace Trawl {
namespace Storage {

Request::Request(std::string url, std::optional<std::string> unique_key)
    : url(std::move(url)) {
    this->unique_key = unique_key ? *unique_key : Utils::Url::normalize(this->url);
}

nlohmann::json Request::to_json() const {
    nlohmann::json j = {
        {"url", url},
        {"uniqueKey", unique_key},
        {"method", method},
        {"retryCount", retry_count},
        {"noRetry", no_retry},
        {"depth", depth},
        {"state", to_string(state)},
        {"errorMessages", error_messages},
        {"userData", user_data},
    };
    if (max_retries)
        j["maxRetries"] = *max_retries;
    if (!label.empty())
        j["label"] = label;
    return j;
}

std::string to_string(RequestState state) {
    switch (state) {
    case RequestState::Available:
        return "available";
    case RequestState::InFlight:
        return "in_flight";
    case RequestState::Handled:
        return "handled";
    }
    return "unknown";
}

}  // namespace Storage
}  // namespace Trawl
