#pragma once
#include <stdexcept>
#include <string>

namespace Trawl {
namespace Core {

// Raised when an operation outlives its time budget.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& message) : std::runtime_error(message) {
    }
};

// Always fatal: the crawl stops and run() rethrows it.
class CriticalError : public std::runtime_error {
public:
    explicit CriticalError(const std::string& message) : std::runtime_error(message) {
    }
};

// No Router handler matches a request's label and there is no default.
class MissingRouteError : public CriticalError {
public:
    explicit MissingRouteError(const std::string& message) : CriticalError(message) {
    }
};

// Fails the request immediately, skipping any remaining retries.
class NonRetryableError : public std::runtime_error {
public:
    explicit NonRetryableError(const std::string& message) : std::runtime_error(message) {
    }
};

// Forces a retry even when the retry counter is exhausted.
class RetryRequestError : public std::runtime_error {
public:
    explicit RetryRequestError(const std::string& message = "Request is being retried at the user's request")
        : std::runtime_error(message) {
    }
};

}  // namespace Core
}  // namespace Trawl
