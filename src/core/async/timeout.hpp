#pragma once
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include "../errors/errors.hpp"
#include "../logger/logger.hpp"
#include "../types/constants.hpp"

namespace Trawl {
namespace Core {

namespace detail {

template <typename T>
struct TimeoutState {
    explicit TimeoutState(const boost::asio::any_io_executor& executor) : timer(executor) {
    }

    boost::asio::steady_timer timer;
    bool                      done = false;
    std::exception_ptr        error;
    std::optional<T>          value;
};

template <>
struct TimeoutState<void> {
    explicit TimeoutState(const boost::asio::any_io_executor& executor) : timer(executor) {
    }

    boost::asio::steady_timer timer;
    bool                      done = false;
    std::exception_ptr        error;
};

template <typename T>
boost::asio::awaitable<T> timeout_body(boost::asio::awaitable<T>  operation,
                                       std::chrono::milliseconds timeout,
                                       std::string               message) {
    if (timeout.count() <= 0) {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(operation);
            co_return;
        }
        else {
            co_return co_await std::move(operation);
        }
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto state    = std::make_shared<detail::TimeoutState<T>>(executor);
    state->timer.expires_after(timeout);

    if constexpr (std::is_void_v<T>) {
        boost::asio::co_spawn(executor, std::move(operation), [state](std::exception_ptr error) {
            state->done  = true;
            state->error = error;
            state->timer.cancel();
        });
    }
    else {
        boost::asio::co_spawn(
            executor, std::move(operation), [state](std::exception_ptr error, T value) {
                state->done  = true;
                state->error = error;
                if (!error)
                    state->value.emplace(std::move(value));
                state->timer.cancel();
            });
    }

    boost::system::error_code ec;
    if (!state->done) {
        co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!state->done)
        throw TimeoutError(message);
    if (state->error)
        std::rethrow_exception(state->error);

    if constexpr (!std::is_void_v<T>) {
        co_return std::move(*state->value);
    }
}

template <typename T, typename Operation>
boost::asio::awaitable<T> retry_body(Operation                 operation,
                                     std::chrono::milliseconds timeout,
                                     std::string               message,
                                     int                       max_retries) {
    for (int attempt = 1;; ++attempt) {
        try {
            if constexpr (std::is_void_v<T>) {
                co_await timeout_body(operation(), timeout, message);
                co_return;
            }
            else {
                co_return co_await timeout_body(operation(), timeout, message);
            }
        } catch (const std::exception& e) {
            if (attempt > max_retries)
                throw;
            Logger::warn(std::string(e.what()) + " (retrying " + std::to_string(attempt) + "/"
                         + std::to_string(max_retries) + ")");
        }
    }
}

}  // namespace detail

// The public entry points are plain functions that hand already typed
// objects to the coroutine bodies. GCC 12 destroys a converted temporary
// bound to a coroutine parameter twice (a lambda converted to std::function,
// a literal converted to std::string), so no conversion may happen at the
// coroutine call itself.

// Runs `operation` on the current executor and throws TimeoutError carrying
// `message` if it has not completed within `timeout`. A non-positive timeout
// disables the limit. The operation is not cancelled on timeout; it keeps
// running detached and its result is dropped, so it must own everything it
// touches. The current executor must be a strand or single threaded.
template <typename T>
boost::asio::awaitable<T> with_timeout(boost::asio::awaitable<T> operation,
                                       std::chrono::milliseconds timeout,
                                       const std::string&        message) {
    std::string owned = message;
    return detail::timeout_body<T>(std::move(operation), timeout, std::move(owned));
}

// Repeats `operation` under `timeout` until it succeeds, logging a warning per
// failed attempt. The last failure propagates after `max_retries` retries.
template <typename T, typename Operation>
boost::asio::awaitable<T> retry_with_timeout(Operation                 operation,
                                             std::chrono::milliseconds timeout,
                                             const std::string&        message,
                                             int max_retries = Constants::DEFAULT_STORE_OPERATION_RETRIES) {
    std::string owned = message;
    return detail::retry_body<T, Operation>(std::move(operation), timeout, std::move(owned), max_retries);
}

}  // namespace Core
}  // namespace Trawl
