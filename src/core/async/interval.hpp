#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace Trawl {
namespace Core {

// Invokes a callback every `period` on the given executor. The next wait is
// armed only after the callback returns, so a slow callback delays the
// schedule instead of piling up invocations.
class Interval {
public:
    using Callback = std::function<void()>;

    Interval(boost::asio::any_io_executor executor,
             std::chrono::milliseconds    period,
             Callback                     callback);
    ~Interval();

    Interval(const Interval&)            = delete;
    Interval& operator=(const Interval&) = delete;

    void start();
    void stop();
    bool running() const;

    std::chrono::milliseconds period() const {
        return period_;
    }

private:
    struct State {
        State(const boost::asio::any_io_executor& executor,
              std::chrono::milliseconds           period,
              Callback                            callback)
            : timer(executor), period(period), callback(std::move(callback)) {
        }

        boost::asio::steady_timer timer;
        std::chrono::milliseconds period;
        Callback                  callback;
        std::atomic<bool>         stopped{false};
    };

    static boost::asio::awaitable<void> loop(std::shared_ptr<State> state);

    boost::asio::any_io_executor executor_;
    std::chrono::milliseconds    period_;
    Callback                     callback_;
    std::shared_ptr<State>       state_;
};

}  // namespace Core
}  // namespace Trawl
