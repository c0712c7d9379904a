#include "interval.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../logger/logger.hpp"

namespace Trawl {
namespace Core {

Interval::Interval(boost::asio::any_io_executor executor,
                   std::chrono::milliseconds    period,
                   Callback                     callback)
    : executor_(std::move(executor)), period_(period), callback_(std::move(callback)) {
}

Interval::~Interval() {
    stop();
}

void Interval::start() {
    if (running())
        return;
    state_ = std::make_shared<State>(executor_, period_, callback_);
    boost::asio::co_spawn(executor_, loop(state_), boost::asio::detached);
}

void Interval::stop() {
    if (!state_)
        return;
    auto state = std::move(state_);
    state->stopped = true;
    boost::asio::dispatch(state->timer.get_executor(), [state]() { state->timer.cancel(); });
}

bool Interval::running() const {
    return state_ && !state_->stopped;
}

boost::asio::awaitable<void> Interval::loop(std::shared_ptr<State> state) {
    while (!state->stopped) {
        state->timer.expires_after(state->period);
        boost::system::error_code ec;
        co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (state->stopped)
            co_return;

        try {
            state->callback();
        } catch (const std::exception& e) {
            Logger::error("Interval callback failed: " + std::string(e.what()));
        }
    }
}

}  // namespace Core
}  // namespace Trawl
