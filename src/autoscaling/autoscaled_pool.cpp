#include "autoscaled_pool.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include <nlohmann/json.hpp>
#include <numeric>
#include <stdexcept>

#include "../core/async/timeout.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/encoding.hpp"

namespace Trawl {
namespace Autoscaling {

using Core::Logger;

namespace {
std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

void validate(const AutoscaledPoolOptions& options) {
    if (options.min_concurrency < 1)
        throw std::invalid_argument("AutoscaledPool: min_concurrency must be at least 1");
    if (options.max_concurrency < options.min_concurrency)
        throw std::invalid_argument("AutoscaledPool: max_concurrency must not be lower than min_concurrency");
    if (options.desired_concurrency
        && (*options.desired_concurrency < options.min_concurrency
            || *options.desired_concurrency > options.max_concurrency))
        throw std::invalid_argument("AutoscaledPool: desired_concurrency must be within [min, max]");
    if (options.desired_concurrency_ratio <= 0 || options.desired_concurrency_ratio > 1)
        throw std::invalid_argument("AutoscaledPool: desired_concurrency_ratio must be in (0, 1]");
    if (options.scale_up_step_ratio <= 0 || options.scale_up_step_ratio > 1
        || options.scale_down_step_ratio <= 0 || options.scale_down_step_ratio > 1)
        throw std::invalid_argument("AutoscaledPool: step ratios must be in (0, 1]");
    if (options.maybe_run_interval_secs <= 0 || options.autoscale_interval_secs <= 0)
        throw std::invalid_argument("AutoscaledPool: intervals must be positive");
    if (options.task_timeout_secs < 0)
        throw std::invalid_argument("AutoscaledPool: task_timeout_secs must not be negative");
    if (options.max_tasks_per_minute < 0)
        throw std::invalid_argument("AutoscaledPool: max_tasks_per_minute must not be negative");
}
}  // namespace

std::string to_string(PoolState state) {
    switch (state) {
    case PoolState::Idle:
        return "idle";
    case PoolState::Running:
        return "running";
    case PoolState::Pausing:
        return "pausing";
    case PoolState::Paused:
        return "paused";
    case PoolState::Finished:
        return "finished";
    case PoolState::Aborted:
        return "aborted";
    case PoolState::Errored:
        return "errored";
    }
    return "unknown";
}

AutoscaledPool::AutoscaledPool(boost::asio::any_io_executor executor,
                               PoolTaskSource&              source,
                               AutoscaledPoolOptions        options)
    : strand_(boost::asio::make_strand(executor)),
      source_(source),
      options_((validate(options), options)),
      snapshotter_(strand_, options_.snapshotter, options_.probe),
      system_status_(snapshotter_, options_.system_status),
      desired_(options_.desired_concurrency.value_or(options_.min_concurrency)),
      min_(options_.min_concurrency),
      max_(options_.max_concurrency),
      settle_timer_(strand_),
      maybe_run_interval_(strand_, Core::to_millis(options_.maybe_run_interval_secs),
                          [this]() { trigger_admission(); }),
      autoscale_interval_(strand_, Core::to_millis(options_.autoscale_interval_secs), [this]() { autoscale(); }),
      rate_interval_(strand_, std::chrono::seconds(1), [this]() { rotate_rate_window(); }) {
    if (options_.logging_interval_secs && *options_.logging_interval_secs > 0) {
        logging_interval_.emplace(strand_, Core::to_millis(*options_.logging_interval_secs),
                                  [this]() { log_state(); });
    }
}

AutoscaledPool::~AutoscaledPool() {
    stop_timers();
}

boost::asio::awaitable<PoolState> AutoscaledPool::run() {
    auto self = shared_from_this();
    if (state_ == PoolState::Aborted)
        co_return PoolState::Aborted;
    if (state_ != PoolState::Idle)
        throw std::logic_error("AutoscaledPool: run() may only be called once");

    state_ = PoolState::Running;
    Logger::info("AutoscaledPool: starting with desired concurrency " + std::to_string(desired_) + " (min "
                 + std::to_string(min_) + ", max " + std::to_string(max_) + ")");

    snapshotter_.start();
    maybe_run_interval_.start();
    autoscale_interval_.start();
    if (options_.max_tasks_per_minute > 0)
        rate_interval_.start();
    if (logging_interval_)
        logging_interval_->start();

    trigger_admission();

    while (!is_settled()) {
        settle_timer_.expires_at(boost::asio::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await settle_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    stop_timers();

    const PoolState final_state = state_;
    if (final_state == PoolState::Errored)
        std::rethrow_exception(fatal_error_);

    Logger::info("AutoscaledPool: " + to_string(final_state));
    co_return final_state;
}

void AutoscaledPool::abort() {
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self]() {
        const PoolState state = self->state_;
        if (state == PoolState::Finished || state == PoolState::Aborted || state == PoolState::Errored)
            return;
        self->state_ = PoolState::Aborted;
        Logger::info("AutoscaledPool: aborted with " + std::to_string(self->current_) + " task(s) in flight");
        self->stop_timers();
        self->notify_settled();
    });
}

void AutoscaledPool::pause() {
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self]() {
        if (self->state_ != PoolState::Running)
            return;
        self->state_ = self->current_ > 0 ? PoolState::Pausing : PoolState::Paused;
        Logger::info("AutoscaledPool: " + to_string(self->state_));
    });
}

void AutoscaledPool::resume() {
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self]() {
        if (self->state_ != PoolState::Pausing && self->state_ != PoolState::Paused)
            return;
        self->state_ = PoolState::Running;
        Logger::info("AutoscaledPool: resumed");
        self->trigger_admission();
    });
}

void AutoscaledPool::set_min_concurrency(int value) {
    if (value < 1 || value > max_)
        throw std::invalid_argument("AutoscaledPool: min_concurrency must be within [1, max]");
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self, value]() {
        self->min_ = value;
        if (self->desired_ < value)
            self->desired_ = value;
        self->trigger_admission();
    });
}

void AutoscaledPool::set_max_concurrency(int value) {
    if (value < min_)
        throw std::invalid_argument("AutoscaledPool: max_concurrency must not be lower than min_concurrency");
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self, value]() {
        self->max_ = value;
        if (self->desired_ > value)
            self->desired_ = value;
    });
}

void AutoscaledPool::set_desired_concurrency(int value) {
    if (value < min_ || value > max_)
        throw std::invalid_argument("AutoscaledPool: desired_concurrency must be within [min, max]");
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self, value]() {
        self->desired_ = value;
        self->trigger_admission();
    });
}

void AutoscaledPool::trigger_admission() {
    if (state_ != PoolState::Running)
        return;
    if (admitting_) {
        admission_pending_ = true;
        return;
    }
    admitting_ = true;
    boost::asio::co_spawn(strand_, admit(shared_from_this()), boost::asio::detached);
}

boost::asio::awaitable<void> AutoscaledPool::admit(std::shared_ptr<AutoscaledPool> self) {
    do {
        self->admission_pending_ = false;

        while (self->state_ == PoolState::Running && self->current_ < self->desired_) {
            if (self->current_ >= self->min_ && !self->system_status_.current_status().is_healthy) {
                Logger::debug("AutoscaledPool: system is overloaded, holding admission");
                break;
            }
            if (self->is_rate_limited()) {
                Logger::debug("AutoscaledPool: max_tasks_per_minute reached, holding admission");
                break;
            }

            bool               ready = false;
            std::exception_ptr error;
            try {
                ready = co_await self->source_.is_task_ready();
            } catch (...) {
                error = std::current_exception();
            }
            if (error) {
                self->fail(error);
                break;
            }

            // Anything may have changed while is_task_ready() was suspended.
            if (self->state_ != PoolState::Running || self->current_ >= self->desired_)
                break;

            if (!ready) {
                co_await maybe_finish(self);
                break;
            }

            ++self->current_;
            // Counted at admission: a task whose source turns out empty still
            // uses up its slot of the per-minute budget.
            if (self->options_.max_tasks_per_minute > 0)
                ++self->started_per_second_[self->rate_slot_];
            boost::asio::co_spawn(self->strand_, run_one(self), boost::asio::detached);
        }
    } while (self->admission_pending_ && self->state_ == PoolState::Running);

    self->admitting_ = false;
}

boost::asio::awaitable<void> AutoscaledPool::maybe_finish(std::shared_ptr<AutoscaledPool> self) {
    if (self->querying_finished_ || self->current_ > 0 || self->state_ != PoolState::Running)
        co_return;

    self->querying_finished_ = true;
    bool               finished = false;
    std::exception_ptr error;
    try {
        finished = co_await self->source_.is_finished();
    } catch (...) {
        error = std::current_exception();
    }
    self->querying_finished_ = false;

    if (error) {
        self->fail(error);
        co_return;
    }

    // A task may have started or the pool may have stopped during the query.
    if (finished && self->state_ == PoolState::Running && self->current_ == 0) {
        self->state_ = PoolState::Finished;
        Logger::info("AutoscaledPool: all tasks finished");
        self->stop_timers();
        self->notify_settled();
    }
}

boost::asio::awaitable<void> AutoscaledPool::run_one(std::shared_ptr<AutoscaledPool> self) {
    TaskResult         result;
    std::exception_ptr error;
    try {
        if (self->options_.task_timeout_secs > 0) {
            result = co_await Core::with_timeout(self->source_.run_task(),
                                                 Core::to_millis(self->options_.task_timeout_secs),
                                                 "AutoscaledPool: task timed out after "
                                                     + std::to_string(self->options_.task_timeout_secs) + " seconds");
        }
        else {
            result = co_await self->source_.run_task();
        }
    } catch (...) {
        error = std::current_exception();
    }

    --self->current_;

    if (!error && result.outcome == TaskOutcome::FatalFailure) {
        error = result.error ? result.error
                             : std::make_exception_ptr(std::runtime_error("AutoscaledPool: task failed fatally"));
    }
    if (error) {
        self->fail(error);
    }
    else if (result.outcome == TaskOutcome::RetryableFailure) {
        Logger::debug("AutoscaledPool: task reported a retryable failure"
                      + (result.error ? ": " + describe(result.error) : std::string()));
    }

    self->on_task_settled();
}

void AutoscaledPool::fail(std::exception_ptr error) {
    const PoolState state = state_;
    if (state == PoolState::Finished || state == PoolState::Aborted || state == PoolState::Errored)
        return;

    fatal_error_ = error;
    state_       = PoolState::Errored;
    Logger::error("AutoscaledPool: task failed, stopping the pool: " + describe(error));
    if (current_ == 0)
        notify_settled();
}

void AutoscaledPool::on_task_settled() {
    switch (state_.load()) {
    case PoolState::Errored:
        if (current_ == 0)
            notify_settled();
        break;
    case PoolState::Pausing:
        if (current_ == 0) {
            state_ = PoolState::Paused;
            Logger::info("AutoscaledPool: paused");
        }
        break;
    case PoolState::Running:
        trigger_admission();
        break;
    default:
        break;
    }
}

void AutoscaledPool::notify_settled() {
    settle_timer_.cancel();
}

bool AutoscaledPool::is_settled() const {
    const PoolState state = state_;
    return state == PoolState::Finished || state == PoolState::Aborted
           || (state == PoolState::Errored && current_ == 0);
}

void AutoscaledPool::stop_timers() {
    maybe_run_interval_.stop();
    autoscale_interval_.stop();
    rate_interval_.stop();
    if (logging_interval_)
        logging_interval_->stop();
    snapshotter_.stop();
}

void AutoscaledPool::autoscale() {
    if (state_ != PoolState::Running)
        return;

    if (!system_status_.current_status().is_healthy) {
        scale_down();
        return;
    }

    const double saturation = static_cast<double>(current_) / static_cast<double>(desired_);
    if (saturation >= options_.desired_concurrency_ratio && system_status_.historical_status().is_healthy)
        scale_up();
}

void AutoscaledPool::scale_up() {
    const int desired = desired_;
    const int step    = std::max(1, static_cast<int>(std::ceil(desired * options_.scale_up_step_ratio)));
    const int next    = std::min(max_.load(), desired + step);
    if (next == desired)
        return;

    desired_ = next;
    Logger::debug("AutoscaledPool: scaling up desired concurrency " + std::to_string(desired) + " -> "
                  + std::to_string(next));
    trigger_admission();
}

void AutoscaledPool::scale_down() {
    const int desired = desired_;
    const int step    = std::max(1, static_cast<int>(std::ceil(desired * options_.scale_down_step_ratio)));
    const int next    = std::max(min_.load(), desired - step);
    if (next == desired)
        return;

    desired_ = next;
    Logger::debug("AutoscaledPool: system is overloaded, scaling down desired concurrency "
                  + std::to_string(desired) + " -> " + std::to_string(next));
}

void AutoscaledPool::rotate_rate_window() {
    rate_slot_                      = (rate_slot_ + 1) % started_per_second_.size();
    started_per_second_[rate_slot_] = 0;
    trigger_admission();
}

bool AutoscaledPool::is_rate_limited() const {
    if (options_.max_tasks_per_minute <= 0)
        return false;
    const int started = std::accumulate(started_per_second_.begin(), started_per_second_.end(), 0);
    return started >= options_.max_tasks_per_minute;
}

void AutoscaledPool::log_state() const {
    nlohmann::json payload = {
        {"state", to_string(state_)},
        {"currentConcurrency", current_.load()},
        {"desiredConcurrency", desired_.load()},
        {"minConcurrency", min_.load()},
        {"maxConcurrency", max_.load()},
    };

    const auto status = system_status_.current_status();
    payload["isSystemHealthy"] = status.is_healthy;
    for (const auto& [kind, load] : status.loads) {
        payload["systemStatus"][to_string(kind)] = {
            {"isOverloaded", load.is_overloaded},
            {"limitRatio", load.limit_ratio},
            {"actualRatio", load.actual_ratio},
        };
    }
    Logger::info("AutoscaledPool: state " + Utils::Text::dump_json(payload));
}

}  // namespace Autoscaling
}  // namespace Trawl
