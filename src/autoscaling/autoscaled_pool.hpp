#pragma once
#include <array>
#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "../core/async/interval.hpp"
#include "../core/types/constants.hpp"
#include "snapshotter.hpp"
#include "system_status.hpp"

class AutoscaledPoolTest_ScaleUpStepsByOne_Test;
class AutoscaledPoolTest_ScaleUpNeverExceedsMax_Test;
class AutoscaledPoolTest_ScaleDownWinsOverSaturation_Test;
class AutoscaledPoolTest_NoScaleUpWhenNotSaturated_Test;
class AutoscaledPoolTest_RepeatedScaleDownStopsAtMin_Test;
class AutoscaledPoolTest_AdmissionAfterAbortStartsNothing_Test;

namespace Trawl {
namespace Autoscaling {

enum class PoolState { Idle, Running, Pausing, Paused, Finished, Aborted, Errored };

std::string to_string(PoolState state);

enum class TaskOutcome { Ok, RetryableFailure, FatalFailure };

// What a task body reports back to the pool. Only FatalFailure (or an
// exception escaping run_task) stops the pool.
struct TaskResult {
    TaskOutcome        outcome = TaskOutcome::Ok;
    std::exception_ptr error;

    static TaskResult ok() {
        return {};
    }
    static TaskResult retryable(std::exception_ptr error = nullptr) {
        return {TaskOutcome::RetryableFailure, std::move(error)};
    }
    static TaskResult fatal(std::exception_ptr error) {
        return {TaskOutcome::FatalFailure, std::move(error)};
    }
};

// The three hooks the pool drives. They are awaited on the pool's strand.
class PoolTaskSource {
public:
    virtual ~PoolTaskSource() = default;

    virtual boost::asio::awaitable<TaskResult> run_task()      = 0;
    virtual boost::asio::awaitable<bool>       is_task_ready() = 0;
    virtual boost::asio::awaitable<bool>       is_finished()   = 0;
};

struct AutoscaledPoolOptions {
    int                min_concurrency = Core::Constants::DEFAULT_MIN_CONCURRENCY;
    int                max_concurrency = Core::Constants::DEFAULT_MAX_CONCURRENCY;
    std::optional<int> desired_concurrency;  // defaults to min_concurrency

    double desired_concurrency_ratio = Core::Constants::DEFAULT_DESIRED_CONCURRENCY_RATIO;
    double scale_up_step_ratio       = Core::Constants::DEFAULT_SCALE_UP_STEP_RATIO;
    double scale_down_step_ratio     = Core::Constants::DEFAULT_SCALE_DOWN_STEP_RATIO;
    double maybe_run_interval_secs   = Core::Constants::DEFAULT_MAYBE_RUN_INTERVAL_SECS;
    double autoscale_interval_secs   = Core::Constants::DEFAULT_AUTOSCALE_INTERVAL_SECS;
    // Unset disables the periodic state log.
    std::optional<double> logging_interval_secs = Core::Constants::DEFAULT_LOGGING_INTERVAL_SECS;

    double task_timeout_secs    = 0;  // 0: no limit
    int    max_tasks_per_minute = 0;  // 0: unlimited

    SnapshotterOptions           snapshotter;
    SystemStatusOptions          system_status;
    std::shared_ptr<SystemProbe> probe;  // defaults to /proc
};

// Runs tasks from a PoolTaskSource with a concurrency target that follows
// system health. All state is owned by one strand; run() must be spawned
// on get_executor(). Create through std::make_shared, in-flight tasks keep
// the pool alive.
class AutoscaledPool : public std::enable_shared_from_this<AutoscaledPool> {
#ifndef CPPCHECK
    friend class ::AutoscaledPoolTest_ScaleUpStepsByOne_Test;
    friend class ::AutoscaledPoolTest_ScaleUpNeverExceedsMax_Test;
    friend class ::AutoscaledPoolTest_ScaleDownWinsOverSaturation_Test;
    friend class ::AutoscaledPoolTest_NoScaleUpWhenNotSaturated_Test;
    friend class ::AutoscaledPoolTest_RepeatedScaleDownStopsAtMin_Test;
    friend class ::AutoscaledPoolTest_AdmissionAfterAbortStartsNothing_Test;
#endif

public:
    using executor_type = boost::asio::strand<boost::asio::any_io_executor>;

    AutoscaledPool(boost::asio::any_io_executor executor, PoolTaskSource& source, AutoscaledPoolOptions options = {});
    ~AutoscaledPool();

    AutoscaledPool(const AutoscaledPool&)            = delete;
    AutoscaledPool& operator=(const AutoscaledPool&) = delete;

    // Settles with Finished or Aborted, or rethrows the first fatal task
    // error once the tasks already running have settled.
    boost::asio::awaitable<PoolState> run();

    void abort();
    void pause();
    void resume();

    void set_min_concurrency(int value);
    void set_max_concurrency(int value);
    void set_desired_concurrency(int value);

    // Forwarded to the ClientErrors snapshot kind.
    void report_client_error() {
        snapshotter_.report_client_error();
    }

    executor_type get_executor() const {
        return strand_;
    }

    PoolState state() const {
        return state_;
    }
    int current_concurrency() const {
        return current_;
    }
    int desired_concurrency() const {
        return desired_;
    }
    int min_concurrency() const {
        return min_;
    }
    int max_concurrency() const {
        return max_;
    }

    const Snapshotter& snapshotter() const {
        return snapshotter_;
    }
    const SystemStatus& system_status() const {
        return system_status_;
    }

private:
    void trigger_admission();
    void autoscale();
    void scale_up();
    void scale_down();
    void rotate_rate_window();
    bool is_rate_limited() const;
    void log_state() const;

    void fail(std::exception_ptr error);
    void on_task_settled();
    void notify_settled();
    bool is_settled() const;
    void stop_timers();

    static boost::asio::awaitable<void> admit(std::shared_ptr<AutoscaledPool> self);
    static boost::asio::awaitable<void> maybe_finish(std::shared_ptr<AutoscaledPool> self);
    static boost::asio::awaitable<void> run_one(std::shared_ptr<AutoscaledPool> self);

    executor_type         strand_;
    PoolTaskSource&       source_;
    AutoscaledPoolOptions options_;
    Snapshotter           snapshotter_;
    SystemStatus          system_status_;

    std::atomic<PoolState> state_{PoolState::Idle};
    std::atomic<int>       current_{0};
    std::atomic<int>       desired_;
    std::atomic<int>       min_;
    std::atomic<int>       max_;

    bool               admitting_          = false;
    bool               admission_pending_  = false;
    bool               querying_finished_  = false;
    std::exception_ptr fatal_error_;

    std::array<int, 60> started_per_second_{};
    std::size_t         rate_slot_ = 0;

    boost::asio::steady_timer settle_timer_;
    Core::Interval            maybe_run_interval_;
    Core::Interval            autoscale_interval_;
    Core::Interval            rate_interval_;
    std::optional<Core::Interval> logging_interval_;
};

}  // namespace Autoscaling
}  // namespace Trawl
