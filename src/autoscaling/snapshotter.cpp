#include "snapshotter.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Autoscaling {

using Core::Logger;

namespace {
constexpr std::chrono::seconds CRITICAL_MEMORY_WARNING_INTERVAL(10);
constexpr double               CRITICAL_MEMORY_RESERVE_RATIO = 0.5;

std::size_t index_of(ResourceKind kind) {
    return static_cast<std::size_t>(kind);
}

void validate(const SnapshotterOptions& options) {
    if (options.event_loop_snapshot_interval_secs <= 0 || options.client_snapshot_interval_secs <= 0
        || options.system_info_interval_secs <= 0)
        throw std::invalid_argument("Snapshotter: sampling intervals must be positive");
    if (options.snapshot_history_secs <= 0)
        throw std::invalid_argument("Snapshotter: snapshot_history_secs must be positive");
    if (options.max_used_memory_ratio <= 0 || options.max_used_memory_ratio > 1)
        throw std::invalid_argument("Snapshotter: max_used_memory_ratio must be in (0, 1]");
    if (options.max_used_cpu_ratio <= 0 || options.max_used_cpu_ratio > 1)
        throw std::invalid_argument("Snapshotter: max_used_cpu_ratio must be in (0, 1]");
    if (options.available_memory_ratio <= 0 || options.available_memory_ratio > 1)
        throw std::invalid_argument("Snapshotter: available_memory_ratio must be in (0, 1]");
    if (options.max_blocked_millis < 0 || options.max_client_errors < 0)
        throw std::invalid_argument("Snapshotter: thresholds must not be negative");
}
}  // namespace

Snapshotter::Snapshotter(boost::asio::any_io_executor executor,
                         SnapshotterOptions           options,
                         std::shared_ptr<SystemProbe> probe)
    : executor_(executor),
      options_(options),
      probe_(probe ? std::move(probe) : std::make_shared<ProcSystemProbe>()),
      histories_{SnapshotHistory(Core::to_millis(options.snapshot_history_secs)),
                 SnapshotHistory(Core::to_millis(options.snapshot_history_secs)),
                 SnapshotHistory(Core::to_millis(options.snapshot_history_secs)),
                 SnapshotHistory(Core::to_millis(options.snapshot_history_secs))},
      system_info_interval_(executor, Core::to_millis(options.system_info_interval_secs),
                            [this]() {
                                snapshot_cpu();
                                snapshot_memory();
                            }),
      event_loop_interval_(executor, Core::to_millis(options.event_loop_snapshot_interval_secs),
                           [this]() { snapshot_event_loop(); }),
      client_interval_(executor, Core::to_millis(options.client_snapshot_interval_secs),
                       [this]() { snapshot_client(); }) {
    validate(options_);
}

void Snapshotter::start() {
    if (running_)
        return;
    running_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_event_loop_sample_.reset();
        client_errors_at_last_sample_ = client_errors_;
    }

    // Seed every kind so the first verdicts are not based on an empty window.
    snapshot_cpu();
    snapshot_memory();
    snapshot_event_loop();
    snapshot_client();

    system_info_interval_.start();
    event_loop_interval_.start();
    client_interval_.start();
    Logger::debug("Snapshotter: started");
}

void Snapshotter::stop() {
    if (!running_)
        return;
    running_ = false;
    system_info_interval_.stop();
    event_loop_interval_.stop();
    client_interval_.stop();
    Logger::debug("Snapshotter: stopped");
}

void Snapshotter::sample(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Cpu:
        snapshot_cpu();
        break;
    case ResourceKind::Memory:
        snapshot_memory();
        break;
    case ResourceKind::SchedulerLatency:
        snapshot_event_loop();
        break;
    case ResourceKind::ClientErrors:
        snapshot_client();
        break;
    }
}

void Snapshotter::snapshot_cpu() {
    std::optional<double> ratio;
    try {
        ratio = probe_->cpu_used_ratio();
    } catch (const std::exception& e) {
        Logger::warn("Snapshotter: CPU probe threw: " + std::string(e.what()));
    }

    if (!ratio) {
        Logger::warn("Snapshotter: failed to sample CPU usage, recording it as overloaded");
        record(ResourceKind::Cpu, true, 1.0);
        return;
    }
    record(ResourceKind::Cpu, *ratio > options_.max_used_cpu_ratio, *ratio);
}

void Snapshotter::snapshot_memory() {
    std::optional<std::uint64_t> used;
    std::optional<std::uint64_t> budget;
    try {
        used = probe_->memory_used_bytes();
        if (options_.memory_mbytes > 0) {
            budget = options_.memory_mbytes * 1024 * 1024;
        }
        else if (auto total = probe_->memory_total_bytes()) {
            budget = static_cast<std::uint64_t>(static_cast<double>(*total) * options_.available_memory_ratio);
        }
    } catch (const std::exception& e) {
        Logger::warn("Snapshotter: memory probe threw: " + std::string(e.what()));
    }

    if (!used || !budget || *budget == 0) {
        Logger::warn("Snapshotter: failed to sample memory usage, recording it as overloaded");
        record(ResourceKind::Memory, true, 0.0);
        return;
    }

    const double ratio = static_cast<double>(*used) / static_cast<double>(*budget);
    record(ResourceKind::Memory, ratio > options_.max_used_memory_ratio, static_cast<double>(*used));
    warn_critical_memory(*used, *budget);
}

void Snapshotter::snapshot_event_loop() {
    const TimePoint now   = Clock::now();
    double          delay = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_event_loop_sample_) {
            const auto expected = *last_event_loop_sample_
                                  + Core::to_millis(options_.event_loop_snapshot_interval_secs);
            delay = std::chrono::duration<double, std::milli>(now - expected).count();
        }
        last_event_loop_sample_ = now;
    }
    if (delay < 0)
        delay = 0;
    record(ResourceKind::SchedulerLatency, delay > options_.max_blocked_millis, delay);
}

void Snapshotter::snapshot_client() {
    const std::uint64_t total = client_errors_;
    std::uint64_t       delta = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delta                         = total - client_errors_at_last_sample_;
        client_errors_at_last_sample_ = total;
    }
    record(ResourceKind::ClientErrors, delta > static_cast<std::uint64_t>(options_.max_client_errors),
           static_cast<double>(delta));
}

void Snapshotter::add_snapshot(const ResourceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    histories_[index_of(snapshot.kind)].add(snapshot, Clock::now());
}

std::vector<ResourceSnapshot> Snapshotter::history(ResourceKind                             kind,
                                                   std::optional<std::chrono::milliseconds> window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto&                 history = histories_[index_of(kind)];
    if (!window)
        return history.all();
    return history.since(Clock::now() - *window);
}

void Snapshotter::record(ResourceKind kind, bool is_overloaded, double value) {
    ResourceSnapshot snapshot;
    snapshot.kind          = kind;
    snapshot.captured_at   = Clock::now();
    snapshot.is_overloaded = is_overloaded;
    snapshot.value         = value;
    add_snapshot(snapshot);
}

void Snapshotter::warn_critical_memory(std::uint64_t used, std::uint64_t budget) {
    const double ratio    = options_.max_used_memory_ratio;
    const double critical = static_cast<double>(budget) * (ratio + (1.0 - ratio) * CRITICAL_MEMORY_RESERVE_RATIO);
    if (static_cast<double>(used) <= critical)
        return;

    const TimePoint now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_critical_memory_warning_ && now - *last_critical_memory_warning_ < CRITICAL_MEMORY_WARNING_INTERVAL)
            return;
        last_critical_memory_warning_ = now;
    }

    const auto used_mb   = used / (1024 * 1024);
    const auto budget_mb = budget / (1024 * 1024);
    Logger::warn("Snapshotter: memory is critically overloaded. Using " + std::to_string(used_mb) + " MB of "
                 + std::to_string(budget_mb) + " MB ("
                 + std::to_string(static_cast<int>(std::round(100.0 * static_cast<double>(used) / budget)))
                 + "%). Consider increasing the memory budget.");
}

}  // namespace Autoscaling
}  // namespace Trawl
