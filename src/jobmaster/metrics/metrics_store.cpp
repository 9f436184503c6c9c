#include "jobmaster/metrics/metrics_store.hpp"

#include <numeric>

namespace jobmaster {

auto MetricsStore::init(const TaskId& id) -> void {
  std::lock_guard lock(mu_);
  entries_.try_emplace(id);
}

auto MetricsStore::record(Entry& e, std::chrono::milliseconds duration,
                          int retried_attempts, TimePoint at) -> void {
  auto& m = e.metrics;
  ++m.total_executions;
  m.retried_attempts += static_cast<std::uint64_t>(retried_attempts);
  m.last_execution = at;
  m.total_execution_time += duration;
  m.average_execution_time =
      m.total_execution_time / static_cast<std::int64_t>(m.total_executions);

  e.recent.push_back(duration);
  if (e.recent.size() > kTrendWindow) {
    e.recent.pop_front();
  }
  m.trend = classify(e.recent);
}

auto MetricsStore::record_success(const TaskId& id,
                                  std::chrono::milliseconds duration,
                                  int retried_attempts, TimePoint at)
    -> TaskMetrics {
  std::lock_guard lock(mu_);
  auto& e = entries_[id];
  record(e, duration, retried_attempts, at);
  ++e.metrics.successful_executions;
  e.metrics.last_success = at;
  e.metrics.failure_rate =
      100.0 * static_cast<double>(e.metrics.failed_executions) /
      static_cast<double>(e.metrics.total_executions);
  return e.metrics;
}

auto MetricsStore::record_failure(const TaskId& id,
                                  std::chrono::milliseconds duration,
                                  int retried_attempts, TimePoint at)
    -> TaskMetrics {
  std::lock_guard lock(mu_);
  auto& e = entries_[id];
  record(e, duration, retried_attempts, at);
  ++e.metrics.failed_executions;
  e.metrics.last_failure = at;
  e.metrics.failure_rate =
      100.0 * static_cast<double>(e.metrics.failed_executions) /
      static_cast<double>(e.metrics.total_executions);
  return e.metrics;
}

auto MetricsStore::snapshot(const TaskId& id) const
    -> std::optional<TaskMetrics> {
  std::lock_guard lock(mu_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.metrics;
}

auto MetricsStore::last_success(const TaskId& id) const
    -> std::optional<TimePoint> {
  std::lock_guard lock(mu_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.metrics.last_success;
}

// Compares the newer half of the window against the older half; needs at
// least four samples before it calls anything but stable.
auto MetricsStore::classify(const std::deque<std::chrono::milliseconds>& recent)
    -> PerformanceTrend {
  if (recent.size() < 4)
    return PerformanceTrend::Stable;

  auto half = recent.size() / 2;
  auto sum = [](auto first, auto last) {
    return std::accumulate(first, last, std::chrono::milliseconds{0})
        .count();
  };
  double older = static_cast<double>(sum(recent.begin(), recent.begin() + half)) /
                 static_cast<double>(half);
  double newer = static_cast<double>(sum(recent.begin() + half, recent.end())) /
                 static_cast<double>(recent.size() - half);

  if (older <= 0.0)
    return newer > 0.0 ? PerformanceTrend::Degrading : PerformanceTrend::Stable;
  if (newer < older * 0.9)
    return PerformanceTrend::Improving;
  if (newer > older * 1.1)
    return PerformanceTrend::Degrading;
  return PerformanceTrend::Stable;
}

}  // namespace jobmaster
