#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace jobmaster {

// Per-task rolling counters. The executor is the only writer; admission,
// the control API and the monitor read snapshots concurrently.
class MetricsStore {
public:
  // Terminal durations kept for the performance trend.
  static constexpr std::size_t kTrendWindow = 10;

  MetricsStore() = default;

  MetricsStore(const MetricsStore&) = delete;
  auto operator=(const MetricsStore&) -> MetricsStore& = delete;

  // Creates a zeroed entry; existing entries are left untouched.
  auto init(const TaskId& id) -> void;

  // One terminal execution each. `retried_attempts` counts the failed
  // attempts that preceded the outcome within the same execution.
  auto record_success(const TaskId& id, std::chrono::milliseconds duration,
                      int retried_attempts, TimePoint at) -> TaskMetrics;
  auto record_failure(const TaskId& id, std::chrono::milliseconds duration,
                      int retried_attempts, TimePoint at) -> TaskMetrics;

  [[nodiscard]] auto snapshot(const TaskId& id) const
      -> std::optional<TaskMetrics>;
  [[nodiscard]] auto last_success(const TaskId& id) const
      -> std::optional<TimePoint>;

private:
  struct Entry {
    TaskMetrics metrics;
    std::deque<std::chrono::milliseconds> recent;
  };

  auto record(Entry& e, std::chrono::milliseconds duration,
              int retried_attempts, TimePoint at) -> void;
  static auto classify(const std::deque<std::chrono::milliseconds>& recent)
      -> PerformanceTrend;

  mutable std::mutex mu_;
  std::unordered_map<TaskId, Entry> entries_;
};

}  // namespace jobmaster
