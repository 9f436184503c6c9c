#pragma once

#include "jobmaster/admission/admission_controller.hpp"
#include "jobmaster/config/system_config.hpp"
#include "jobmaster/executor/executor.hpp"
#include "jobmaster/registry/task_registry.hpp"
#include "jobmaster/scheduler/schedule_table.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace jobmaster {

struct DispatchReport {
  TimePoint at{};
  std::vector<TaskId> admitted;
  std::vector<std::pair<TaskId, Gate>> deferred;
  std::vector<TaskId> skipped;
};

// Periodic driver: every tick, collects due tasks, orders them by priority
// and runs them through admission. Admitted tasks go to the executor.
class Scheduler {
public:
  Scheduler(SchedulerConfig config, TaskRegistry& registry,
            ScheduleTable& schedule, const AdmissionController& admission,
            Executor& executor, ClockFn clock = system_clock_fn());
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return loop_.joinable();
  }

  // One dispatch pass as of `now`.
  auto tick(TimePoint now) -> DispatchReport;

  [[nodiscard]] auto completed_ticks() const noexcept -> std::uint64_t {
    return completed_ticks_.load();
  }
  [[nodiscard]] auto failed_ticks() const noexcept -> std::uint64_t {
    return failed_ticks_.load();
  }

private:
  auto run(std::stop_token stop) -> void;

  SchedulerConfig config_;
  TaskRegistry& registry_;
  ScheduleTable& schedule_;
  const AdmissionController& admission_;
  Executor& executor_;
  ClockFn clock_;

  std::atomic<std::uint64_t> completed_ticks_{0};
  std::atomic<std::uint64_t> failed_ticks_{0};

  std::mutex wake_mu_;
  std::condition_variable_any wake_cv_;
  std::jthread loop_;
};

}  // namespace jobmaster
