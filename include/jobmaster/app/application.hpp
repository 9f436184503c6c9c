#pragma once

#include "jobmaster/admission/admission_controller.hpp"
#include "jobmaster/config/system_config.hpp"
#include "jobmaster/core/error.hpp"
#include "jobmaster/executor/executor.hpp"
#include "jobmaster/executor/live_executions.hpp"
#include "jobmaster/metrics/metrics_store.hpp"
#include "jobmaster/monitor/system_monitor.hpp"
#include "jobmaster/notify/notifier.hpp"
#include "jobmaster/registry/task_registry.hpp"
#include "jobmaster/scheduler/schedule_table.hpp"
#include "jobmaster/scheduler/scheduler.hpp"

#include <any>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jobmaster {

struct TaskStatus {
  TaskId id;
  std::string name;
  std::string description;
  Frequency frequency{Frequency::Hourly};
  Priority priority{Priority::Normal};
  bool enabled{true};
  std::optional<TimePoint> next_due;
  TaskMetrics metrics;
  std::vector<TaskExecution> active_executions;
  ResourceRequirement resources;
  std::vector<TaskId> dependencies;
};

struct TaskSummary {
  TaskId id;
  bool enabled{true};
  Frequency frequency{Frequency::Hourly};
  std::optional<TimePoint> next_due;
  std::uint64_t total_executions{0};
  double failure_rate{0.0};
};

struct SystemOverview {
  std::optional<SystemSnapshot> system;
  bool shedding_low_priority{false};
  std::size_t total_tasks{0};
  std::size_t enabled_tasks{0};
  std::size_t active_executions{0};
  std::vector<TaskSummary> tasks;
};

// Pluggable collaborators. Null members fall back to the built-in ones
// (/proc metrics, log notifier, system clock).
struct Collaborators {
  std::shared_ptr<ISystemMetricsSource> metrics_source;
  std::shared_ptr<INotifier> notifier;
  ClockFn clock;
  // Shared resources handed to every handler through TaskContext.
  std::any resources;
};

// Application facade: wires the engine together and is the control surface
// for external callers.
class Application {
public:
  Application();
  explicit Application(SystemConfig config, Collaborators collab = {});
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }

  // Lifecycle
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  // Registers the `tasks:` list of the configuration, in order.
  [[nodiscard]] auto register_configured_tasks() -> Result<void>;

  // Control API
  [[nodiscard]] auto register_task(TaskDefinition def) -> Result<void>;
  auto enable_task(const TaskId& id) -> bool;
  auto disable_task(const TaskId& id) -> bool;
  [[nodiscard]] auto trigger_task(const TaskId& id) -> Result<ExecutionHandle>;
  [[nodiscard]] auto get_task_status(const TaskId& id) const
      -> std::optional<TaskStatus>;
  [[nodiscard]] auto get_system_overview() const -> SystemOverview;

  // One scheduler pass as of `now`, outside the loop.
  auto tick(TimePoint now) -> DispatchReport;

  // Service access
  [[nodiscard]] auto registry() -> TaskRegistry& { return registry_; }
  [[nodiscard]] auto schedule() -> ScheduleTable& { return schedule_; }
  [[nodiscard]] auto metrics() -> MetricsStore& { return metrics_; }
  [[nodiscard]] auto monitor() -> SystemMonitor& { return monitor_; }
  [[nodiscard]] auto executor() -> Executor& { return executor_; }
  [[nodiscard]] auto scheduler() -> Scheduler& { return scheduler_; }

private:
  std::atomic<bool> running_{false};
  SystemConfig config_;
  ClockFn clock_;
  std::any resources_;

  TaskRegistry registry_;
  ScheduleTable schedule_;
  MetricsStore metrics_;
  LiveExecutions live_;

  SystemMonitor monitor_;
  AdmissionController admission_;
  Executor executor_;
  Scheduler scheduler_;
};

}  // namespace jobmaster
