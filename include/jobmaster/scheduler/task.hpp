#pragma once

#include "jobmaster/executor/cancellation.hpp"
#include "jobmaster/util/id.hpp"
#include "jobmaster/util/util.hpp"

#include <nlohmann/json.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jobmaster {

enum class Frequency : std::uint8_t {
  Continuous,
  EveryMinute,
  Every5Minutes,
  Every15Minutes,
  Every30Minutes,
  Hourly,
  Daily,
  Weekly,
  Monthly,
};

// Declared lowest first so the numeric value orders by urgency.
enum class Priority : std::uint8_t {
  Low,
  Normal,
  High,
  Critical,
};

enum class ExecutionStatus : std::uint8_t {
  Pending,
  Running,
  Retrying,
  Completed,
  Failed,
  Cancelled,
};

enum class TriggerKind : std::uint8_t {
  Scheduled,
  Manual,
};

enum class PerformanceTrend : std::uint8_t {
  Stable,
  Improving,
  Degrading,
};

[[nodiscard]] constexpr auto is_terminal(ExecutionStatus s) noexcept -> bool {
  return s == ExecutionStatus::Completed || s == ExecutionStatus::Failed ||
         s == ExecutionStatus::Cancelled;
}

struct RetryPolicy {
  int count{3};
  std::chrono::milliseconds delay{std::chrono::seconds(60)};
};

struct ResourceRequirement {
  double cpu{0.5};         // share of one core, 1.0 == 100%
  double memory_mb{256.0};
};

struct TaskError {
  std::string message;
};

using TaskPayload = nlohmann::json;
using TaskResult = std::expected<TaskPayload, TaskError>;

struct TaskContext {
  TaskId task_id;
  ExecutionId execution_id;
  int attempt{1};
  TriggerKind trigger{TriggerKind::Scheduled};
  CancellationToken cancel;
  const std::any* resources{nullptr};

  // Shared resources registered with the application (data-store handles
  // and the like). Null when absent or of another type.
  template <typename T>
  [[nodiscard]] auto resource() const -> const T* {
    return resources ? std::any_cast<T>(resources) : nullptr;
  }
};

class ITaskHandler {
public:
  virtual ~ITaskHandler() = default;

  // Report failure with an unexpected TaskError or by throwing.
  virtual auto execute(TaskContext& ctx) -> TaskResult = 0;

  [[nodiscard]] virtual auto invocable() const noexcept -> bool {
    return true;
  }
};

class FunctionHandler final : public ITaskHandler {
public:
  using Fn = std::function<TaskResult(TaskContext&)>;

  explicit FunctionHandler(Fn fn) : fn_(std::move(fn)) {}

  auto execute(TaskContext& ctx) -> TaskResult override {
    return fn_(ctx);
  }

  [[nodiscard]] auto invocable() const noexcept -> bool override {
    return static_cast<bool>(fn_);
  }

private:
  Fn fn_;
};

[[nodiscard]] inline auto make_handler(FunctionHandler::Fn fn)
    -> std::shared_ptr<ITaskHandler> {
  if (!fn)
    return nullptr;
  return std::make_shared<FunctionHandler>(std::move(fn));
}

struct Condition {
  std::string name;
  std::function<bool()> check;
};

struct TaskDefinition {
  TaskId id;
  std::string name;
  std::string description;
  Frequency frequency{Frequency::Hourly};
  Priority priority{Priority::Normal};
  std::shared_ptr<ITaskHandler> handler;
  bool enabled{true};
  RetryPolicy retry{};
  std::chrono::milliseconds timeout{std::chrono::seconds(300)};
  std::vector<TaskId> dependencies;
  std::vector<Condition> conditions;
  int max_concurrent{1};
  ResourceRequirement resources{};
  bool notify_on_failure{true};
};

struct ResourceUsage {
  std::chrono::milliseconds wall_time{0};
  double cpu_reserved{0.0};
  double memory_mb_reserved{0.0};
};

struct TaskExecution {
  ExecutionId id;
  TaskId task_id;
  TriggerKind trigger{TriggerKind::Scheduled};
  TimePoint started_at{};
  std::optional<TimePoint> completed_at;
  ExecutionStatus status{ExecutionStatus::Pending};
  TaskPayload result;
  std::string error;
  bool timed_out{false};
  int retry_count{0};
  std::chrono::milliseconds duration{0};
  ResourceUsage usage{};
};

struct TaskMetrics {
  std::uint64_t total_executions{0};
  std::uint64_t successful_executions{0};
  std::uint64_t failed_executions{0};
  std::uint64_t retried_attempts{0};
  std::chrono::milliseconds total_execution_time{0};
  std::chrono::milliseconds average_execution_time{0};
  double failure_rate{0.0};  // percent
  std::optional<TimePoint> last_execution;
  std::optional<TimePoint> last_success;
  std::optional<TimePoint> last_failure;
  PerformanceTrend trend{PerformanceTrend::Stable};
};

}  // namespace jobmaster
