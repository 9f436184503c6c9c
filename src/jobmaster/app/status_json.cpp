#include "jobmaster/app/status_json.hpp"

#include "jobmaster/scheduler/state_strings.hpp"

namespace jobmaster {

namespace {

auto time_or_null(const std::optional<TimePoint>& tp) -> json {
  return tp ? json(format_timestamp(*tp)) : json(nullptr);
}

}  // namespace

auto execution_to_json(const TaskExecution& exec) -> json {
  json j = {{"execution_id", exec.id.str()},
            {"task_id", exec.task_id.str()},
            {"trigger", trigger_kind_name(exec.trigger)},
            {"status", execution_status_name(exec.status)},
            {"started_at", format_timestamp(exec.started_at)},
            {"completed_at", time_or_null(exec.completed_at)},
            {"retry_count", exec.retry_count},
            {"duration_ms", exec.duration.count()},
            {"timed_out", exec.timed_out},
            {"resource_usage",
             {{"wall_time_ms", exec.usage.wall_time.count()},
              {"cpu", exec.usage.cpu_reserved},
              {"memory_mb", exec.usage.memory_mb_reserved}}}};
  if (exec.status == ExecutionStatus::Completed) {
    j["result"] = exec.result;
  }
  if (!exec.error.empty()) {
    j["error"] = exec.error;
  }
  return j;
}

auto metrics_to_json(const TaskMetrics& m) -> json {
  return {{"total_executions", m.total_executions},
          {"successful_executions", m.successful_executions},
          {"failed_executions", m.failed_executions},
          {"retried_attempts", m.retried_attempts},
          {"failure_rate", m.failure_rate},
          {"average_execution_time_ms", m.average_execution_time.count()},
          {"total_execution_time_ms", m.total_execution_time.count()},
          {"last_execution", time_or_null(m.last_execution)},
          {"last_success", time_or_null(m.last_success)},
          {"last_failure", time_or_null(m.last_failure)},
          {"performance_trend", trend_name(m.trend)}};
}

auto task_status_to_json(const TaskStatus& status) -> json {
  json active = json::array();
  for (const auto& exec : status.active_executions) {
    active.push_back(execution_to_json(exec));
  }
  json deps = json::array();
  for (const auto& dep : status.dependencies) {
    deps.push_back(dep.str());
  }

  return {{"task_id", status.id.str()},
          {"name", status.name},
          {"description", status.description},
          {"frequency", frequency_name(status.frequency)},
          {"priority", priority_name(status.priority)},
          {"enabled", status.enabled},
          {"next_execution", time_or_null(status.next_due)},
          {"metrics", metrics_to_json(status.metrics)},
          {"active_executions", std::move(active)},
          {"dependencies", std::move(deps)},
          {"resource_requirements",
           {{"cpu", status.resources.cpu},
            {"memory_mb", status.resources.memory_mb}}}};
}

auto snapshot_to_json(const SystemSnapshot& snap) -> json {
  json alerts = json::array();
  for (auto a : snap.alerts) {
    alerts.push_back(alert_name(a));
  }
  return {{"sampled_at", format_timestamp(snap.sampled_at)},
          {"cpu_usage", snap.cpu_percent},
          {"memory_usage", snap.memory_percent},
          {"memory_total_mb", snap.memory_total_mb},
          {"active_executions", snap.active_executions},
          {"queue_depth", snap.queue_depth},
          {"alerts", std::move(alerts)}};
}

auto overview_to_json(const SystemOverview& overview) -> json {
  json summary = json::object();
  for (const auto& t : overview.tasks) {
    summary[t.id.str()] = {{"enabled", t.enabled},
                           {"frequency", frequency_name(t.frequency)},
                           {"next_execution", time_or_null(t.next_due)},
                           {"total_executions", t.total_executions},
                           {"failure_rate", t.failure_rate}};
  }

  return {{"system_metrics", overview.system
                                 ? snapshot_to_json(*overview.system)
                                 : json(nullptr)},
          {"shedding_low_priority", overview.shedding_low_priority},
          {"total_registered_tasks", overview.total_tasks},
          {"enabled_tasks", overview.enabled_tasks},
          {"active_executions", overview.active_executions},
          {"task_summary", std::move(summary)}};
}

}  // namespace jobmaster
