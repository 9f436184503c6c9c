#pragma once

#include "jobmaster/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobmaster {

// Secondary ordering among due tasks of equal priority.
enum class TieBreak : std::uint8_t { Registration, None };

[[nodiscard]] constexpr auto tie_break_name(TieBreak t) noexcept
    -> std::string_view {
  switch (t) {
    case TieBreak::Registration: return "registration";
    case TieBreak::None: return "none";
  }
  return "registration";
}

[[nodiscard]] inline auto parse_tie_break(std::string_view s) noexcept
    -> std::optional<TieBreak> {
  if (s == "registration") return TieBreak::Registration;
  if (s == "none") return TieBreak::None;
  return std::nullopt;
}

struct SchedulerConfig {
  std::string log_level{"info"};
  std::chrono::milliseconds tick_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds error_backoff{std::chrono::seconds(60)};
  TieBreak tie_break{TieBreak::Registration};
};

struct AdmissionConfig {
  std::chrono::hours dependency_freshness{25};
  double cpu_ceiling{90.0};
  double memory_ceiling{90.0};
  std::chrono::milliseconds resource_backoff{std::chrono::minutes(5)};
};

struct MonitorConfig {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds error_backoff{std::chrono::seconds(120)};
  double cpu_alert{90.0};
  double memory_alert{90.0};
  std::size_t max_concurrent_executions{20};
  bool auto_mitigation{true};
};

struct FailureConfig {
  double consistent_failure_rate{50.0};
  std::uint64_t consistent_failure_min_runs{5};
};

// One entry of the `tasks:` list. Turned into a TaskDefinition by
// build_task_definition once the engine's collaborators exist.
struct TaskSpec {
  std::string id;
  std::string name;
  std::string description;
  std::string frequency{"hourly"};
  std::string priority{"normal"};
  std::string command;
  std::string working_dir;
  bool enabled{true};
  int retry_count{3};
  int retry_delay_sec{60};
  int timeout_sec{300};
  std::vector<TaskId> dependencies;
  std::vector<std::string> conditions;
  int max_concurrent{1};
  double cpu{0.5};
  double memory_mb{256.0};
  bool notify_on_failure{true};
};

struct SystemConfig {
  SchedulerConfig scheduler;
  AdmissionConfig admission;
  MonitorConfig monitor;
  FailureConfig failure;
  std::vector<TaskSpec> tasks;
};

}  // namespace jobmaster
