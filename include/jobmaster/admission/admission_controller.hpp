#pragma once

#include "jobmaster/config/system_config.hpp"
#include "jobmaster/executor/live_executions.hpp"
#include "jobmaster/metrics/metrics_store.hpp"
#include "jobmaster/monitor/system_monitor.hpp"
#include "jobmaster/scheduler/task.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobmaster {

enum class Gate : std::uint8_t {
  Concurrency,
  Dependency,
  Condition,
  Resource,
};

[[nodiscard]] constexpr auto gate_name(Gate g) noexcept -> std::string_view {
  switch (g) {
    case Gate::Concurrency: return "concurrency";
    case Gate::Dependency: return "dependency";
    case Gate::Condition: return "condition";
    case Gate::Resource: return "resource";
  }
  return "unknown";
}

enum class Verdict : std::uint8_t {
  Admit,
  Skip,   // stays due, next-due untouched
  Defer,  // rescheduled, see Gate for which backoff applies
};

struct AdmissionDecision {
  Verdict verdict{Verdict::Admit};
  std::optional<Gate> gate;
  std::string reason;

  [[nodiscard]] auto admitted() const noexcept -> bool {
    return verdict == Verdict::Admit;
  }
};

// Runs the four gates in order and stops at the first one that fails.
// Holds no state of its own; everything it reads has its own lock.
class AdmissionController {
public:
  AdmissionController(AdmissionConfig config, const LiveExecutions& live,
                      const MetricsStore& metrics,
                      const SystemMonitor& monitor);

  [[nodiscard]] auto evaluate(const TaskDefinition& def, TimePoint now) const
      -> AdmissionDecision;

  [[nodiscard]] auto config() const noexcept -> const AdmissionConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto check_concurrency(const TaskDefinition& def) const
      -> std::optional<AdmissionDecision>;
  [[nodiscard]] auto check_dependencies(const TaskDefinition& def,
                                        TimePoint now) const
      -> std::optional<AdmissionDecision>;
  [[nodiscard]] auto check_conditions(const TaskDefinition& def) const
      -> std::optional<AdmissionDecision>;
  [[nodiscard]] auto check_resources(const TaskDefinition& def) const
      -> std::optional<AdmissionDecision>;

  AdmissionConfig config_;
  const LiveExecutions& live_;
  const MetricsStore& metrics_;
  const SystemMonitor& monitor_;
};

}  // namespace jobmaster
