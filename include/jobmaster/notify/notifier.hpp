#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace jobmaster {

enum class FailureKind : std::uint8_t {
  TerminalFailure,      // one execution ended FAILED
  ConsistentlyFailing,  // failure rate crossed the escalation threshold
};

[[nodiscard]] constexpr auto failure_kind_name(FailureKind k) noexcept
    -> std::string_view {
  switch (k) {
    case FailureKind::TerminalFailure: return "terminal_failure";
    case FailureKind::ConsistentlyFailing: return "consistently_failing";
  }
  return "unknown";
}

struct FailureDetails {
  FailureKind kind{FailureKind::TerminalFailure};
  ExecutionId execution_id;
  std::string error;
  bool timed_out{false};
  int retry_count{0};
  double failure_rate{0.0};
  std::uint64_t total_executions{0};
  TimePoint at{};
};

class INotifier {
public:
  virtual ~INotifier() = default;
  virtual auto notify(const TaskId& task, const FailureDetails& details)
      -> void = 0;
};

// Default notifier: failures go to the error log.
class LogNotifier final : public INotifier {
public:
  auto notify(const TaskId& task, const FailureDetails& details)
      -> void override;
};

}  // namespace jobmaster
