#include "jobmaster/notify/notifier.hpp"

#include "jobmaster/util/log.hpp"

namespace jobmaster {

auto LogNotifier::notify(const TaskId& task, const FailureDetails& details)
    -> void {
  switch (details.kind) {
    case FailureKind::TerminalFailure:
      log::error("Task {} failed (execution {}, {} retries{}): {}", task,
                 details.execution_id, details.retry_count,
                 details.timed_out ? ", timed out" : "", details.error);
      break;
    case FailureKind::ConsistentlyFailing:
      log::error(
          "ESCALATION: task {} is consistently failing ({:.1f}% of {} "
          "executions)",
          task, details.failure_rate, details.total_executions);
      break;
  }
}

}  // namespace jobmaster
