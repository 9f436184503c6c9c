#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace jobmaster {

// Non-terminal executions, keyed by execution id. An entry is inserted when
// a task is admitted (or manually triggered) and erased on termination.
class LiveExecutions {
public:
  LiveExecutions() = default;

  LiveExecutions(const LiveExecutions&) = delete;
  auto operator=(const LiveExecutions&) -> LiveExecutions& = delete;

  auto insert(const TaskExecution& exec) -> void;
  auto update(const TaskExecution& exec) -> void;
  auto erase(const ExecutionId& id) -> void;

  [[nodiscard]] auto list_for(const TaskId& task) const
      -> std::vector<TaskExecution>;
  [[nodiscard]] auto count_for(const TaskId& task) const -> std::size_t;
  [[nodiscard]] auto size() const -> std::size_t;
  // Executions admitted but still waiting on their task's lock.
  [[nodiscard]] auto pending_count() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::unordered_map<ExecutionId, TaskExecution> live_;
};

}  // namespace jobmaster
