#include "jobmaster/executor/live_executions.hpp"

#include <algorithm>
#include <ranges>

namespace jobmaster {

auto LiveExecutions::insert(const TaskExecution& exec) -> void {
  std::lock_guard lock(mu_);
  live_.insert_or_assign(exec.id, exec);
}

auto LiveExecutions::update(const TaskExecution& exec) -> void {
  std::lock_guard lock(mu_);
  if (auto it = live_.find(exec.id); it != live_.end()) {
    it->second = exec;
  }
}

auto LiveExecutions::erase(const ExecutionId& id) -> void {
  std::lock_guard lock(mu_);
  live_.erase(id);
}

auto LiveExecutions::list_for(const TaskId& task) const
    -> std::vector<TaskExecution> {
  std::lock_guard lock(mu_);
  std::vector<TaskExecution> result;
  for (const auto& exec : live_ | std::views::values) {
    if (exec.task_id == task) {
      result.push_back(exec);
    }
  }
  std::ranges::sort(result, {}, &TaskExecution::started_at);
  return result;
}

auto LiveExecutions::count_for(const TaskId& task) const -> std::size_t {
  std::lock_guard lock(mu_);
  return static_cast<std::size_t>(
      std::ranges::count_if(live_ | std::views::values,
                            [&](const TaskExecution& e) {
                              return e.task_id == task &&
                                     !is_terminal(e.status);
                            }));
}

auto LiveExecutions::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return live_.size();
}

auto LiveExecutions::pending_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return static_cast<std::size_t>(
      std::ranges::count_if(live_ | std::views::values,
                            [](const TaskExecution& e) {
                              return e.status == ExecutionStatus::Pending;
                            }));
}

}  // namespace jobmaster
