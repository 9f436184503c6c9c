#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace jobmaster {

// task id -> next due time, ordered by due time for cheap "what is due"
// queries. A task has at most one entry.
class ScheduleTable {
public:
  ScheduleTable() = default;

  ScheduleTable(const ScheduleTable&) = delete;
  auto operator=(const ScheduleTable&) -> ScheduleTable& = delete;

  auto schedule(const TaskId& id, TimePoint due) -> void;
  // Next due time from the task's frequency rule, relative to `now`.
  auto reschedule(const TaskDefinition& def, TimePoint now) -> TimePoint;
  auto unschedule(const TaskId& id) -> void;
  // Like schedule/reschedule, but only moves an existing entry. A task that
  // was unscheduled in the meantime stays unscheduled.
  auto advance(const TaskId& id, TimePoint due) -> bool;
  auto advance(const TaskDefinition& def, TimePoint now)
      -> std::optional<TimePoint>;

  [[nodiscard]] auto next_due(const TaskId& id) const
      -> std::optional<TimePoint>;
  // Ids whose due time is at or before `now`, earliest first.
  [[nodiscard]] auto due(TimePoint now) const -> std::vector<TaskId>;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  auto schedule_locked(const TaskId& id, TimePoint due) -> void;
  auto unschedule_locked(const TaskId& id) -> void;

  mutable std::mutex mu_;
  std::multimap<TimePoint, TaskId> schedule_;
  std::unordered_map<TaskId, std::multimap<TimePoint, TaskId>::iterator>
      index_;
};

}  // namespace jobmaster
