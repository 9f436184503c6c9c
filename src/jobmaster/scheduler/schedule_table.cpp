#include "jobmaster/scheduler/schedule_table.hpp"

#include "jobmaster/scheduler/frequency.hpp"
#include "jobmaster/util/log.hpp"

namespace jobmaster {

auto ScheduleTable::schedule_locked(const TaskId& id, TimePoint due) -> void {
  unschedule_locked(id);
  auto it = schedule_.emplace(due, id);
  index_[id] = it;
}

auto ScheduleTable::unschedule_locked(const TaskId& id) -> void {
  auto it = index_.find(id);
  if (it == index_.end())
    return;
  schedule_.erase(it->second);
  index_.erase(it);
}

auto ScheduleTable::schedule(const TaskId& id, TimePoint due) -> void {
  std::lock_guard lock(mu_);
  schedule_locked(id, due);
  log::debug("Scheduled task {} for {}", id, format_timestamp(due));
}

auto ScheduleTable::reschedule(const TaskDefinition& def, TimePoint now)
    -> TimePoint {
  auto due = jobmaster::next_due(def.frequency, now);
  schedule(def.id, due);
  return due;
}

auto ScheduleTable::unschedule(const TaskId& id) -> void {
  std::lock_guard lock(mu_);
  unschedule_locked(id);
}

auto ScheduleTable::advance(const TaskId& id, TimePoint due) -> bool {
  std::lock_guard lock(mu_);
  if (!index_.contains(id))
    return false;
  schedule_locked(id, due);
  log::debug("Scheduled task {} for {}", id, format_timestamp(due));
  return true;
}

auto ScheduleTable::advance(const TaskDefinition& def, TimePoint now)
    -> std::optional<TimePoint> {
  auto due = jobmaster::next_due(def.frequency, now);
  if (!advance(def.id, due))
    return std::nullopt;
  return due;
}

auto ScheduleTable::next_due(const TaskId& id) const
    -> std::optional<TimePoint> {
  std::lock_guard lock(mu_);
  auto it = index_.find(id);
  if (it == index_.end())
    return std::nullopt;
  return it->second->first;
}

auto ScheduleTable::due(TimePoint now) const -> std::vector<TaskId> {
  std::lock_guard lock(mu_);
  std::vector<TaskId> result;
  for (auto it = schedule_.begin(); it != schedule_.end() && it->first <= now;
       ++it) {
    result.push_back(it->second);
  }
  return result;
}

auto ScheduleTable::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return index_.size();
}

}  // namespace jobmaster
