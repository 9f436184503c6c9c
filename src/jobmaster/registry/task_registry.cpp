#include "jobmaster/registry/task_registry.hpp"

#include "jobmaster/scheduler/state_strings.hpp"
#include "jobmaster/util/log.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>

namespace jobmaster {

auto TaskRegistry::validate(const TaskDefinition& def) const -> Result<void> {
  if (def.id.empty()) {
    log::warn("Rejected task registration: empty id");
    return fail(Error::InvalidArgument);
  }

  if (!def.handler || !def.handler->invocable()) {
    log::warn("Rejected task {}: handler is not invocable", def.id);
    return fail(Error::InvalidHandler);
  }

  if (tasks_.contains(def.id)) {
    log::warn("Rejected task {}: already registered", def.id);
    return fail(Error::AlreadyExists);
  }

  for (const auto& dep : def.dependencies) {
    if (!tasks_.contains(dep)) {
      log::warn("Rejected task {}: dependency {} not registered", def.id, dep);
      return fail(Error::UnknownDependency);
    }
  }

  if (def.retry.count < 0 || def.timeout.count() <= 0 ||
      def.max_concurrent < 1) {
    log::warn("Rejected task {}: invalid retry/timeout/concurrency policy",
              def.id);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto TaskRegistry::add(TaskDefinition def) -> Result<void> {
  std::unique_lock lock(mu_);

  if (auto r = validate(def); !r) {
    return r;
  }

  // Duplicate dependency ids carry no meaning; keep the first of each.
  std::vector<TaskId> deps;
  deps.reserve(def.dependencies.size());
  for (auto& dep : def.dependencies) {
    if (std::ranges::find(deps, dep) == deps.end()) {
      deps.push_back(std::move(dep));
    }
  }
  def.dependencies = std::move(deps);

  if (def.max_concurrent > 1) {
    log::warn(
        "Task {} declares max_concurrent={}, but executions of one task are "
        "serialized; only one instance will ever run",
        def.id, def.max_concurrent);
  }

  auto id = def.id;
  log::info("Registered task: {} ({}, {})", id, frequency_name(def.frequency),
            priority_name(def.priority));
  tasks_.emplace(id, Entry{std::move(def), order_.size()});
  order_.push_back(std::move(id));
  return ok();
}

auto TaskRegistry::get(const TaskId& id) const
    -> std::optional<TaskDefinition> {
  std::shared_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return std::nullopt;
  return it->second.def;
}

auto TaskRegistry::contains(const TaskId& id) const -> bool {
  std::shared_lock lock(mu_);
  return tasks_.contains(id);
}

auto TaskRegistry::set_enabled(const TaskId& id, bool enabled)
    -> Result<void> {
  std::unique_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return fail(Error::NotFound);
  it->second.def.enabled = enabled;
  return ok();
}

auto TaskRegistry::order_of(const TaskId& id) const
    -> std::optional<std::uint64_t> {
  std::shared_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return std::nullopt;
  return it->second.order;
}

auto TaskRegistry::list() const -> std::vector<TaskDefinition> {
  std::shared_lock lock(mu_);
  std::vector<TaskDefinition> result;
  result.reserve(order_.size());
  for (const auto& id : order_) {
    result.push_back(tasks_.at(id).def);
  }
  return result;
}

auto TaskRegistry::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return tasks_.size();
}

auto TaskRegistry::enabled_count() const -> std::size_t {
  std::shared_lock lock(mu_);
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks_ | std::views::values,
      [](const Entry& e) { return e.def.enabled; }));
}

}  // namespace jobmaster
