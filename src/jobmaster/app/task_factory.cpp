#include "jobmaster/app/task_factory.hpp"

#include "jobmaster/handlers/conditions.hpp"
#include "jobmaster/handlers/shell_handler.hpp"
#include "jobmaster/scheduler/state_strings.hpp"
#include "jobmaster/util/log.hpp"

namespace jobmaster {

auto build_task_definition(const TaskSpec& spec, const SystemMonitor& monitor,
                           ClockFn clock) -> Result<TaskDefinition> {
  auto frequency = parse_frequency(spec.frequency);
  if (!frequency) {
    log::error("Task {}: unknown frequency '{}'", spec.id, spec.frequency);
    return fail(Error::InvalidArgument);
  }
  auto priority = parse_priority(spec.priority);
  if (!priority) {
    log::error("Task {}: unknown priority '{}'", spec.id, spec.priority);
    return fail(Error::InvalidArgument);
  }

  TaskDefinition def;
  def.id = TaskId{spec.id};
  def.name = spec.name.empty() ? spec.id : spec.name;
  def.description = spec.description;
  def.frequency = *frequency;
  def.priority = *priority;
  def.enabled = spec.enabled;
  def.retry = RetryPolicy{spec.retry_count,
                          std::chrono::seconds(spec.retry_delay_sec)};
  def.timeout = std::chrono::seconds(spec.timeout_sec);
  def.max_concurrent = spec.max_concurrent;
  def.resources = ResourceRequirement{spec.cpu, spec.memory_mb};
  def.notify_on_failure = spec.notify_on_failure;

  if (spec.command.empty()) {
    def.handler = std::make_shared<NoopHandler>();
  } else {
    def.handler = std::make_shared<ShellHandler>(spec.command, spec.working_dir);
  }

  def.dependencies = spec.dependencies;

  for (const auto& name : spec.conditions) {
    auto cond = builtin_condition(name, monitor, clock);
    if (!cond) {
      log::error("Task {}: unknown condition '{}'", spec.id, name);
      return fail(Error::InvalidArgument);
    }
    def.conditions.push_back(std::move(*cond));
  }
  return ok(std::move(def));
}

}  // namespace jobmaster
