#include "jobmaster/app/application.hpp"

#include "jobmaster/app/task_factory.hpp"
#include "jobmaster/scheduler/frequency.hpp"
#include "jobmaster/util/log.hpp"

namespace jobmaster {

namespace {

auto or_default(ClockFn clock) -> ClockFn {
  return clock ? std::move(clock) : system_clock_fn();
}

auto or_default(std::shared_ptr<ISystemMetricsSource> source)
    -> std::shared_ptr<ISystemMetricsSource> {
  return source ? std::move(source)
                : std::make_shared<ProcSystemMetricsSource>();
}

auto or_default(std::shared_ptr<INotifier> notifier)
    -> std::shared_ptr<INotifier> {
  return notifier ? std::move(notifier) : std::make_shared<LogNotifier>();
}

}  // namespace

Application::Application() : Application(SystemConfig{}) {
}

Application::Application(SystemConfig config, Collaborators collab)
    : config_(std::move(config)),
      clock_(or_default(std::move(collab.clock))),
      resources_(std::move(collab.resources)),
      monitor_(config_.monitor, or_default(std::move(collab.metrics_source)),
               live_, clock_),
      admission_(config_.admission, live_, metrics_, monitor_),
      executor_(config_.failure, live_, metrics_,
                or_default(std::move(collab.notifier)), clock_,
                resources_.has_value() ? &resources_ : nullptr),
      scheduler_(config_.scheduler, registry_, schedule_, admission_,
                 executor_, clock_) {
  log::set_level(config_.scheduler.log_level);
}

Application::~Application() {
  stop();
}

auto Application::start() -> void {
  if (running_.exchange(true))
    return;

  monitor_.start();
  scheduler_.start();
  log::info("jobmaster started with {} task(s)", registry_.size());
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping jobmaster...");
  scheduler_.stop();
  monitor_.stop();
  executor_.shutdown();
  log::info("jobmaster stopped");
}

auto Application::register_configured_tasks() -> Result<void> {
  for (const auto& spec : config_.tasks) {
    auto def = build_task_definition(spec, monitor_, clock_);
    if (!def)
      return fail(def.error());
    if (auto r = register_task(std::move(*def)); !r)
      return r;
  }
  return ok();
}

auto Application::register_task(TaskDefinition def) -> Result<void> {
  auto id = def.id;
  auto frequency = def.frequency;
  bool enabled = def.enabled;

  if (auto r = registry_.add(std::move(def)); !r)
    return r;

  metrics_.init(id);
  if (enabled) {
    schedule_.schedule(id, next_due(frequency, clock_()));
  }
  return ok();
}

auto Application::enable_task(const TaskId& id) -> bool {
  if (!registry_.set_enabled(id, true))
    return false;
  if (auto def = registry_.get(id)) {
    auto next = schedule_.reschedule(*def, clock_());
    log::info("Enabled task {}; next due {}", id, format_timestamp(next));
  }
  return true;
}

auto Application::disable_task(const TaskId& id) -> bool {
  if (!registry_.set_enabled(id, false))
    return false;
  schedule_.unschedule(id);
  log::info("Disabled task {}", id);
  return true;
}

auto Application::trigger_task(const TaskId& id) -> Result<ExecutionHandle> {
  auto def = registry_.get(id);
  if (!def) {
    log::warn("Manual trigger of unknown task {}", id);
    return fail(Error::NotFound);
  }
  auto handle = executor_.submit(std::move(*def), TriggerKind::Manual);
  if (handle) {
    log::info("Manually triggered task {} as execution {}", id, handle->id());
  }
  return handle;
}

auto Application::get_task_status(const TaskId& id) const
    -> std::optional<TaskStatus> {
  auto def = registry_.get(id);
  if (!def)
    return std::nullopt;

  TaskStatus status;
  status.id = def->id;
  status.name = def->name;
  status.description = def->description;
  status.frequency = def->frequency;
  status.priority = def->priority;
  status.enabled = def->enabled;
  status.next_due = schedule_.next_due(id);
  status.metrics = metrics_.snapshot(id).value_or(TaskMetrics{});
  status.active_executions = live_.list_for(id);
  status.resources = def->resources;
  status.dependencies = def->dependencies;
  return status;
}

auto Application::get_system_overview() const -> SystemOverview {
  SystemOverview overview;
  overview.system = monitor_.latest();
  overview.shedding_low_priority = monitor_.shedding_low_priority();
  overview.active_executions = live_.size();

  for (const auto& def : registry_.list()) {
    ++overview.total_tasks;
    if (def.enabled)
      ++overview.enabled_tasks;

    auto m = metrics_.snapshot(def.id).value_or(TaskMetrics{});
    overview.tasks.push_back(TaskSummary{
        .id = def.id,
        .enabled = def.enabled,
        .frequency = def.frequency,
        .next_due = schedule_.next_due(def.id),
        .total_executions = m.total_executions,
        .failure_rate = m.failure_rate,
    });
  }
  return overview;
}

auto Application::tick(TimePoint now) -> DispatchReport {
  return scheduler_.tick(now);
}

}  // namespace jobmaster
