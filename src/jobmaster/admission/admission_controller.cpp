#include "jobmaster/admission/admission_controller.hpp"

#include "jobmaster/util/log.hpp"

#include <format>

namespace jobmaster {

namespace {

auto defer(Gate gate, std::string reason) -> AdmissionDecision {
  return AdmissionDecision{Verdict::Defer, gate, std::move(reason)};
}

}  // namespace

AdmissionController::AdmissionController(AdmissionConfig config,
                                         const LiveExecutions& live,
                                         const MetricsStore& metrics,
                                         const SystemMonitor& monitor)
    : config_(config), live_(live), metrics_(metrics), monitor_(monitor) {
}

auto AdmissionController::evaluate(const TaskDefinition& def,
                                   TimePoint now) const -> AdmissionDecision {
  if (auto d = check_concurrency(def))
    return *d;
  if (auto d = check_dependencies(def, now))
    return *d;
  if (auto d = check_conditions(def))
    return *d;
  if (auto d = check_resources(def))
    return *d;
  return AdmissionDecision{};
}

auto AdmissionController::check_concurrency(const TaskDefinition& def) const
    -> std::optional<AdmissionDecision> {
  auto live = live_.count_for(def.id);
  if (live < static_cast<std::size_t>(def.max_concurrent))
    return std::nullopt;
  return AdmissionDecision{
      Verdict::Skip, Gate::Concurrency,
      std::format("{} live execution(s), limit {}", live, def.max_concurrent)};
}

auto AdmissionController::check_dependencies(const TaskDefinition& def,
                                             TimePoint now) const
    -> std::optional<AdmissionDecision> {
  for (const auto& dep : def.dependencies) {
    auto last = metrics_.last_success(dep);
    if (!last) {
      return defer(Gate::Dependency,
                   std::format("dependency {} has never succeeded", dep));
    }
    if (now - *last > config_.dependency_freshness) {
      return defer(Gate::Dependency,
                   std::format("dependency {} last succeeded at {}", dep,
                               format_timestamp(*last)));
    }
  }
  return std::nullopt;
}

auto AdmissionController::check_conditions(const TaskDefinition& def) const
    -> std::optional<AdmissionDecision> {
  for (const auto& cond : def.conditions) {
    bool passed = false;
    try {
      passed = cond.check && cond.check();
    } catch (const std::exception& e) {
      log::warn("Condition {} of task {} threw: {}", cond.name, def.id,
                e.what());
    } catch (...) {
      log::warn("Condition {} of task {} threw a non-standard exception",
                cond.name, def.id);
    }
    if (!passed) {
      return defer(Gate::Condition,
                   std::format("condition {} not met", cond.name));
    }
  }
  return std::nullopt;
}

auto AdmissionController::check_resources(const TaskDefinition& def) const
    -> std::optional<AdmissionDecision> {
  if (def.priority == Priority::Low && monitor_.shedding_low_priority()) {
    return defer(Gate::Resource, "low-priority work is being shed");
  }

  // No reading yet: nothing to hold the task against.
  auto snap = monitor_.latest();
  if (!snap)
    return std::nullopt;

  double cpu = snap->cpu_percent + def.resources.cpu * 100.0;
  if (cpu > config_.cpu_ceiling) {
    return defer(Gate::Resource,
                 std::format("projected cpu {:.1f}% exceeds {:.1f}%", cpu,
                             config_.cpu_ceiling));
  }

  double memory = snap->memory_percent;
  if (snap->memory_total_mb > 0.0) {
    memory += def.resources.memory_mb / snap->memory_total_mb * 100.0;
  }
  if (memory > config_.memory_ceiling) {
    return defer(Gate::Resource,
                 std::format("projected memory {:.1f}% exceeds {:.1f}%",
                             memory, config_.memory_ceiling));
  }
  return std::nullopt;
}

}  // namespace jobmaster
