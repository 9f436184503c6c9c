#include "jobmaster/scheduler/scheduler.hpp"

#include "jobmaster/scheduler/state_strings.hpp"
#include "jobmaster/util/log.hpp"

#include <algorithm>

namespace jobmaster {

namespace {

struct Candidate {
  TaskDefinition def;
  std::uint64_t order{0};
};

}  // namespace

Scheduler::Scheduler(SchedulerConfig config, TaskRegistry& registry,
                     ScheduleTable& schedule,
                     const AdmissionController& admission, Executor& executor,
                     ClockFn clock)
    : config_(std::move(config)),
      registry_(registry),
      schedule_(schedule),
      admission_(admission),
      executor_(executor),
      clock_(std::move(clock)) {
}

Scheduler::~Scheduler() {
  stop();
}

auto Scheduler::start() -> void {
  if (loop_.joinable())
    return;
  loop_ = std::jthread([this](std::stop_token st) { run(st); });
  log::info("Scheduler started (tick {}ms, tie-break {})",
            config_.tick_interval.count(), tie_break_name(config_.tie_break));
}

auto Scheduler::stop() -> void {
  if (!loop_.joinable())
    return;
  loop_.request_stop();
  wake_cv_.notify_all();
  loop_.join();
  log::info("Scheduler stopped");
}

auto Scheduler::tick(TimePoint now) -> DispatchReport {
  DispatchReport report;
  report.at = now;

  std::vector<Candidate> due;
  for (auto& id : schedule_.due(now)) {
    auto def = registry_.get(id);
    if (!def || !def->enabled) {
      schedule_.unschedule(id);
      continue;
    }
    due.push_back(Candidate{std::move(*def), registry_.order_of(id).value_or(0)});
  }
  if (due.empty())
    return report;

  auto by_priority = [](const Candidate& a, const Candidate& b) {
    return a.def.priority > b.def.priority;
  };
  if (config_.tie_break == TieBreak::Registration) {
    std::ranges::sort(due, [&](const Candidate& a, const Candidate& b) {
      if (a.def.priority != b.def.priority)
        return by_priority(a, b);
      return a.order < b.order;
    });
  } else {
    std::ranges::stable_sort(due, by_priority);
  }

  log::debug("Tick {}: {} task(s) due", format_timestamp(now), due.size());

  for (const auto& [def, order] : due) {
    auto decision = admission_.evaluate(def, now);
    switch (decision.verdict) {
      case Verdict::Skip:
        log::debug("Task {} skipped by {} gate: {}", def.id,
                   gate_name(*decision.gate), decision.reason);
        report.skipped.push_back(def.id);
        break;

      case Verdict::Defer: {
        std::optional<TimePoint> next;
        if (decision.gate == Gate::Resource) {
          auto backoff = now + admission_.config().resource_backoff;
          if (schedule_.advance(def.id, backoff))
            next = backoff;
        } else {
          next = schedule_.advance(def, now);
        }
        log::info("Task {} deferred by {} gate ({}); next due {}", def.id,
                  gate_name(*decision.gate), decision.reason,
                  next ? format_timestamp(*next) : "none (disabled)");
        report.deferred.emplace_back(def.id, *decision.gate);
        break;
      }

      case Verdict::Admit: {
        auto handle = executor_.submit(def, TriggerKind::Scheduled);
        if (!handle) {
          log::error("Failed to dispatch task {}: {}", def.id,
                     handle.error().message());
          break;
        }
        auto next = schedule_.advance(def, now);
        log::debug("Task {} ({}) admitted as {}; next due {}", def.id,
                   priority_name(def.priority), handle->id(),
                   next ? format_timestamp(*next) : "none (disabled)");
        report.admitted.push_back(def.id);
        break;
      }
    }
  }
  return report;
}

auto Scheduler::run(std::stop_token stop) -> void {
  while (!stop.stop_requested()) {
    auto wait = config_.tick_interval;
    try {
      tick(clock_());
      ++completed_ticks_;
    } catch (const std::exception& e) {
      log::error("Scheduler tick failed: {}", e.what());
      ++failed_ticks_;
      wait = config_.error_backoff;
    } catch (...) {
      log::error("Scheduler tick failed: non-standard exception");
      ++failed_ticks_;
      wait = config_.error_backoff;
    }

    std::unique_lock lock(wake_mu_);
    wake_cv_.wait_for(lock, stop, wait, [] { return false; });
  }
}

}  // namespace jobmaster
