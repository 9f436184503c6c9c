#include "jobmaster/executor/executor.hpp"

#include "jobmaster/scheduler/state_strings.hpp"
#include "jobmaster/util/log.hpp"

#include <format>
#include <ranges>
#include <system_error>
#include <utility>

namespace jobmaster {

namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

auto invoke_handler(ITaskHandler& handler, TaskContext& ctx) -> TaskResult {
  try {
    return handler.execute(ctx);
  } catch (const std::exception& e) {
    return std::unexpected(TaskError{e.what()});
  } catch (...) {
    return std::unexpected(
        TaskError{"handler threw a non-standard exception"});
  }
}

auto elapsed_since(steady_clock::time_point start) -> milliseconds {
  return duration_cast<milliseconds>(steady_clock::now() - start);
}

}  // namespace

Executor::Executor(FailureConfig config, LiveExecutions& live,
                   MetricsStore& metrics, std::shared_ptr<INotifier> notifier,
                   ClockFn clock, const std::any* resources)
    : config_(config),
      live_(live),
      metrics_(metrics),
      notifier_(std::move(notifier)),
      clock_(std::move(clock)),
      resources_(resources) {
}

Executor::~Executor() {
  shutdown();
}

auto Executor::submit(TaskDefinition def, TriggerKind trigger)
    -> Result<ExecutionHandle> {
  TaskExecution exec;
  exec.id = generate_execution_id();
  exec.task_id = def.id;
  exec.trigger = trigger;
  exec.started_at = clock_();
  exec.status = ExecutionStatus::Pending;
  exec.usage.cpu_reserved = def.resources.cpu;
  exec.usage.memory_mb_reserved = def.resources.memory_mb;

  std::promise<TaskExecution> promise;
  ExecutionHandle handle{exec.id, promise.get_future().share()};

  std::lock_guard lock(threads_mu_);
  if (stopping_) {
    log::warn("Rejected execution of task {}: executor is shutting down",
              def.id);
    return fail(Error::Cancelled);
  }
  reap_finished_locked();

  live_.insert(exec);
  ++in_flight_;
  auto done = std::make_shared<std::atomic<bool>>(false);
  try {
    workers_.push_back(Worker{
        std::jthread([this, def = std::move(def), exec,
                      promise = std::move(promise), done]() mutable {
          run(std::move(def), std::move(exec), std::move(promise));
          {
            std::lock_guard guard(threads_mu_);
            --in_flight_;
          }
          idle_cv_.notify_all();
          done->store(true, std::memory_order_release);
        }),
        done});
  } catch (const std::system_error& e) {
    log::error("Failed to start execution {}: {}", exec.id, e.what());
    live_.erase(exec.id);
    --in_flight_;
    return fail(Error::Unknown);
  }
  return ok(std::move(handle));
}

auto Executor::reap_finished_locked() -> void {
  std::erase_if(workers_, [](const Worker& w) {
    return w.done->load(std::memory_order_acquire);
  });
}

auto Executor::task_lock(const TaskId& id) -> std::shared_ptr<std::mutex> {
  std::lock_guard lock(locks_mu_);
  auto& m = task_locks_[id];
  if (!m) {
    m = std::make_shared<std::mutex>();
  }
  return m;
}

auto Executor::run(TaskDefinition def, TaskExecution exec,
                   std::promise<TaskExecution> promise) -> void {
  auto lock = task_lock(def.id);
  std::unique_lock guard(*lock);

  if (shutdown_.is_cancelled()) {
    exec.status = ExecutionStatus::Cancelled;
    exec.error = "cancelled before start: engine shutting down";
    finish(exec, promise);
    return;
  }

  exec.status = ExecutionStatus::Running;
  exec.started_at = clock_();
  live_.update(exec);
  log::info("Executing task {} (execution {}, {})", def.id, exec.id,
            trigger_kind_name(exec.trigger));

  // A handler still running past its deadline keeps the task lock until it
  // returns, so no later execution of this task overlaps it.
  std::thread straggler;
  auto chain_start = steady_clock::now();
  for (int attempt = 1;; ++attempt) {
    auto attempt_start = steady_clock::now();
    auto [outcome, result, worker] = run_attempt(def, exec, attempt);
    straggler = std::move(worker);
    exec.usage.wall_time = elapsed_since(attempt_start);
    exec.duration = elapsed_since(chain_start);

    if (outcome == Outcome::Succeeded) {
      exec.status = ExecutionStatus::Completed;
      exec.result = std::move(*result);
      exec.error.clear();
      metrics_.record_success(def.id, exec.usage.wall_time, exec.retry_count,
                              clock_());
      log::info("Task {} completed in {}ms after {} retries", def.id,
                exec.duration.count(), exec.retry_count);
      break;
    }

    if (outcome == Outcome::Aborted) {
      exec.status = ExecutionStatus::Cancelled;
      exec.error = "cancelled: engine shutting down";
      log::warn("Task {} execution {} cancelled during attempt {}", def.id,
                exec.id, attempt);
      break;
    }

    if (outcome == Outcome::TimedOut) {
      exec.status = ExecutionStatus::Failed;
      exec.timed_out = true;
      exec.error = std::format("timed out after {}ms", def.timeout.count());
      log::error("Task {} timed out after {}ms (attempt {})", def.id,
                 def.timeout.count(), attempt);
      handle_failure(def, exec,
                     metrics_.record_failure(def.id, exec.usage.wall_time,
                                             exec.retry_count, clock_()));
      break;
    }

    exec.error = result.error().message;
    if (exec.retry_count < def.retry.count) {
      ++exec.retry_count;
      exec.status = ExecutionStatus::Retrying;
      live_.update(exec);
      log::warn("Task {} attempt {} failed: {}; retry {}/{} in {}ms", def.id,
                attempt, exec.error, exec.retry_count, def.retry.count,
                def.retry.delay.count());

      if (shutdown_.token().wait_for(def.retry.delay)) {
        exec.status = ExecutionStatus::Cancelled;
        exec.error = "cancelled during retry wait: engine shutting down";
        log::warn("Task {} execution {} cancelled while waiting to retry",
                  def.id, exec.id);
        break;
      }
      exec.status = ExecutionStatus::Running;
      live_.update(exec);
      continue;
    }

    exec.status = ExecutionStatus::Failed;
    log::error("Task {} failed after {} retries: {}", def.id, exec.retry_count,
               exec.error);
    handle_failure(def, exec,
                   metrics_.record_failure(def.id, exec.usage.wall_time,
                                           exec.retry_count, clock_()));
    break;
  }

  finish(exec, promise);
  if (straggler.joinable()) {
    log::warn("Task {} held until its cancelled handler returns (execution {})",
              def.id, exec.id);
    straggler.join();
  }
}

auto Executor::run_attempt(const TaskDefinition& def,
                           const TaskExecution& exec, int attempt)
    -> AttemptResult {
  auto state = std::make_shared<Attempt>();
  {
    std::lock_guard lock(attempts_mu_);
    if (shutdown_.is_cancelled()) {
      return {Outcome::Aborted, {}};
    }
    attempts_[exec.id] = state;
  }

  TaskContext ctx{def.id, exec.id, attempt, exec.trigger,
                  state->cancel.token(), resources_};
  std::thread worker;
  try {
    worker = std::thread([handler = def.handler, state, ctx]() mutable {
      auto r = invoke_handler(*handler, ctx);
      {
        std::lock_guard lock(state->mu);
        state->result = std::move(r);
        state->done = true;
      }
      state->cv.notify_all();
    });
  } catch (const std::system_error& e) {
    {
      std::lock_guard lock(attempts_mu_);
      attempts_.erase(exec.id);
    }
    log::error("Failed to start attempt {} of task {}: {}", attempt, def.id,
               e.what());
    return {Outcome::Failed,
            std::unexpected(TaskError{
                std::format("could not start handler thread: {}", e.what())}),
            {}};
  }

  bool done = false;
  bool aborted = false;
  {
    std::unique_lock lock(state->mu);
    state->cv.wait_for(lock, def.timeout,
                       [&] { return state->done || state->aborted; });
    done = state->done;
    aborted = state->aborted;
  }

  {
    std::lock_guard lock(attempts_mu_);
    attempts_.erase(exec.id);
  }

  if (done) {
    worker.join();
    auto outcome = state->result ? Outcome::Succeeded : Outcome::Failed;
    return {outcome, std::move(state->result), {}};
  }

  // The handler keeps its thread until it notices the token; the caller
  // joins it after publishing the outcome.
  state->cancel.cancel();
  return {aborted ? Outcome::Aborted : Outcome::TimedOut, {},
          std::move(worker)};
}

auto Executor::handle_failure(const TaskDefinition& def,
                              const TaskExecution& exec,
                              const TaskMetrics& metrics) -> void {
  auto details = FailureDetails{
      .kind = FailureKind::TerminalFailure,
      .execution_id = exec.id,
      .error = exec.error,
      .timed_out = exec.timed_out,
      .retry_count = exec.retry_count,
      .failure_rate = metrics.failure_rate,
      .total_executions = metrics.total_executions,
      .at = clock_(),
  };

  if (def.notify_on_failure) {
    notify(def.id, details);
  }

  if (metrics.failure_rate > config_.consistent_failure_rate &&
      metrics.total_executions > config_.consistent_failure_min_runs) {
    log::error("Task {} is consistently failing: {:.1f}% of {} executions",
               def.id, metrics.failure_rate, metrics.total_executions);
    details.kind = FailureKind::ConsistentlyFailing;
    notify(def.id, details);
  }
}

auto Executor::notify(const TaskId& id, const FailureDetails& details)
    -> void {
  if (!notifier_)
    return;
  try {
    notifier_->notify(id, details);
  } catch (const std::exception& e) {
    log::error("Notifier failed for task {}: {}", id, e.what());
  } catch (...) {
    log::error("Notifier failed for task {}: non-standard exception", id);
  }
}

auto Executor::finish(TaskExecution& exec,
                      std::promise<TaskExecution>& promise) -> void {
  exec.completed_at = clock_();
  live_.erase(exec.id);
  log::debug("Execution {} of task {} finished: {}", exec.id, exec.task_id,
             execution_status_name(exec.status));
  promise.set_value(exec);
}

auto Executor::wait_idle() -> void {
  std::unique_lock lock(threads_mu_);
  idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

auto Executor::in_flight() const -> std::size_t {
  std::lock_guard lock(threads_mu_);
  return in_flight_;
}

auto Executor::shutdown() -> void {
  {
    std::lock_guard lock(threads_mu_);
    if (std::exchange(stopping_, true))
      return;
  }

  shutdown_.cancel();
  {
    std::lock_guard lock(attempts_mu_);
    for (auto& state : attempts_ | std::views::values) {
      state->cancel.cancel();
      {
        std::lock_guard guard(state->mu);
        state->aborted = true;
      }
      state->cv.notify_all();
    }
  }

  std::list<Worker> workers;
  {
    std::lock_guard lock(threads_mu_);
    workers.swap(workers_);
  }
  if (!workers.empty()) {
    log::info("Waiting for {} execution(s) to wind down", workers.size());
  }
  workers.clear();
  log::info("Executor stopped");
}

}  // namespace jobmaster
