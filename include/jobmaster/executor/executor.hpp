#pragma once

#include "jobmaster/config/system_config.hpp"
#include "jobmaster/core/error.hpp"
#include "jobmaster/executor/cancellation.hpp"
#include "jobmaster/executor/live_executions.hpp"
#include "jobmaster/metrics/metrics_store.hpp"
#include "jobmaster/notify/notifier.hpp"
#include "jobmaster/scheduler/task.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace jobmaster {

// Caller's view of one submitted execution. Copyable; every copy observes
// the same terminal TaskExecution.
class ExecutionHandle {
public:
  ExecutionHandle(ExecutionId id, std::shared_future<TaskExecution> result)
      : id_(std::move(id)), result_(std::move(result)) {
  }

  [[nodiscard]] auto id() const noexcept -> const ExecutionId& {
    return id_;
  }

  [[nodiscard]] auto ready() const -> bool {
    return result_.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  }

  auto wait() const -> const TaskExecution& {
    return result_.get();
  }

  template <typename Rep, typename Period>
  auto wait_for(std::chrono::duration<Rep, Period> d) const
      -> std::optional<TaskExecution> {
    if (result_.wait_for(d) != std::future_status::ready)
      return std::nullopt;
    return result_.get();
  }

private:
  ExecutionId id_;
  std::shared_future<TaskExecution> result_;
};

// Runs executions end-to-end on their own threads. Executions of one task
// are serialized by a per-task lock held across the whole retry chain and
// until a timed-out handler has returned; each attempt runs on a worker
// thread so the deadline can be enforced.
class Executor {
public:
  Executor(FailureConfig config, LiveExecutions& live, MetricsStore& metrics,
           std::shared_ptr<INotifier> notifier,
           ClockFn clock = system_clock_fn(),
           const std::any* resources = nullptr);
  ~Executor();

  Executor(const Executor&) = delete;
  auto operator=(const Executor&) -> Executor& = delete;

  // Records a PENDING execution and starts it. Fails with Cancelled once
  // shutdown has begun.
  [[nodiscard]] auto submit(TaskDefinition def, TriggerKind trigger)
      -> Result<ExecutionHandle>;

  // Blocks until every submitted execution has reached a terminal state.
  auto wait_idle() -> void;
  template <typename Rep, typename Period>
  auto wait_idle_for(std::chrono::duration<Rep, Period> d) -> bool {
    std::unique_lock lock(threads_mu_);
    return idle_cv_.wait_for(lock, d, [this] { return in_flight_ == 0; });
  }

  // Cancels retry waits and running handlers, then joins every thread,
  // including handlers still running past their deadline.
  auto shutdown() -> void;

  [[nodiscard]] auto in_flight() const -> std::size_t;

private:
  enum class Outcome : std::uint8_t { Succeeded, Failed, TimedOut, Aborted };

  struct Attempt {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    bool aborted{false};
    TaskResult result;
    CancellationSource cancel;
  };

  struct AttemptResult {
    Outcome outcome{Outcome::Failed};
    TaskResult result;
    // Set when the handler outlived its deadline or was aborted.
    std::thread worker;
  };

  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  auto run(TaskDefinition def, TaskExecution exec,
           std::promise<TaskExecution> promise) -> void;
  auto run_attempt(const TaskDefinition& def, const TaskExecution& exec,
                   int attempt) -> AttemptResult;
  auto handle_failure(const TaskDefinition& def, const TaskExecution& exec,
                      const TaskMetrics& metrics) -> void;
  auto finish(TaskExecution& exec, std::promise<TaskExecution>& promise)
      -> void;
  auto task_lock(const TaskId& id) -> std::shared_ptr<std::mutex>;
  auto notify(const TaskId& id, const FailureDetails& details) -> void;
  auto reap_finished_locked() -> void;

  FailureConfig config_;
  LiveExecutions& live_;
  MetricsStore& metrics_;
  std::shared_ptr<INotifier> notifier_;
  ClockFn clock_;
  const std::any* resources_;

  CancellationSource shutdown_;

  std::mutex locks_mu_;
  std::unordered_map<TaskId, std::shared_ptr<std::mutex>> task_locks_;

  std::mutex attempts_mu_;
  std::unordered_map<ExecutionId, std::shared_ptr<Attempt>> attempts_;

  mutable std::mutex threads_mu_;
  std::condition_variable idle_cv_;
  std::list<Worker> workers_;
  std::size_t in_flight_{0};
  bool stopping_{false};
};

}  // namespace jobmaster
