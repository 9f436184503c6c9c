#include "jobmaster/admission/admission_controller.hpp"
#include "jobmaster/scheduler/schedule_table.hpp"

#include "test_utils.hpp"

#include <format>

#include <benchmark/benchmark.h>

using namespace jobmaster;
using jobmaster::test::FakeMetricsSource;
using jobmaster::test::make_task;
using jobmaster::test::succeed;
using jobmaster::test::task_id;

static void BM_ScheduleTableReschedule(benchmark::State& state) {
  const auto num_tasks = static_cast<int>(state.range(0));
  ScheduleTable table;
  std::vector<TaskId> ids;
  auto now = std::chrono::system_clock::now();
  for (int i = 0; i < num_tasks; ++i) {
    ids.push_back(task_id(std::format("task_{}", i)));
    table.schedule(ids.back(), now);
  }

  std::size_t i = 0;
  for (auto _ : state) {
    table.schedule(ids[i % ids.size()], now + std::chrono::seconds(i));
    ++i;
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_ScheduleTableDue(benchmark::State& state) {
  const auto num_tasks = static_cast<int>(state.range(0));
  ScheduleTable table;
  auto now = std::chrono::system_clock::now();
  for (int i = 0; i < num_tasks; ++i) {
    // Half the tasks are due.
    auto offset = std::chrono::minutes(i % 2 == 0 ? -1 : 1);
    table.schedule(task_id(std::format("task_{}", i)), now + offset);
  }

  for (auto _ : state) {
    auto due = table.due(now);
    benchmark::DoNotOptimize(due);
  }
  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_AdmissionEvaluate(benchmark::State& state) {
  LiveExecutions live;
  MetricsStore metrics;
  auto source = std::make_shared<FakeMetricsSource>();
  SystemMonitor monitor(MonitorConfig{}, source, live);
  if (!monitor.sample_now()) {
    state.SkipWithError("Failed to sample metrics");
    return;
  }
  AdmissionController admission(AdmissionConfig{}, live, metrics, monitor);

  auto now = std::chrono::system_clock::now();
  (void)metrics.record_success(task_id("upstream"),
                               std::chrono::milliseconds(5), 0, now);
  auto def = make_task("downstream", succeed());
  def.dependencies = {task_id("upstream")};
  def.conditions = {Condition{"always", [] { return true; }}};

  for (auto _ : state) {
    auto decision = admission.evaluate(def, now);
    benchmark::DoNotOptimize(decision);
  }
}

BENCHMARK(BM_ScheduleTableReschedule)->Arg(100)->Arg(10000);
BENCHMARK(BM_ScheduleTableDue)->Arg(100)->Arg(10000);
BENCHMARK(BM_AdmissionEvaluate);
