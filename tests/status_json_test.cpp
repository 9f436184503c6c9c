#include "jobmaster/app/status_json.hpp"
#include "jobmaster/scheduler/state_strings.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace jobmaster;
using jobmaster::test::task_id;
using jobmaster::test::utc;
using namespace std::chrono_literals;

TEST(StatusJsonTest, ExecutionFields) {
  TaskExecution exec;
  exec.id = ExecutionId{"exec_1"};
  exec.task_id = task_id("etl");
  exec.trigger = TriggerKind::Manual;
  exec.started_at = utc(2024, 3, 15, 2, 0, 5);
  exec.completed_at = utc(2024, 3, 15, 2, 0, 9);
  exec.status = ExecutionStatus::Completed;
  exec.result = TaskPayload{{"rows", 42}};
  exec.retry_count = 1;
  exec.duration = 4000ms;

  auto j = execution_to_json(exec);
  EXPECT_EQ(j["execution_id"], "exec_1");
  EXPECT_EQ(j["task_id"], "etl");
  EXPECT_EQ(j["trigger"], std::string(trigger_kind_name(TriggerKind::Manual)));
  EXPECT_EQ(j["status"],
            std::string(execution_status_name(ExecutionStatus::Completed)));
  EXPECT_EQ(j["started_at"], "2024-03-15T02:00:05Z");
  EXPECT_EQ(j["completed_at"], "2024-03-15T02:00:09Z");
  EXPECT_EQ(j["result"]["rows"], 42);
  EXPECT_EQ(j["duration_ms"], 4000);
  EXPECT_FALSE(j.contains("error"));
}

TEST(StatusJsonTest, FailedExecutionCarriesError) {
  TaskExecution exec;
  exec.id = ExecutionId{"exec_2"};
  exec.task_id = task_id("etl");
  exec.status = ExecutionStatus::Failed;
  exec.error = "timed out after 50ms";
  exec.timed_out = true;

  auto j = execution_to_json(exec);
  EXPECT_EQ(j["error"], "timed out after 50ms");
  EXPECT_EQ(j["timed_out"], true);
  EXPECT_TRUE(j["completed_at"].is_null());
  EXPECT_FALSE(j.contains("result"));
}

TEST(StatusJsonTest, TaskStatusShape) {
  TaskStatus status;
  status.id = task_id("report");
  status.name = "Report";
  status.frequency = Frequency::Daily;
  status.priority = Priority::High;
  status.next_due = utc(2024, 3, 16, 2);
  status.dependencies = {task_id("etl")};
  status.metrics.total_executions = 4;
  status.metrics.failure_rate = 25.0;
  status.metrics.last_success = utc(2024, 3, 15, 2);

  auto j = task_status_to_json(status);
  EXPECT_EQ(j["task_id"], "report");
  EXPECT_EQ(j["frequency"], std::string(frequency_name(Frequency::Daily)));
  EXPECT_EQ(j["priority"], std::string(priority_name(Priority::High)));
  EXPECT_EQ(j["next_execution"], "2024-03-16T02:00:00Z");
  EXPECT_EQ(j["dependencies"], json::array({"etl"}));
  EXPECT_TRUE(j["active_executions"].is_array());
  EXPECT_EQ(j["metrics"]["total_executions"], 4);
  EXPECT_DOUBLE_EQ(j["metrics"]["failure_rate"].get<double>(), 25.0);
  EXPECT_EQ(j["metrics"]["last_success"], "2024-03-15T02:00:00Z");
  EXPECT_TRUE(j["metrics"]["last_failure"].is_null());
  EXPECT_EQ(j["metrics"]["performance_trend"],
            std::string(trend_name(PerformanceTrend::Stable)));
}

TEST(StatusJsonTest, OverviewShape) {
  SystemOverview overview;
  overview.total_tasks = 2;
  overview.enabled_tasks = 1;
  overview.tasks.push_back(TaskSummary{.id = task_id("a"),
                                       .enabled = true,
                                       .frequency = Frequency::Hourly,
                                       .next_due = utc(2024, 3, 15, 11),
                                       .total_executions = 3,
                                       .failure_rate = 0.0});

  auto without_system = overview_to_json(overview);
  EXPECT_TRUE(without_system["system_metrics"].is_null());
  EXPECT_EQ(without_system["total_registered_tasks"], 2);
  EXPECT_EQ(without_system["enabled_tasks"], 1);
  EXPECT_EQ(without_system["task_summary"]["a"]["next_execution"],
            "2024-03-15T11:00:00Z");

  SystemSnapshot snap;
  snap.sampled_at = utc(2024, 3, 15, 10);
  snap.cpu_percent = 95.0;
  snap.memory_percent = 40.0;
  snap.alerts = {Alert::HighCpuUsage};
  overview.system = snap;
  overview.shedding_low_priority = true;

  auto j = overview_to_json(overview);
  EXPECT_DOUBLE_EQ(j["system_metrics"]["cpu_usage"].get<double>(), 95.0);
  EXPECT_EQ(j["system_metrics"]["alerts"], json::array({"HIGH_CPU_USAGE"}));
  EXPECT_EQ(j["shedding_low_priority"], true);
}
