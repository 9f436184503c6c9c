#include "jobmaster/executor/live_executions.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace jobmaster;
using jobmaster::test::task_id;
using jobmaster::test::utc;
using namespace std::chrono_literals;

class LiveExecutionsTest : public ::testing::Test {
protected:
  auto add(std::string_view task, ExecutionStatus status, TimePoint started)
      -> TaskExecution {
    TaskExecution exec;
    exec.id = generate_execution_id();
    exec.task_id = task_id(task);
    exec.status = status;
    exec.started_at = started;
    live_.insert(exec);
    return exec;
  }

  LiveExecutions live_;
  TimePoint t0_ = utc(2024, 3, 15, 10);
};

TEST_F(LiveExecutionsTest, InsertUpdateErase) {
  auto exec = add("a", ExecutionStatus::Pending, t0_);
  EXPECT_EQ(live_.size(), 1u);
  EXPECT_EQ(live_.pending_count(), 1u);

  exec.status = ExecutionStatus::Running;
  live_.update(exec);
  auto got = live_.list_for(task_id("a"));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].status, ExecutionStatus::Running);
  EXPECT_EQ(live_.pending_count(), 0u);

  live_.erase(exec.id);
  EXPECT_TRUE(live_.list_for(task_id("a")).empty());
  EXPECT_EQ(live_.size(), 0u);
}

TEST_F(LiveExecutionsTest, CountsArePerTask) {
  add("a", ExecutionStatus::Running, t0_);
  add("a", ExecutionStatus::Retrying, t0_);
  add("b", ExecutionStatus::Pending, t0_);

  EXPECT_EQ(live_.count_for(task_id("a")), 2u);
  EXPECT_EQ(live_.count_for(task_id("b")), 1u);
  EXPECT_EQ(live_.count_for(task_id("c")), 0u);
  EXPECT_EQ(live_.pending_count(), 1u);
}

TEST_F(LiveExecutionsTest, ListForIsOrderedByStart) {
  auto late = add("a", ExecutionStatus::Running, t0_ + 5s);
  auto early = add("a", ExecutionStatus::Pending, t0_);
  add("b", ExecutionStatus::Running, t0_);

  auto list = live_.list_for(task_id("a"));
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].id, early.id);
  EXPECT_EQ(list[1].id, late.id);
}

TEST_F(LiveExecutionsTest, UpdateOfUnknownIdIsIgnored) {
  TaskExecution stray;
  stray.id = generate_execution_id();
  stray.task_id = task_id("a");
  live_.update(stray);
  EXPECT_EQ(live_.size(), 0u);
}
