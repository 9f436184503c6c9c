#include "jobmaster/metrics/metrics_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace jobmaster;
using jobmaster::test::task_id;
using jobmaster::test::utc;
using std::chrono::milliseconds;

class MetricsStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_.init(id_);
  }

  MetricsStore store_;
  TaskId id_ = task_id("t");
  TimePoint at_ = utc(2024, 3, 15, 12);
};

TEST_F(MetricsStoreTest, InitIsZeroed) {
  auto m = store_.snapshot(id_);
  ASSERT_TRUE(m);
  EXPECT_EQ(m->total_executions, 0u);
  EXPECT_EQ(m->successful_executions, 0u);
  EXPECT_EQ(m->failed_executions, 0u);
  EXPECT_DOUBLE_EQ(m->failure_rate, 0.0);
  EXPECT_FALSE(m->last_execution);
  EXPECT_FALSE(m->last_success);
  EXPECT_EQ(m->trend, PerformanceTrend::Stable);
  EXPECT_FALSE(store_.snapshot(task_id("other")));
}

TEST_F(MetricsStoreTest, InitKeepsExistingCounters) {
  (void)store_.record_success(id_, milliseconds(10), 0, at_);
  store_.init(id_);
  EXPECT_EQ(store_.snapshot(id_)->total_executions, 1u);
}

TEST_F(MetricsStoreTest, SuccessUpdatesCountersAndTimes) {
  auto m = store_.record_success(id_, milliseconds(100), 2, at_);
  EXPECT_EQ(m.total_executions, 1u);
  EXPECT_EQ(m.successful_executions, 1u);
  EXPECT_EQ(m.failed_executions, 0u);
  EXPECT_EQ(m.retried_attempts, 2u);
  EXPECT_EQ(m.average_execution_time, milliseconds(100));
  EXPECT_EQ(m.last_success, at_);
  EXPECT_EQ(m.last_execution, at_);
  EXPECT_FALSE(m.last_failure);
  EXPECT_EQ(store_.last_success(id_), at_);
}

TEST_F(MetricsStoreTest, FailureRateIsPercentOfTotal) {
  (void)store_.record_success(id_, milliseconds(10), 0, at_);
  (void)store_.record_failure(id_, milliseconds(10), 3, at_);
  (void)store_.record_failure(id_, milliseconds(10), 3, at_);
  auto m = store_.record_success(id_, milliseconds(10), 0, at_);

  EXPECT_EQ(m.total_executions, 4u);
  EXPECT_EQ(m.failed_executions, 2u);
  EXPECT_DOUBLE_EQ(m.failure_rate, 50.0);
  EXPECT_EQ(m.retried_attempts, 6u);
  EXPECT_EQ(m.last_failure, at_);
}

TEST_F(MetricsStoreTest, AverageIsCumulative) {
  (void)store_.record_success(id_, milliseconds(100), 0, at_);
  (void)store_.record_success(id_, milliseconds(300), 0, at_);
  auto m = store_.snapshot(id_);
  EXPECT_EQ(m->total_execution_time, milliseconds(400));
  EXPECT_EQ(m->average_execution_time, milliseconds(200));
}

TEST_F(MetricsStoreTest, TrendNeedsEnoughSamples) {
  (void)store_.record_success(id_, milliseconds(10), 0, at_);
  (void)store_.record_success(id_, milliseconds(1000), 0, at_);
  (void)store_.record_success(id_, milliseconds(5000), 0, at_);
  EXPECT_EQ(store_.snapshot(id_)->trend, PerformanceTrend::Stable);
}

TEST_F(MetricsStoreTest, TrendDetectsDegradation) {
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(100), 0, at_);
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(200), 0, at_);
  EXPECT_EQ(store_.snapshot(id_)->trend, PerformanceTrend::Degrading);
}

TEST_F(MetricsStoreTest, TrendDetectsImprovement) {
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(200), 0, at_);
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(100), 0, at_);
  EXPECT_EQ(store_.snapshot(id_)->trend, PerformanceTrend::Improving);
}

TEST_F(MetricsStoreTest, TrendWithinTenPercentIsStable) {
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(100), 0, at_);
  for (int i = 0; i < 5; ++i)
    (void)store_.record_success(id_, milliseconds(105), 0, at_);
  EXPECT_EQ(store_.snapshot(id_)->trend, PerformanceTrend::Stable);
}

TEST_F(MetricsStoreTest, TrendOnlyLooksAtRecentWindow) {
  // Old slow runs fall out of the window.
  for (int i = 0; i < 10; ++i)
    (void)store_.record_success(id_, milliseconds(1000), 0, at_);
  for (std::size_t i = 0; i < MetricsStore::kTrendWindow; ++i)
    (void)store_.record_success(id_, milliseconds(50), 0, at_);
  EXPECT_EQ(store_.snapshot(id_)->trend, PerformanceTrend::Stable);
}
