#include "jobmaster/registry/task_registry.hpp"

#include "test_utils.hpp"

#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobmaster;
using jobmaster::test::make_task;
using jobmaster::test::succeed;
using jobmaster::test::task_id;

class TaskRegistryTest : public ::testing::Test {
protected:
  TaskRegistry registry_;
};

TEST_F(TaskRegistryTest, AddAndGet) {
  ASSERT_TRUE(registry_.add(make_task("a", succeed())));

  auto def = registry_.get(task_id("a"));
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->id, task_id("a"));
  EXPECT_TRUE(registry_.contains(task_id("a")));
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(TaskRegistryTest, DefaultsMatchDocumentedPolicy) {
  TaskDefinition def;
  def.id = task_id("defaults");
  def.handler = make_handler(succeed());
  ASSERT_TRUE(registry_.add(def));

  auto got = registry_.get(task_id("defaults"));
  ASSERT_TRUE(got);
  EXPECT_EQ(got->retry.count, 3);
  EXPECT_EQ(got->retry.delay, std::chrono::seconds(60));
  EXPECT_EQ(got->timeout, std::chrono::seconds(300));
  EXPECT_EQ(got->max_concurrent, 1);
  EXPECT_DOUBLE_EQ(got->resources.cpu, 0.5);
  EXPECT_DOUBLE_EQ(got->resources.memory_mb, 256.0);
  EXPECT_EQ(got->priority, Priority::Normal);
  EXPECT_TRUE(got->notify_on_failure);
}

TEST_F(TaskRegistryTest, RejectsDuplicateId) {
  ASSERT_TRUE(registry_.add(make_task("a", succeed())));
  auto r = registry_.add(make_task("a", succeed()));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(TaskRegistryTest, RejectsEmptyId) {
  auto r = registry_.add(make_task("", succeed()));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(TaskRegistryTest, RejectsMissingHandler) {
  auto def = make_task("a", succeed());
  def.handler = nullptr;
  auto r = registry_.add(def);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidHandler));

  // An empty std::function never produces a handler.
  EXPECT_EQ(make_handler(FunctionHandler::Fn{}), nullptr);
}

TEST_F(TaskRegistryTest, RejectsHandlerWithEmptyFunction) {
  auto def = make_task("a", succeed());
  def.handler = std::make_shared<FunctionHandler>(FunctionHandler::Fn{});
  auto r = registry_.add(def);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidHandler));
  EXPECT_FALSE(registry_.contains(task_id("a")));
}

TEST_F(TaskRegistryTest, RejectsUnknownDependency) {
  auto def = make_task("b", succeed());
  def.dependencies = {task_id("a")};
  auto r = registry_.add(def);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::UnknownDependency));
  EXPECT_FALSE(registry_.contains(task_id("b")));
}

TEST_F(TaskRegistryTest, SelfDependencyIsRejectedSoCyclesCannotForm) {
  auto def = make_task("loop", succeed());
  def.dependencies = {task_id("loop")};
  auto r = registry_.add(def);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::UnknownDependency));
}

TEST_F(TaskRegistryTest, AcceptsRegisteredDependencyAndDedupes) {
  ASSERT_TRUE(registry_.add(make_task("a", succeed())));
  auto def = make_task("b", succeed());
  def.dependencies = {task_id("a"), task_id("a")};
  ASSERT_TRUE(registry_.add(def));

  auto got = registry_.get(task_id("b"));
  ASSERT_TRUE(got);
  ASSERT_EQ(got->dependencies.size(), 1u);
  EXPECT_EQ(got->dependencies[0], task_id("a"));
}

TEST_F(TaskRegistryTest, RejectsInvalidPolicies) {
  auto negative_retries = make_task("a", succeed());
  negative_retries.retry.count = -1;
  EXPECT_FALSE(registry_.add(negative_retries));

  auto zero_timeout = make_task("b", succeed());
  zero_timeout.timeout = std::chrono::milliseconds(0);
  EXPECT_FALSE(registry_.add(zero_timeout));

  auto zero_concurrency = make_task("c", succeed());
  zero_concurrency.max_concurrent = 0;
  EXPECT_FALSE(registry_.add(zero_concurrency));

  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(TaskRegistryTest, AcceptsMaxConcurrentAboveOne) {
  auto def = make_task("wide", succeed());
  def.max_concurrent = 4;
  EXPECT_TRUE(registry_.add(def));
}

TEST_F(TaskRegistryTest, SetEnabled) {
  ASSERT_TRUE(registry_.add(make_task("a", succeed())));
  EXPECT_EQ(registry_.enabled_count(), 1u);

  ASSERT_TRUE(registry_.set_enabled(task_id("a"), false));
  EXPECT_FALSE(registry_.get(task_id("a"))->enabled);
  EXPECT_EQ(registry_.enabled_count(), 0u);

  auto r = registry_.set_enabled(task_id("missing"), true);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskRegistryTest, ListKeepsRegistrationOrder) {
  for (auto id : {"c", "a", "b"}) {
    ASSERT_TRUE(registry_.add(make_task(id, succeed())));
  }
  auto all = registry_.list();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, task_id("c"));
  EXPECT_EQ(all[1].id, task_id("a"));
  EXPECT_EQ(all[2].id, task_id("b"));

  EXPECT_EQ(registry_.order_of(task_id("c")), 0u);
  EXPECT_EQ(registry_.order_of(task_id("b")), 2u);
  EXPECT_FALSE(registry_.order_of(task_id("zzz")).has_value());
}

TEST_F(TaskRegistryTest, ConcurrentAddsOfSameIdAdmitExactlyOne) {
  constexpr int kThreads = 8;
  std::atomic<int> accepted{0};
  std::vector<std::jthread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (registry_.add(make_task("race", succeed())))
        ++accepted;
    });
  }
  threads.clear();
  EXPECT_EQ(accepted.load(), 1);
}
