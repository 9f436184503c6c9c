#include "jobmaster/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobmaster;

class LockfreeQueueTest : public ::testing::Test {};

TEST_F(LockfreeQueueTest, PushPop) {
  BoundedMPSCQueue<std::string> queue(8);

  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.push("first"));
  EXPECT_TRUE(queue.push("second"));
  EXPECT_FALSE(queue.empty());

  EXPECT_EQ(queue.try_pop(), "first");
  EXPECT_EQ(queue.try_pop(), "second");
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST_F(LockfreeQueueTest, CapacityRoundsUpToPowerOfTwo) {
  EXPECT_EQ(BoundedMPSCQueue<int>(5).capacity(), 8u);
  EXPECT_EQ(BoundedMPSCQueue<int>(64).capacity(), 64u);
  EXPECT_EQ(BoundedMPSCQueue<int>(0).capacity(), 2u);
}

TEST_F(LockfreeQueueTest, RejectsPushWhenFull) {
  BoundedMPSCQueue<int> queue(4);
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(99));

  EXPECT_EQ(queue.try_pop(), 0);
  EXPECT_TRUE(queue.push(4));
  for (int expected = 1; expected <= 4; ++expected) {
    EXPECT_EQ(queue.try_pop(), expected);
  }
}

TEST_F(LockfreeQueueTest, WrapsAroundManyTimes) {
  BoundedMPSCQueue<int> queue(4);
  for (int i = 0; i < 1000; ++i) {
    ASSERT_TRUE(queue.push(i));
    ASSERT_EQ(queue.try_pop(), i);
  }
}

TEST_F(LockfreeQueueTest, ConcurrentProducersSingleConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> queue(1024);

  std::atomic<int> done_producers{0};
  std::vector<std::jthread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        while (!queue.push(p * kPerProducer + i)) {
          std::this_thread::yield();
        }
      }
      ++done_producers;
    });
  }

  std::vector<int> last_seen(kProducers, -1);
  int received = 0;
  bool ordered = true;
  while (received < kProducers * kPerProducer) {
    if (auto v = queue.try_pop()) {
      int producer = *v / kPerProducer;
      int seq = *v % kPerProducer;
      ordered = ordered && seq > last_seen[producer];
      last_seen[producer] = seq;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }

  producers.clear();
  EXPECT_EQ(done_producers.load(), kProducers);
  EXPECT_EQ(received, kProducers * kPerProducer);
  EXPECT_TRUE(ordered);
  EXPECT_TRUE(queue.empty());
}
