// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for predict::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering through push()/pop()
//   - try_pop() on empty and non-empty queues
//   - Blocking pop() waits for a producer
//   - close(): pushes are refused, blocked consumers are released, queued
//     items are still drained
//   - Multi-producer / multi-consumer delivery (each item exactly once)
// =============================================================================

#include "predict/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  predict::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  EXPECT_TRUE(queue.empty());

  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_EQ(queue.size(), static_cast<std::size_t>(kCount));

  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Blocking pop() must wait until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    std::optional<int> v = queue.pop();
    received.store(v.value_or(-2));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);  // Still blocked.

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. close() releases a consumer blocked on an empty queue.
// Why: TradeWorkerPool::stop() relies on this to join its workers.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseReleasesBlockedConsumer) {
  std::atomic<bool> got_nullopt{false};

  std::thread consumer([this, &got_nullopt] {
    got_nullopt.store(!queue.pop().has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();

  EXPECT_TRUE(got_nullopt.load());
  EXPECT_TRUE(queue.closed());
}

// -----------------------------------------------------------------------------
// 5. A closed queue refuses new items but hands out what it already holds.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ClosedQueueDrainsThenStops) {
  queue.push(1);
  queue.push(2);
  queue.close();
  queue.close();  // Idempotent.

  EXPECT_FALSE(queue.push(3));
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.pop(), 2);
  EXPECT_FALSE(queue.pop().has_value());
}

// -----------------------------------------------------------------------------
// 6. Concurrent multi-producer, multi-consumer stress test.
//
// How: 4 producers each push a unique range of ints; 4 consumers pop until
//      the queue is closed and drained. Every value must appear exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &per_consumer] {
      while (std::optional<int> item = queue.pop()) {
        per_consumer[c].push_back(*item);
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  for (auto& t : producers) t.join();
  queue.close();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
