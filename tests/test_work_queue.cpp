/**
 * @file test_work_queue.cpp
 * @brief Blocking queue ordering and shutdown
 */

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunk_encode/work_queue.hpp"

using namespace chunk_encode;

TEST(WorkQueue, PopsInFifoOrderThenDrains) {
  WorkQueue<int> queue;
  for (int i = 1; i <= 3; ++i)
    queue.push(i);
  queue.finish();

  int item = 0;
  for (int i = 1; i <= 3; ++i) {
    ASSERT_TRUE(queue.pop(item));
    EXPECT_EQ(item, i);
  }
  EXPECT_FALSE(queue.pop(item));
  EXPECT_TRUE(queue.is_done());
}

TEST(WorkQueue, FinishWakesEveryBlockedWorker) {
  /// Repeated so a missed wakeup shows up as a hang
  for (int round = 0; round < 200; ++round) {
    WorkQueue<int> queue;
    std::atomic<int> exited{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
      workers.emplace_back([&queue, &exited] {
        int item = 0;
        while (queue.pop(item)) {
        }
        ++exited;
      });
    }
    queue.push(round);
    queue.finish();
    for (auto &t : workers)
      t.join();
    EXPECT_EQ(exited.load(), 4);
  }
}

TEST(WorkQueue, PopForTimesOut) {
  WorkQueue<int> queue;
  int item = 0;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(item, std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(40));
}

TEST(WorkQueue, ClearDropsQueuedItems) {
  WorkQueue<int> queue;
  queue.push(1);
  queue.push(2);
  EXPECT_EQ(queue.clear(), 2u);
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.is_done());
}
