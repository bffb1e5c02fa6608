#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "sift_core/errors.hpp"
#include "sift_core/search/query_pool.hpp"

namespace sift_tests {

using namespace sift_core;

namespace {

QueryPool::Clock::time_point in(std::chrono::milliseconds delay) {
  return QueryPool::Clock::now() + delay;
}

}  // namespace

TEST(QueryPoolTest, Constructor_RejectsZeroThreads) {
  EXPECT_THROW(QueryPool pool(0), std::invalid_argument);
}

TEST(QueryPoolTest, Submit_ReturnsResultsAndErrors) {
  QueryPool pool(2);
  auto answer = pool.submit([]() { return 42; }, in(std::chrono::seconds(5)));
  auto failure = pool.submit([]() -> int { throw StorageError("disk gone"); },
                             in(std::chrono::seconds(5)));

  EXPECT_EQ(answer.get(), 42);
  EXPECT_THROW(failure.get(), StorageError);
  EXPECT_EQ(pool.size(), 2);
}

TEST(QueryPoolTest, Submit_JobQueuedPastItsDeadlineNeverRuns) {
  QueryPool pool(1);
  std::atomic<bool> ran{false};
  auto blocker = pool.submit(
      []() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return true;
      },
      in(std::chrono::seconds(5)));
  auto late = pool.submit(
      [&ran]() {
        ran.store(true);
        return true;
      },
      in(std::chrono::milliseconds(20)));

  EXPECT_TRUE(blocker.get());
  EXPECT_THROW(late.get(), QueryExpiredError);
  EXPECT_FALSE(ran.load());
}

TEST(QueryPoolTest, Submit_NeverRunsMoreJobsThanThreads) {
  QueryPool pool(2);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(pool.submit(
        [&running, &peak, i]() {
          const int now = ++running;
          int seen = peak.load();
          while (now > seen && !peak.compare_exchange_weak(seen, now)) {
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
          --running;
          return i;
        },
        in(std::chrono::seconds(5))));
  }
  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ(futures[i].get(), i);
  }
  EXPECT_LE(peak.load(), 2);
}

TEST(QueryPoolTest, Destructor_BreaksQueuedFutures) {
  std::future<int> queued;
  {
    QueryPool pool(1);
    pool.submit(
        []() {
          std::this_thread::sleep_for(std::chrono::milliseconds(100));
          return 0;
        },
        in(std::chrono::seconds(5)));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queued = pool.submit([]() { return 1; }, in(std::chrono::seconds(5)));
    EXPECT_EQ(pool.queued(), 1);
  }
  EXPECT_THROW(queued.get(), std::future_error);
}

}  // namespace sift_tests
