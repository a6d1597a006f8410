#include "concurrent/partitioned_executor.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <gtest/gtest.h>

using muleguard::concurrent::PartitionedExecutor;

TEST(PartitionedExecutorTest, NeverUsesMoreSlicesThanItems) {
  PartitionedExecutor executor(4);
  EXPECT_EQ(executor.workerCount(), 4u);
  EXPECT_EQ(executor.sliceCount(0), 0u);
  EXPECT_EQ(executor.sliceCount(3), 3u);
  EXPECT_EQ(executor.sliceCount(100), 4u);

  PartitionedExecutor clamped(0);
  EXPECT_EQ(clamped.workerCount(), 1u);
}

TEST(PartitionedExecutorTest, SlicesAreContiguousAndCoverTheRange) {
  PartitionedExecutor executor(3);
  std::mutex mutex;
  using Range = std::pair<size_t, size_t>;
  std::vector<Range> ranges(3);

  executor.run(10, [&](size_t slice, size_t begin, size_t end) {
    std::lock_guard<std::mutex> lock(mutex);
    ranges[slice] = {begin, end};
  });

  EXPECT_EQ(ranges[0], Range(0, 4));
  EXPECT_EQ(ranges[1], Range(4, 7));
  EXPECT_EQ(ranges[2], Range(7, 10));
}

TEST(PartitionedExecutorTest, CollectPreservesIndexOrder) {
  for (size_t workers : {1u, 2u, 5u, 16u}) {
    PartitionedExecutor executor(workers);
    auto values = executor.collect<size_t>(37, [](size_t i, std::vector<size_t>& out) {
      if (i % 3 != 0) out.push_back(i);
    });

    std::vector<size_t> expected;
    for (size_t i = 0; i < 37; ++i) {
      if (i % 3 != 0) expected.push_back(i);
    }
    EXPECT_EQ(values, expected) << "workers=" << workers;
  }
}

TEST(PartitionedExecutorTest, EveryIndexRunsExactlyOnce) {
  PartitionedExecutor executor(4);
  std::vector<std::atomic<int>> hits(1000);
  executor.run(hits.size(), [&hits](size_t, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) hits[i].fetch_add(1);
  });

  for (const auto& hit : hits) EXPECT_EQ(hit.load(), 1);
}

TEST(PartitionedExecutorTest, RethrowsSliceFailureAfterJoin) {
  PartitionedExecutor executor(4);
  std::atomic<int> finished{0};

  EXPECT_THROW(executor.run(8, [&finished](size_t slice, size_t, size_t) {
                 if (slice == 2) throw std::runtime_error("slice failed");
                 finished.fetch_add(1);
               }),
               std::runtime_error);
  EXPECT_EQ(finished.load(), 3);
}

TEST(PartitionedExecutorTest, SingleSliceRunsOnCallingThread) {
  PartitionedExecutor executor(1);
  const auto caller = std::this_thread::get_id();
  std::thread::id observed;

  executor.run(50, [&observed](size_t slice, size_t begin, size_t end) {
    EXPECT_EQ(slice, 0u);
    EXPECT_EQ(begin, 0u);
    EXPECT_EQ(end, 50u);
    observed = std::this_thread::get_id();
  });
  EXPECT_EQ(observed, caller);
}

TEST(PartitionedExecutorTest, EmptyRangeNeverCallsTheTask) {
  PartitionedExecutor executor(4);
  bool called = false;
  executor.run(0, [&called](size_t, size_t, size_t) { called = true; });
  EXPECT_FALSE(called);
  EXPECT_TRUE(executor.collect<int>(0, [](size_t, std::vector<int>&) {}).empty());
}
