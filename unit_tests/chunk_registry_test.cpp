/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/chunk_registry.hpp"

#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

using namespace dgen;

namespace {

ChunkSet range(ChunkId first, ChunkId last) {
  ChunkSet chunks;
  for (ChunkId id = first; id <= last; ++id) {
    chunks.insert(id);
  }
  return chunks;
}

void expect_partition_of(const ChunkRegistry &registry, const ChunkSet &expected_range) {
  RecoverySnapshot snap = registry.snapshot();
  ChunkSet all;
  size_t total = snap.target.size() + snap.assigned.size() + snap.completed.size() +
                 snap.limbo.size();
  all.insert(snap.target.begin(), snap.target.end());
  all.insert(snap.assigned.begin(), snap.assigned.end());
  all.insert(snap.completed.begin(), snap.completed.end());
  all.insert(snap.limbo.begin(), snap.limbo.end());
  EXPECT_EQ(total, all.size()) << "sets are not disjoint";
  EXPECT_EQ(all, expected_range);
}

} // namespace

TEST(ChunkRegistryTest, StartsWithWholeRangeInTarget) {
  ChunkRegistry registry(range(0, 9));
  EXPECT_EQ(registry.count(ChunkState::TARGET), 10u);
  EXPECT_FALSE(registry.is_exhausted());
  expect_partition_of(registry, range(0, 9));
}

TEST(ChunkRegistryTest, PriorCompletedAreNotTargetedAgain) {
  ChunkRegistry registry(range(0, 9), range(0, 4));
  EXPECT_EQ(registry.ids(ChunkState::TARGET), range(5, 9));
  EXPECT_EQ(registry.ids(ChunkState::COMPLETED), range(0, 4));
}

TEST(ChunkRegistryTest, PriorCompletedOutsideRangeAreIgnored) {
  ChunkRegistry registry(range(0, 4), {3, 4, 100});
  EXPECT_EQ(registry.ids(ChunkState::COMPLETED), (ChunkSet{3, 4}));
  expect_partition_of(registry, range(0, 4));
}

TEST(ChunkRegistryTest, TakeHandsOutLowestIdsFirst) {
  ChunkRegistry registry(range(0, 9));
  EXPECT_EQ(registry.take(4), (std::vector<ChunkId>{0, 1, 2, 3}));
  EXPECT_EQ(registry.take(3), (std::vector<ChunkId>{4, 5, 6}));
  EXPECT_EQ(registry.ids(ChunkState::ASSIGNED), range(0, 6));
  expect_partition_of(registry, range(0, 9));
}

TEST(ChunkRegistryTest, TakeReturnsWhatIsLeft) {
  ChunkRegistry registry(range(0, 2));
  EXPECT_EQ(registry.take(10).size(), 3u);
  EXPECT_TRUE(registry.take(5).empty());
  EXPECT_TRUE(registry.take(0).empty());
}

TEST(ChunkRegistryTest, ReportResolvesAssignedChunks) {
  ChunkRegistry registry(range(0, 3));
  registry.take(4);
  registry.report(0, ChunkOutcome::SUCCEEDED);
  registry.report(1, ChunkOutcome::FAILED);
  EXPECT_EQ(registry.state_of(0), ChunkState::COMPLETED);
  EXPECT_EQ(registry.state_of(1), ChunkState::LIMBO);
  EXPECT_EQ(registry.state_of(2), ChunkState::ASSIGNED);
  EXPECT_EQ(registry.state_of(42), std::nullopt);
}

TEST(ChunkRegistryTest, ReportOnUnassignedChunkChangesNothing) {
  ChunkRegistry registry(range(0, 3));
  registry.take(1);
  registry.report(0, ChunkOutcome::SUCCEEDED);
  RecoverySnapshot before = registry.snapshot();

  EXPECT_THROW(registry.report(0, ChunkOutcome::SUCCEEDED), UnknownChunkError); // duplicate
  EXPECT_THROW(registry.report(2, ChunkOutcome::FAILED), UnknownChunkError);    // still target
  EXPECT_THROW(registry.report(99, ChunkOutcome::SUCCEEDED), UnknownChunkError); // outside range

  EXPECT_EQ(registry.snapshot(), before);
}

TEST(ChunkRegistryTest, AbandonMovesOnlyAssignedChunksToLimbo) {
  ChunkRegistry registry(range(0, 5));
  registry.take(3);
  registry.report(0, ChunkOutcome::SUCCEEDED);
  registry.abandon({0, 1, 2, 4, 77});

  EXPECT_EQ(registry.ids(ChunkState::LIMBO), (ChunkSet{1, 2}));
  EXPECT_EQ(registry.ids(ChunkState::COMPLETED), (ChunkSet{0}));
  EXPECT_EQ(registry.ids(ChunkState::TARGET), (ChunkSet{3, 4, 5}));

  registry.abandon({1, 2});
  EXPECT_EQ(registry.ids(ChunkState::LIMBO), (ChunkSet{1, 2}));
}

TEST(ChunkRegistryTest, RequeueReturnsLimboChunksToTarget) {
  ChunkRegistry registry(range(0, 3));
  registry.take(2);
  registry.abandon({0, 1});

  std::vector<ChunkId> moved = registry.requeue({1, 3});
  EXPECT_EQ(moved, (std::vector<ChunkId>{1}));
  EXPECT_EQ(registry.ids(ChunkState::TARGET), (ChunkSet{1, 2, 3}));
  EXPECT_EQ(registry.ids(ChunkState::LIMBO), (ChunkSet{0}));
  EXPECT_EQ(registry.take(1), (std::vector<ChunkId>{1}));
}

TEST(ChunkRegistryTest, ExhaustedOnceNothingIsTargetedOrAssigned) {
  ChunkRegistry registry(range(0, 1));
  registry.take(2);
  EXPECT_FALSE(registry.is_exhausted());
  registry.report(0, ChunkOutcome::SUCCEEDED);
  registry.abandon({1});
  EXPECT_TRUE(registry.is_exhausted());
}

TEST(ChunkRegistryTest, EmptyRangeIsExhausted) {
  ChunkRegistry registry(ChunkSet{});
  EXPECT_TRUE(registry.is_exhausted());
  EXPECT_TRUE(registry.take(3).empty());
}

TEST(ChunkRegistryTest, ConcurrentTakesNeverOverlap) {
  const ChunkSet all = range(0, 9999);
  ChunkRegistry registry(all);

  std::mutex result_mutex;
  std::vector<std::vector<ChunkId>> batches;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      while (true) {
        std::vector<ChunkId> batch = registry.take(static_cast<size_t>(t % 5 + 1));
        if (batch.empty()) {
          break;
        }
        std::lock_guard<std::mutex> lock(result_mutex);
        batches.push_back(std::move(batch));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  ChunkSet seen;
  size_t total = 0;
  for (const auto &batch : batches) {
    total += batch.size();
    seen.insert(batch.begin(), batch.end());
  }
  EXPECT_EQ(total, all.size());
  EXPECT_EQ(seen, all);
  EXPECT_EQ(registry.ids(ChunkState::ASSIGNED), all);
}

TEST(ChunkRegistryTest, TransitionsGoToTheGivenLogger) {
  auto logger = std::make_shared<Logger>("chunks_test", "", LogLevel::off);
  ChunkRegistry registry(range(0, 1), {}, logger);
  registry.take(1);
  registry.report(0, ChunkOutcome::SUCCEEDED);
  EXPECT_EQ(registry.count(ChunkState::COMPLETED), 1u);
}
