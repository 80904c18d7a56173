/**
 * @file test_chunk_planner.cpp
 * @brief Scene merging, credits handling and probe window layout
 */

#include <gtest/gtest.h>

#include "chunk_encode/chunk_planner.hpp"

using namespace chunk_encode;

namespace {

void expect_range(const Chunk &c, int start, int end) {
  EXPECT_EQ(c.start, start);
  EXPECT_EQ(c.end, end);
  EXPECT_EQ(c.length, end - start + 1);
}

/// Chunks in id order tile [0, length) without gaps
void expect_coverage(const std::vector<Chunk> &by_id, int length) {
  ASSERT_FALSE(by_id.empty());
  EXPECT_EQ(by_id.front().start, 0);
  EXPECT_EQ(by_id.back().end, length - 1);
  for (size_t i = 1; i < by_id.size(); ++i)
    EXPECT_EQ(by_id[i].start, by_id[i - 1].end + 1);
}

} // anonymous namespace

// **----- SCENE CLEANUP -----**

TEST(SanitizeSceneChanges, AddsImplicitZero) {
  auto sc = sanitize_scene_changes({100, 200}, 300);
  ASSERT_EQ(sc.size(), 3u);
  EXPECT_EQ(sc[0], 0);
  EXPECT_EQ(sc[1], 100);
  EXPECT_EQ(sc[2], 200);
}

TEST(SanitizeSceneChanges, DropsOutOfRangeAndUnsorted) {
  auto sc = sanitize_scene_changes({0, -5, 100, 50, 100, 400, 250}, 300);
  std::vector<int> expected{0, 100, 250};
  EXPECT_EQ(sc, expected);
}

// **----- MERGING -----**

TEST(MergeScenes, AbsorbsShortScenes) {
  auto chunks = merge_scenes({0, 100, 150, 700}, 1000, 120, 18.0);
  ASSERT_EQ(chunks.size(), 3u);
  expect_range(chunks[0], 0, 149);
  expect_range(chunks[1], 150, 699);
  expect_range(chunks[2], 700, 999);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].id, static_cast<int>(i) + 1);
    EXPECT_DOUBLE_EQ(chunks[i].quantizer, 18.0);
    EXPECT_FALSE(chunks[i].is_credits);
  }
}

TEST(MergeScenes, EmptyListIsOneChunk) {
  auto chunks = merge_scenes({}, 500, 50, 30.0);
  ASSERT_EQ(chunks.size(), 1u);
  expect_range(chunks[0], 0, 499);
}

TEST(MergeScenes, MinimumLongerThanSource) {
  auto chunks = merge_scenes({0, 10, 20, 30}, 40, 1000, 30.0);
  ASSERT_EQ(chunks.size(), 1u);
  expect_range(chunks[0], 0, 39);
}

TEST(MergeScenes, EveryChunkButLastMeetsMinimum) {
  std::vector<int> sc;
  for (int f = 0; f < 2000; f += 37)
    sc.push_back(f);
  auto chunks = merge_scenes(sc, 2000, 100, 25.0);
  expect_coverage(chunks, 2000);
  for (size_t i = 0; i + 1 < chunks.size(); ++i)
    EXPECT_GE(chunks[i].length, 100);
}

// **----- CREDITS -----**

TEST(ApplyCredits, TruncatesAndAppends) {
  auto plan = plan_chunks({0, 100, 150, 700}, 1000, 120, 18.0, 950, 40.0);
  ASSERT_EQ(plan.by_id.size(), 4u);
  expect_range(plan.by_id[0], 0, 149);
  expect_range(plan.by_id[1], 150, 699);
  expect_range(plan.by_id[2], 700, 949);

  const Chunk &credits = plan.by_id[3];
  expect_range(credits, 950, 999);
  EXPECT_EQ(credits.id, 4);
  EXPECT_TRUE(credits.is_credits);
  EXPECT_DOUBLE_EQ(credits.quantizer, 40.0);
  expect_coverage(plan.by_id, 1000);
}

TEST(ApplyCredits, DropsChunksInsideCredits) {
  auto plan = plan_chunks({0, 300, 600, 900}, 1200, 100, 18.0, 500, 40.0);
  ASSERT_EQ(plan.by_id.size(), 3u);
  expect_range(plan.by_id[0], 0, 299);
  expect_range(plan.by_id[1], 300, 499);
  EXPECT_TRUE(plan.by_id[2].is_credits);
  expect_range(plan.by_id[2], 500, 1199);
}

TEST(ApplyCredits, MergesShortTail) {
  auto plan = plan_chunks({0, 300, 600}, 1000, 100, 18.0, 630, 40.0);
  ASSERT_EQ(plan.by_id.size(), 3u);
  expect_range(plan.by_id[0], 0, 299);
  expect_range(plan.by_id[1], 300, 629);
  expect_range(plan.by_id[2], 630, 999);
}

TEST(ApplyCredits, OutOfRangeIsIgnored) {
  auto chunks = merge_scenes({0, 500}, 1000, 100, 18.0);
  auto same = apply_credits(chunks, 0, 100, 40.0);
  ASSERT_EQ(same.size(), chunks.size());
  for (const auto &c : same)
    EXPECT_FALSE(c.is_credits);
}

// **----- PLAN VIEWS -----**

TEST(MakePlan, ViewsHoldTheSameChunks) {
  auto plan = plan_chunks({0, 100, 400, 450, 900}, 1000, 50, 20.0);
  ASSERT_EQ(plan.by_id.size(), plan.by_length.size());
  for (size_t i = 1; i < plan.by_id.size(); ++i)
    EXPECT_LT(plan.by_id[i - 1].id, plan.by_id[i].id);
  for (size_t i = 1; i < plan.by_length.size(); ++i)
    EXPECT_GE(plan.by_length[i - 1].length, plan.by_length[i].length);
  EXPECT_EQ(plan.by_length.front().length, 450);
}

// **----- PROBE WINDOWS -----**

TEST(ProbeChunks, WindowsAreEvenlySpacedAndDisjoint) {
  auto plan = plan_probe_chunks(10000, 4, 48, 0.1);
  ASSERT_EQ(plan.by_id.size(), 4u);
  for (size_t i = 0; i < plan.by_id.size(); ++i) {
    const Chunk &w = plan.by_id[i];
    EXPECT_EQ(w.id, static_cast<int>(i) + 1);
    EXPECT_EQ(w.length, 48);
    EXPECT_GE(w.start, 1000);
    EXPECT_LT(w.end, 10000);
    if (i > 0)
      EXPECT_GT(w.start, plan.by_id[i - 1].end);
  }
}

TEST(ProbeChunks, StayBeforeCredits) {
  auto plan = plan_probe_chunks(10000, 3, 100, 0.0, 6000);
  ASSERT_EQ(plan.by_id.size(), 3u);
  for (const auto &w : plan.by_id)
    EXPECT_LT(w.end, 6000);
}

TEST(ProbeChunks, WindowShrinksForShortSources) {
  auto plan = plan_probe_chunks(60, 4, 48, 0.0);
  ASSERT_EQ(plan.by_id.size(), 4u);
  for (const auto &w : plan.by_id)
    EXPECT_EQ(w.length, 15);
}
