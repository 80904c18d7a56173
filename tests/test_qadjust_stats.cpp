/**
 * @file test_qadjust_stats.cpp
 * @brief Statistics helpers and score aggregators
 */

#include <gtest/gtest.h>

#include "chunk_encode/qadjust.hpp"

using namespace chunk_encode;

TEST(Stats, PercentileInterpolatesLinearly) {
  EXPECT_DOUBLE_EQ(percentile({5, 1, 4, 2, 3}, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(percentile({10, 20}, 5.0), 10.5);
  EXPECT_DOUBLE_EQ(percentile({7}, 5.0), 7.0);
  EXPECT_DOUBLE_EQ(percentile({}, 5.0), 0.0);
}

TEST(Stats, CubeMeanWeighsLargeValues) {
  EXPECT_DOUBLE_EQ(cube_mean({2.0, 2.0}), 2.0);
  EXPECT_GT(cube_mean({1.0, 3.0}), mean({1.0, 3.0}));
  EXPECT_DOUBLE_EQ(cube_mean({}), 0.0);
}

TEST(Stats, Median) {
  EXPECT_DOUBLE_EQ(median({3, 1, 2}), 2.0);
  EXPECT_DOUBLE_EQ(median({4, 1, 3, 2}), 2.5);
}

TEST(Stats, Filters) {
  std::vector<double> samples{-1.0, 0.0, 2.5, -0.5, 7.0};
  EXPECT_EQ(filter_valid(samples).size(), 3u);
  EXPECT_EQ(filter_positive(samples).size(), 2u);
}

TEST(Stats, WeightedQuantizerIgnoresOrderAndCredits) {
  Chunk a, b, credits;
  a.id = 1;
  a.length = 100;
  a.quantizer = 20.0;
  b.id = 2;
  b.length = 300;
  b.quantizer = 30.0;
  credits.id = 3;
  credits.length = 1000;
  credits.quantizer = 60.0;
  credits.is_credits = true;

  EXPECT_DOUBLE_EQ(weighted_mean_quantizer(std::vector<Chunk>{a, b, credits}),
                   27.5);
  EXPECT_DOUBLE_EQ(weighted_mean_quantizer(std::vector<Chunk>{credits, b, a}),
                   27.5);
}

TEST(Aggregators, PercentileSkipsInvalidSamples) {
  ScoredChunk chunk;
  chunk.raw_samples = {80.0, -1.0, 60.0, 70.0};
  aggregate_percentile(chunk);
  EXPECT_DOUBLE_EQ(chunk.score, 70.0);
  EXPECT_TRUE(chunk.has_secondary);
  EXPECT_NEAR(chunk.secondary_score, 61.0, 1e-9);
}

TEST(Aggregators, CubeMeanSkipsBlackFrames) {
  ScoredChunk chunk;
  chunk.raw_samples = {0.0, 2.0, 2.0};
  aggregate_cube_mean(chunk);
  EXPECT_DOUBLE_EQ(chunk.score, 2.0);
}
