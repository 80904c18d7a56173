/**
 * @file test_qadjust_percentile.cpp
 * @brief Percentile-match quantizer adjustment
 */

#include <gtest/gtest.h>

#include "chunk_encode/qadjust.hpp"

using namespace chunk_encode;

TEST(PercentileMatch, LowPercentileLowersQuantizer) {
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 60.0, 70.0, EncoderFamily::X265),
                   28.5);
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 60.0, 70.0, EncoderFamily::Svt),
                   27.25);
}

TEST(PercentileMatch, HighPercentileRaisesQuantizer) {
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 80.0, 70.0, EncoderFamily::X265),
                   31.5);
}

TEST(PercentileMatch, BoundedAroundBase) {
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 0.0, 70.0, EncoderFamily::X265),
                   28.0);
  /// ceil(30 / 8) = 4
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 0.0, 70.0, EncoderFamily::Svt),
                   26.0);
  EXPECT_DOUBLE_EQ(percentile_quantizer(30.0, 200.0, 70.0, EncoderFamily::Svt),
                   34.0);
}

TEST(PercentileMatch, AdjustsEveryRegularChunk) {
  std::vector<Chunk> chunks(3);
  for (int i = 0; i < 3; ++i) {
    chunks[i].id = i + 1;
    chunks[i].length = 100;
    chunks[i].quantizer = 30.0;
  }
  chunks[2].is_credits = true;

  std::vector<ScoredChunk> scores(2);
  scores[0].chunk_id = 2;
  scores[0].raw_samples = {80.0, 80.0};
  scores[1].chunk_id = 1;
  scores[1].raw_samples = {60.0, 60.0, -1.0};
  for (auto &s : scores)
    aggregate_percentile(s);

  AdjustmentResult result =
      adjust_percentile(chunks, scores, 30.0, EncoderFamily::X265);
  EXPECT_EQ(result.mode, QAdjustMode::Percentile);
  EXPECT_DOUBLE_EQ(result.average_score, 70.0);
  ASSERT_EQ(result.chunks.size(), 2u);
  EXPECT_EQ(result.chunks[0].chunk_id, 1);
  EXPECT_DOUBLE_EQ(result.chunks[0].adjusted_q, 28.5);
  EXPECT_EQ(result.chunks[1].chunk_id, 2);
  EXPECT_DOUBLE_EQ(result.chunks[1].adjusted_q, 31.5);
  EXPECT_DOUBLE_EQ(result.weighted_q, 30.0);
}

TEST(PercentileMatch, ChunkWithoutSamplesKeepsBase) {
  std::vector<Chunk> chunks(1);
  chunks[0].id = 1;
  chunks[0].length = 50;

  std::vector<ScoredChunk> scores(1);
  scores[0].chunk_id = 1;
  scores[0].raw_samples = {-1.0, -1.0};
  aggregate_percentile(scores[0]);

  AdjustmentResult result =
      adjust_percentile(chunks, scores, 25.0, EncoderFamily::Svt);
  ASSERT_EQ(result.chunks.size(), 1u);
  EXPECT_DOUBLE_EQ(result.chunks[0].adjusted_q, 25.0);
}
