/**
 * @file test_qadjust_curve.cpp
 * @brief Probe-curve adjustment and dark scene damping
 */

#include <cmath>
#include <map>

#include <gtest/gtest.h>

#include "chunk_encode/qadjust.hpp"

using namespace chunk_encode;

namespace {

std::vector<QCurvePoint> sample_curve() {
  return {{10.0, 0.99}, {30.0, 0.90}, {20.0, 0.95}};
}

} // anonymous namespace

// **----- CURVE -----**

TEST(ProbeCurve, QuantizersSpanTheRange) {
  auto qs = probe_quantizers(10.0, 50.0, 5);
  ASSERT_FALSE(qs.empty());
  EXPECT_LE(qs.size(), 5u);
  EXPECT_DOUBLE_EQ(qs.front(), 10.0);
  EXPECT_LT(qs.back(), 50.0);
  for (size_t i = 1; i < qs.size(); ++i) {
    EXPECT_LT(qs[i - 1], qs[i]);
    EXPECT_DOUBLE_EQ(std::fmod(qs[i] * 4.0, 1.0), 0.0);
  }
  EXPECT_TRUE(probe_quantizers(50.0, 10.0, 5).empty());
}

TEST(ProbeCurve, CurvePointIsLengthWeighted) {
  std::vector<Chunk> windows(2);
  windows[0].id = 1;
  windows[0].length = 100;
  windows[1].id = 2;
  windows[1].length = 300;
  std::vector<ScoredChunk> scores(2);
  scores[0].chunk_id = 2;
  scores[0].score = 0.8;
  scores[1].chunk_id = 1;
  scores[1].score = 0.4;

  QCurvePoint p = make_curve_point(22.0, windows, scores);
  EXPECT_DOUBLE_EQ(p.quantizer, 22.0);
  EXPECT_NEAR(p.score, 0.7, 1e-12);
}

TEST(ProbeCurve, InterpolatesInsideTheCurve) {
  double q = 0.0;
  ASSERT_TRUE(interpolate_quantizer(sample_curve(), 0.925, q));
  EXPECT_NEAR(q, 25.0, 1e-9);
}

TEST(ProbeCurve, ExtrapolatesFromEdgeSegment) {
  double q = 0.0;
  ASSERT_TRUE(interpolate_quantizer(sample_curve(), 1.0, q));
  EXPECT_NEAR(q, 7.5, 1e-9);
}

TEST(ProbeCurve, SinglePointCannotInterpolate) {
  double q = 0.0;
  EXPECT_FALSE(interpolate_quantizer({{20.0, 0.95}}, 0.9, q));
}

TEST(ProbeCurve, LocalSlope) {
  EXPECT_NEAR(curve_slope(sample_curve(), 25.0), -0.005, 1e-12);
  EXPECT_NEAR(curve_slope(sample_curve(), 12.0), -0.004, 1e-12);
  EXPECT_DOUBLE_EQ(curve_slope({{20.0, 0.95}}, 20.0), 0.0);
}

// **----- DAMPING -----**

TEST(LumaDamping, ScaleEndpoints) {
  EXPECT_DOUBLE_EQ(luma_scale(0.02, 0.06, 0.30, false), 0.0);
  EXPECT_DOUBLE_EQ(luma_scale(0.06, 0.06, 0.30, false), 0.0);
  EXPECT_DOUBLE_EQ(luma_scale(0.30, 0.06, 0.30, false), 1.0);
  EXPECT_DOUBLE_EQ(luma_scale(0.80, 0.06, 0.30, true), 1.0);
}

TEST(LumaDamping, ScaleCurves) {
  const double sdr = luma_scale(0.18, 0.06, 0.30, false);
  const double pq = luma_scale(0.18, 0.06, 0.30, true);
  EXPECT_NEAR(sdr, std::pow(0.5, 2.2), 1e-12);
  EXPECT_NEAR(pq, std::log10(5.5), 1e-12);
  EXPECT_GT(pq, sdr);
}

TEST(LumaDamping, OnlyRaisesAreDamped) {
  /// Score above target: raise the quantizer, scaled
  EXPECT_NEAR(curve_delta(0.96, 0.95, -0.005, 0.5), 1.0, 1e-9);
  /// Score below target: lower it, never scaled
  EXPECT_NEAR(curve_delta(0.94, 0.95, -0.005, 0.5), -2.0, 1e-9);
  EXPECT_NEAR(curve_delta(0.94, 0.95, -0.005, 0.0), -2.0, 1e-9);
  EXPECT_DOUBLE_EQ(curve_delta(0.94, 0.95, 0.0, 1.0), 0.0);
}

// **----- POLICY -----**

TEST(ProbeCurve, AdjustsAroundAnalysisQuantizer) {
  std::vector<Chunk> chunks(4);
  for (int i = 0; i < 4; ++i) {
    chunks[i].id = i + 1;
    chunks[i].length = 100;
  }
  chunks[3].is_credits = true;

  std::vector<ScoredChunk> scores(3);
  scores[0].chunk_id = 1;
  scores[0].score = 0.90;
  scores[1].chunk_id = 2;
  scores[1].score = 0.96;
  scores[2].chunk_id = 3;
  scores[2].score = 0.96;

  std::map<int, double> luma{{1, 0.02}, {2, 0.30}, {3, 0.06}};

  ProbeCurveSettings settings;
  settings.target = 0.925;
  settings.base_q = 18.0;
  settings.min_q = 10.0;
  settings.max_q = 50.0;

  AdjustmentResult result = adjust_probe_curve(chunks, scores, sample_curve(),
                                               25.0, luma, settings);
  EXPECT_EQ(result.mode, QAdjustMode::ProbeCurve);
  EXPECT_DOUBLE_EQ(result.analysis_q, 25.0);
  ASSERT_EQ(result.curve.size(), 3u);
  EXPECT_DOUBLE_EQ(result.curve.front().quantizer, 10.0);

  ASSERT_EQ(result.chunks.size(), 3u);
  /// Dark chunk below target still gets the full decrease
  EXPECT_DOUBLE_EQ(result.chunks[0].adjusted_q, 20.0);
  /// Bright chunk above target gets the full increase
  EXPECT_DOUBLE_EQ(result.chunks[1].adjusted_q, 32.0);
  /// Dark chunk above target is not raised
  EXPECT_DOUBLE_EQ(result.chunks[2].adjusted_q, 25.0);
}

TEST(ProbeCurve, ClampsToQuantizerBounds) {
  std::vector<Chunk> chunks(1);
  chunks[0].id = 1;
  chunks[0].length = 10;
  std::vector<ScoredChunk> scores(1);
  scores[0].chunk_id = 1;
  scores[0].score = 0.5;

  ProbeCurveSettings settings;
  settings.target = 0.925;
  settings.min_q = 12.0;
  settings.max_q = 40.0;

  AdjustmentResult result =
      adjust_probe_curve(chunks, scores, sample_curve(), 25.0, {}, settings);
  ASSERT_EQ(result.chunks.size(), 1u);
  EXPECT_DOUBLE_EQ(result.chunks[0].adjusted_q, 12.0);
}

TEST(ProbeCurve, KeepBaseQuantizer) {
  std::vector<Chunk> chunks(3);
  for (int i = 0; i < 3; ++i) {
    chunks[i].id = 3 - i;
    chunks[i].length = 10;
  }
  chunks[0].is_credits = true;

  AdjustmentResult result =
      keep_base_quantizer(chunks, QAdjustMode::ProbeCurve, 22.0, 0.95);
  ASSERT_EQ(result.chunks.size(), 2u);
  EXPECT_EQ(result.chunks[0].chunk_id, 1);
  EXPECT_EQ(result.chunks[1].chunk_id, 2);
  EXPECT_DOUBLE_EQ(result.weighted_q, 22.0);
}

TEST(ProbeCurve, RecomputeWithNewTarget) {
  std::vector<Chunk> chunks(1);
  chunks[0].id = 1;
  chunks[0].length = 10;
  std::vector<ScoredChunk> scores(1);
  scores[0].chunk_id = 1;
  scores[0].score = 0.925;

  ProbeCurveSettings settings;
  settings.target = 0.925;
  settings.min_q = 10.0;
  settings.max_q = 50.0;

  AdjustmentResult stored =
      adjust_probe_curve(chunks, scores, sample_curve(), 25.0, {}, settings);
  ASSERT_EQ(stored.chunks.size(), 1u);
  EXPECT_DOUBLE_EQ(stored.chunks[0].adjusted_q, 25.0);

  AdjustmentResult again = recompute_probe_curve(stored, 0.935, 10.0, 50.0);
  EXPECT_DOUBLE_EQ(again.target, 0.935);
  EXPECT_DOUBLE_EQ(again.chunks[0].adjusted_q, 23.0);
}
