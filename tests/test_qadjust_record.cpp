/**
 * @file test_qadjust_record.cpp
 * @brief Persisted adjustment records and reuse validation
 */

#include <cstdio>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chunk_encode/chunk_planner.hpp"
#include "chunk_encode/qadjust_record.hpp"

using namespace chunk_encode;
using json = nlohmann::json;

namespace {

ChunkPlan sample_plan() {
  return plan_chunks({0, 200, 500}, 1000, 100, 30.0, 900, 40.0);
}

AdjustmentRecord linear_record(const ChunkPlan &plan) {
  AdjustmentRecord record;
  record.parameters.mode = QAdjustMode::LinearFit;
  record.parameters.encoder = EncoderFamily::Svt;
  record.parameters.min_chunk_length = 100;
  record.parameters.keyint = 240;
  record.parameters.base_q = 30.0;
  record.parameters.target = 1.25;
  record.parameters.analysis_preset = 7;
  record.parameters.skip = 3;
  record.avg_bitrate_kbps = 2345.5;

  record.result.mode = QAdjustMode::LinearFit;
  record.result.base_q = 30.0;
  record.result.target = 1.25;
  record.result.score_pass1 = 1.1;
  for (const auto &c : plan.by_id) {
    if (c.is_credits)
      continue;
    ChunkAdjustment adj;
    adj.chunk_id = c.id;
    adj.length = c.length;
    adj.pass2_q = 33.0;
    adj.score_pass1 = 1.0;
    adj.score_pass2 = 1.5;
    adj.adjusted_q = 27.25 + c.id;
    record.result.chunks.push_back(adj);
  }
  record.result.chunks.back().fallback = true;
  record.result.weighted_q = weighted_mean_quantizer(record.result.chunks);
  return record;
}

} // anonymous namespace

// **----- SERIALIZATION -----**

TEST(AdjustmentRecord, LinearFitKeys) {
  auto plan = sample_plan();
  json root = json::parse(adjustment_record_to_json(linear_record(plan)));

  const json &params = root.at("qualityParameters");
  EXPECT_EQ(params.at("mode").get<int>(), 2);
  EXPECT_EQ(params.at("encoder").get<std::string>(), "svt");
  EXPECT_EQ(params.at("minChunkLength").get<int>(), 100);
  EXPECT_EQ(params.at("keyint").get<int>(), 240);
  EXPECT_DOUBLE_EQ(root.at("avgBitratePass1").get<double>(), 2345.5);
  EXPECT_FALSE(root.contains("curve"));

  const json &chunks = root.at("chunks");
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].at("chunkNumber").get<int>(), 1);
  EXPECT_DOUBLE_EQ(chunks[0].at("crfPass2").get<double>(), 33.0);
  EXPECT_TRUE(chunks[2].at("fallback").get<bool>());
}

TEST(AdjustmentRecord, ParsesWhatItWrites) {
  auto plan = sample_plan();
  AdjustmentRecord original = linear_record(plan);
  AdjustmentRecord parsed;
  ASSERT_TRUE(
      adjustment_record_from_json(adjustment_record_to_json(original), parsed));

  EXPECT_EQ(parsed.parameters.mode, QAdjustMode::LinearFit);
  EXPECT_EQ(parsed.parameters.skip, 3);
  EXPECT_DOUBLE_EQ(parsed.result.weighted_q, original.result.weighted_q);
  ASSERT_EQ(parsed.result.chunks.size(), original.result.chunks.size());
  for (size_t i = 0; i < parsed.result.chunks.size(); ++i) {
    EXPECT_EQ(parsed.result.chunks[i].chunk_id,
              original.result.chunks[i].chunk_id);
    EXPECT_DOUBLE_EQ(parsed.result.chunks[i].adjusted_q,
                     original.result.chunks[i].adjusted_q);
  }
}

TEST(AdjustmentRecord, ProbeCurveKeepsCurve) {
  AdjustmentRecord record;
  record.parameters.mode = QAdjustMode::ProbeCurve;
  record.result.mode = QAdjustMode::ProbeCurve;
  record.result.analysis_q = 24.5;
  record.result.curve = {{10.0, 0.99}, {20.0, 0.95}};
  record.result.luma_min = 0.06;
  record.result.luma_max = 0.30;
  record.result.pq = true;

  AdjustmentRecord parsed;
  ASSERT_TRUE(
      adjustment_record_from_json(adjustment_record_to_json(record), parsed));
  EXPECT_DOUBLE_EQ(parsed.result.analysis_q, 24.5);
  ASSERT_EQ(parsed.result.curve.size(), 2u);
  EXPECT_DOUBLE_EQ(parsed.result.curve[1].score, 0.95);
  EXPECT_TRUE(parsed.result.pq);
}

TEST(AdjustmentRecord, RejectsBrokenRecords) {
  AdjustmentRecord record;
  EXPECT_FALSE(adjustment_record_from_json("not json", record));
  EXPECT_FALSE(adjustment_record_from_json("{\"chunks\": []}", record));
  EXPECT_FALSE(adjustment_record_from_json(
      R"({"qualityParameters": {"mode": 7, "encoder": "svt",
          "minChunkLength": 1, "keyint": 1, "baseQ": 1, "target": 1},
          "weightedCrf": 1, "chunks": []})",
      record));
}

TEST(AdjustmentRecord, FileRoundTrip) {
  auto plan = sample_plan();
  const std::string path = ::testing::TempDir() + "qadjust_record_test.json";
  ASSERT_TRUE(save_adjustment_record(path, linear_record(plan)));

  AdjustmentRecord loaded;
  ASSERT_TRUE(load_adjustment_record(path, loaded));
  EXPECT_EQ(loaded.result.chunks.size(), 3u);
  std::remove(path.c_str());

  EXPECT_FALSE(load_adjustment_record(path, loaded));
}

// **----- REUSE -----**

TEST(ReuseValidation, AcceptsMatchingPlan) {
  auto plan = sample_plan();
  AdjustmentRecord stored = linear_record(plan);
  std::string reason;
  EXPECT_TRUE(validate_reuse(stored, stored.parameters, plan, reason));
  EXPECT_TRUE(reason.empty());
}

TEST(ReuseValidation, RejectsChangedParameters) {
  auto plan = sample_plan();
  AdjustmentRecord stored = linear_record(plan);
  std::string reason;

  RecordParameters current = stored.parameters;
  current.mode = QAdjustMode::Percentile;
  EXPECT_FALSE(validate_reuse(stored, current, plan, reason));

  current = stored.parameters;
  current.encoder = EncoderFamily::X265;
  EXPECT_FALSE(validate_reuse(stored, current, plan, reason));

  current = stored.parameters;
  current.min_chunk_length = 150;
  EXPECT_FALSE(validate_reuse(stored, current, plan, reason));
  EXPECT_NE(reason.find("minimum chunk length"), std::string::npos);

  current = stored.parameters;
  current.keyint = 120;
  EXPECT_FALSE(validate_reuse(stored, current, plan, reason));
}

TEST(ReuseValidation, RejectsDifferentLayout) {
  auto plan = sample_plan();
  AdjustmentRecord stored = linear_record(plan);
  std::string reason;

  auto other = plan_chunks({0, 300, 500}, 1000, 100, 30.0, 900, 40.0);
  EXPECT_FALSE(validate_reuse(stored, stored.parameters, other, reason));

  auto fewer = plan_chunks({0, 500}, 1000, 100, 30.0, 900, 40.0);
  EXPECT_FALSE(validate_reuse(stored, stored.parameters, fewer, reason));
  EXPECT_NE(reason.find("chunks"), std::string::npos);
}
