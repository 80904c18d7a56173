/**
 * @file test_qadjust_report.cpp
 * @brief Writing adjusted quantizers back into a plan, and the chart
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chunk_encode/chunk_planner.hpp"
#include "chunk_encode/qadjust.hpp"

using namespace chunk_encode;

namespace {

Chunk make_chunk(int id, int start, int length, double q,
                 bool credits = false) {
  Chunk c;
  c.id = id;
  c.start = start;
  c.end = start + length - 1;
  c.length = length;
  c.quantizer = q;
  c.is_credits = credits;
  return c;
}

ChunkAdjustment make_adjustment(int id, int length, double q) {
  ChunkAdjustment adj;
  adj.chunk_id = id;
  adj.length = length;
  adj.adjusted_q = q;
  return adj;
}

const Chunk &find_chunk(const std::vector<Chunk> &chunks, int id) {
  for (const auto &c : chunks)
    if (c.id == id)
      return c;
  ADD_FAILURE() << "chunk " << id << " missing";
  return chunks.front();
}

} // anonymous namespace

// **----- APPLY -----**

TEST(ApplyAdjustments, UpdatesBothViewsAndCountsChanges) {
  ChunkPlan plan = make_plan({make_chunk(1, 0, 100, 18.0),
                              make_chunk(2, 100, 300, 18.0),
                              make_chunk(3, 400, 200, 18.0),
                              make_chunk(4, 600, 50, 40.0, true)});

  AdjustmentResult result;
  result.chunks = {make_adjustment(1, 100, 20.0),
                   make_adjustment(2, 300, 18.0),
                   make_adjustment(3, 200, 16.0),
                   make_adjustment(4, 50, 30.0)};

  EXPECT_EQ(apply_adjustments(result, plan), 2);

  const double expected[] = {20.0, 18.0, 16.0, 40.0};
  for (int id = 1; id <= 4; ++id) {
    EXPECT_DOUBLE_EQ(find_chunk(plan.by_id, id).quantizer, expected[id - 1]);
    EXPECT_DOUBLE_EQ(find_chunk(plan.by_length, id).quantizer,
                     expected[id - 1]);
  }
  EXPECT_TRUE(find_chunk(plan.by_id, 4).is_credits);
}

TEST(ApplyAdjustments, ChunksWithoutAdjustmentKeepTheirQuantizer) {
  ChunkPlan plan = make_plan(
      {make_chunk(1, 0, 100, 18.0), make_chunk(2, 100, 100, 18.0)});
  AdjustmentResult result;
  result.chunks = {make_adjustment(2, 100, 22.0)};

  EXPECT_EQ(apply_adjustments(result, plan), 1);
  EXPECT_DOUBLE_EQ(find_chunk(plan.by_id, 1).quantizer, 18.0);
  EXPECT_DOUBLE_EQ(find_chunk(plan.by_length, 2).quantizer, 22.0);
}

// **----- DISTRIBUTION -----**

TEST(QuantizerDistribution, CentersOnMedianWithFiveNeighbours) {
  std::vector<Chunk> chunks;
  int start = 0;
  for (int i = 0; i < 12; ++i) {
    chunks.push_back(make_chunk(i + 1, start, 10, 10.0 + i));
    start += 10;
  }
  chunks.push_back(make_chunk(13, start, 1000, 40.0, true));

  auto lines = format_quantizer_distribution(chunks);

  // Header, 5 above, the median, 5 below, weighted mean
  ASSERT_EQ(lines.size(), 13u);
  EXPECT_NE(lines.front().find("'16.00'"), std::string::npos) << lines.front();
  EXPECT_EQ(lines[1].rfind(" 21.00:", 0), 0u) << lines[1];
  EXPECT_EQ(lines[6].rfind(" 16.00:", 0), 0u) << lines[6];
  EXPECT_EQ(lines[11].rfind(" 11.00:", 0), 0u) << lines[11];
  for (size_t i = 1; i < 12; ++i)
    EXPECT_NE(lines[i].find("8.33%"), std::string::npos) << lines[i];
  EXPECT_EQ(lines.back(), "Final weighted CRF: 15.50");
}

TEST(QuantizerDistribution, CreditsOnlyIsEmpty) {
  auto lines =
      format_quantizer_distribution({make_chunk(1, 0, 100, 40.0, true)});
  EXPECT_TRUE(lines.empty());
}
