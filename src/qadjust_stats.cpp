/**
 * @file qadjust_stats.cpp
 * @brief Sample filtering, statistics and score aggregation
 */

#include "chunk_encode/qadjust.hpp"

#include <algorithm>
#include <cmath>

namespace chunk_encode {

// **----- FILTERS -----**

std::vector<double> filter_valid(const std::vector<double> &samples) {
  std::vector<double> out;
  out.reserve(samples.size());
  for (double s : samples) {
    if (s >= 0.0)
      out.push_back(s);
  }
  return out;
}

std::vector<double> filter_positive(const std::vector<double> &samples) {
  std::vector<double> out;
  out.reserve(samples.size());
  for (double s : samples) {
    if (s > 0.0)
      out.push_back(s);
  }
  return out;
}

// **----- STATISTICS -----**

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  double sum = 0.0;
  for (double v : values)
    sum += v;
  return sum / static_cast<double>(values.size());
}

double percentile(std::vector<double> values, double pct) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());

  const double rank = (pct / 100.0) * static_cast<double>(values.size() - 1);
  const size_t lo = static_cast<size_t>(std::floor(rank));
  const size_t hi = std::min(lo + 1, values.size() - 1);
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

double cube_mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  double sum = 0.0;
  for (double v : values)
    sum += v * v * v;
  return std::cbrt(sum / static_cast<double>(values.size()));
}

double median(std::vector<double> values) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());
  const size_t mid = values.size() / 2;
  if (values.size() % 2 == 1)
    return values[mid];
  return (values[mid - 1] + values[mid]) / 2.0;
}

double round_to_cents(double value) {
  return std::nearbyint(value * 100.0) / 100.0;
}

double weighted_mean_quantizer(std::vector<Chunk> chunks) {
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });

  double weighted_sum = 0.0;
  long long total_length = 0;
  for (const auto &c : chunks) {
    if (c.is_credits)
      continue;
    weighted_sum += c.quantizer * c.length;
    total_length += c.length;
  }
  if (total_length == 0)
    return 0.0;
  return round_to_cents(weighted_sum / static_cast<double>(total_length));
}

double weighted_mean_quantizer(std::vector<ChunkAdjustment> chunks) {
  std::sort(chunks.begin(), chunks.end(),
            [](const ChunkAdjustment &a, const ChunkAdjustment &b) {
              return a.chunk_id < b.chunk_id;
            });

  double weighted_sum = 0.0;
  long long total_length = 0;
  for (const auto &c : chunks) {
    weighted_sum += c.adjusted_q * c.length;
    total_length += c.length;
  }
  if (total_length == 0)
    return 0.0;
  return round_to_cents(weighted_sum / static_cast<double>(total_length));
}

// **----- AGGREGATORS -----**

void aggregate_percentile(ScoredChunk &chunk) {
  auto valid = filter_valid(chunk.raw_samples);
  chunk.score = mean(valid);
  chunk.secondary_score = percentile(valid, 5.0);
  chunk.has_secondary = !valid.empty();
}

void aggregate_cube_mean(ScoredChunk &chunk) {
  chunk.score = cube_mean(filter_positive(chunk.raw_samples));
}

void aggregate_mean(ScoredChunk &chunk) {
  chunk.score = mean(filter_valid(chunk.raw_samples));
}

} // namespace chunk_encode
