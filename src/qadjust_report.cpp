/**
 * @file qadjust_report.cpp
 * @brief Applying adjusted quantizers and the distribution chart
 */

#include "chunk_encode/qadjust.hpp"

#include <algorithm>
#include <iterator>
#include <map>

#include <fmt/core.h>

namespace chunk_encode {

namespace {

constexpr int BAR_WIDTH = 50;

/// Neighbours shown on each side of the median
constexpr size_t NEIGHBOURS = 5;

} // anonymous namespace

int apply_adjustments(const AdjustmentResult &result, ChunkPlan &plan) {
  std::map<int, double> quantizers;
  for (const auto &adj : result.chunks)
    quantizers[adj.chunk_id] = adj.adjusted_q;

  int updated = 0;
  for (auto &c : plan.by_id) {
    auto it = quantizers.find(c.id);
    if (it == quantizers.end() || c.is_credits)
      continue;
    if (c.quantizer != it->second)
      ++updated;
    c.quantizer = it->second;
  }
  for (auto &c : plan.by_length) {
    auto it = quantizers.find(c.id);
    if (it != quantizers.end() && !c.is_credits)
      c.quantizer = it->second;
  }
  return updated;
}

std::vector<std::string>
format_quantizer_distribution(const std::vector<Chunk> &chunks) {
  std::vector<std::string> lines;

  std::map<double, long long> length_by_q;
  std::vector<double> qs;
  long long total_length = 0;
  for (const auto &c : chunks) {
    if (c.is_credits)
      continue;
    length_by_q[c.quantizer] += c.length;
    qs.push_back(c.quantizer);
    total_length += c.length;
  }
  if (total_length == 0)
    return lines;

  /// Center on the median, or the nearest quantizer actually used
  double center = median(qs);
  if (length_by_q.find(center) == length_by_q.end()) {
    auto higher = length_by_q.upper_bound(center);
    center = (higher != length_by_q.end()) ? higher->first
                                           : length_by_q.rbegin()->first;
  }

  std::vector<double> shown;
  auto it = length_by_q.find(center);
  auto up = std::next(it);
  for (size_t i = 0; i < NEIGHBOURS && up != length_by_q.end(); ++i, ++up)
    shown.push_back(up->first);
  std::reverse(shown.begin(), shown.end());
  shown.push_back(center);
  auto down = it;
  for (size_t i = 0; i < NEIGHBOURS && down != length_by_q.begin(); ++i) {
    --down;
    shown.push_back(down->first);
  }

  lines.push_back(
      fmt::format("New q values centered around the median q '{:.2f}'", center));
  for (double q : shown) {
    double proportion =
        static_cast<double>(length_by_q[q]) / static_cast<double>(total_length);
    std::string bar(static_cast<size_t>(proportion * BAR_WIDTH), '#');
    lines.push_back(fmt::format("{:6.2f}: {:<{}} {:6.2f}%", q, bar, BAR_WIDTH,
                                proportion * 100.0));
  }
  lines.push_back(
      fmt::format("Final weighted CRF: {:.2f}", weighted_mean_quantizer(chunks)));
  return lines;
}

} // namespace chunk_encode
