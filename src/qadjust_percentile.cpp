/**
 * @file qadjust_percentile.cpp
 * @brief Percentile-match quality policy
 *
 * @details Chunks whose 5th percentile score falls below the global average
 *          get a lower quantizer, chunks above it a higher one. The
 *          correction is bounded around the base quantizer.
 */

#include "chunk_encode/qadjust.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "chunk_encode/logging.hpp"
#include "chunk_encode/system.hpp"

namespace chunk_encode {

double percentile_scale_factor(EncoderFamily family) {
  /// SVT-AV1 quantizers move half as much per unit of score
  return family == EncoderFamily::Svt ? 20.0 : 10.0;
}

double percentile_bound(double base_q, EncoderFamily family) {
  return family == EncoderFamily::Svt ? std::ceil(base_q * 0.125) : 2.0;
}

double percentile_quantizer(double base_q, double p5, double average,
                            EncoderFamily family) {
  if (average <= 0.0)
    return base_q;

  double deficit = 1.0 - p5 / average;
  double new_q =
      base_q - round_to_quarter(deficit * percentile_scale_factor(family));

  const double bound = percentile_bound(base_q, family);
  return std::clamp(new_q, base_q - bound, base_q + bound);
}

AdjustmentResult adjust_percentile(const std::vector<Chunk> &chunks,
                                   const std::vector<ScoredChunk> &scores,
                                   double base_q, EncoderFamily family) {
  AdjustmentResult result;
  result.mode = QAdjustMode::Percentile;
  result.base_q = base_q;

  std::map<int, const ScoredChunk *> by_id;
  for (const auto &s : scores)
    by_id[s.chunk_id] = &s;

  /// Global average over every valid sample, pooled in id order
  std::vector<double> pooled;
  for (const auto &entry : by_id) {
    auto valid = filter_valid(entry.second->raw_samples);
    pooled.insert(pooled.end(), valid.begin(), valid.end());
  }
  result.average_score = mean(pooled);
  result.target = result.average_score;

  std::vector<Chunk> ordered = chunks;
  std::sort(ordered.begin(), ordered.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });

  for (const auto &chunk : ordered) {
    if (chunk.is_credits)
      continue;

    ChunkAdjustment adj;
    adj.chunk_id = chunk.id;
    adj.length = chunk.length;
    adj.adjusted_q = base_q;

    auto it = by_id.find(chunk.id);
    if (it == by_id.end() || !it->second->has_secondary) {
      LOG_WARN("Chunk {} has no valid metric samples, keeping q {}", chunk.id,
               format_quantizer(base_q));
    } else {
      adj.percentile_5th = it->second->secondary_score;
      adj.adjusted_q = percentile_quantizer(base_q, adj.percentile_5th,
                                            result.average_score, family);
    }
    result.chunks.push_back(adj);
  }

  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

} // namespace chunk_encode
