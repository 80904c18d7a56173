/**
 * @file qadjust_linear.cpp
 * @brief Two-pass linear-fit quality policy (SVT-AV1)
 *
 * @details Each chunk is encoded at quantizer 24 and again at 33 or 10.5,
 *          depending on which side of the target the first score landed.
 *          A line through the two (score, quantizer step) samples is solved
 *          for the target and the step converted back to a quantizer.
 */

#include "chunk_encode/qadjust.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>

#include "chunk_encode/logging.hpp"
#include "chunk_encode/system.hpp"

namespace chunk_encode {

namespace {

/// AV1 DC quantizer step per quantizer index (8-bit)
constexpr int DC_QSTEP[256] = {
    4, 9, 10, 13, 15, 17, 20, 22, 25, 28, 31, 34, 37, 40, 43, 47, 50, 53, 57, 60,
    64, 68, 71, 75, 78, 82, 86, 90, 93, 97, 101, 105, 109, 113, 116, 120, 124,
    128, 132, 136, 140, 143, 147, 151, 155, 159, 163, 166, 170, 174, 178, 182,
    185, 189, 193, 197, 200, 204, 208, 212, 215, 219, 223, 226, 230, 233, 237,
    241, 244, 248, 251, 255, 259, 262, 266, 269, 273, 276, 280, 283, 287, 290,
    293, 297, 300, 304, 307, 310, 314, 317, 321, 324, 327, 331, 334, 337, 343,
    350, 356, 362, 369, 375, 381, 387, 394, 400, 406, 412, 418, 424, 430, 436,
    442, 448, 454, 460, 466, 472, 478, 484, 490, 499, 507, 516, 525, 533, 542,
    550, 559, 567, 576, 584, 592, 601, 609, 617, 625, 634, 644, 655, 666, 676,
    687, 698, 708, 718, 729, 739, 749, 759, 770, 782, 795, 807, 819, 831, 844,
    856, 868, 880, 891, 906, 920, 933, 947, 961, 975, 988, 1001, 1015, 1030,
    1045, 1061, 1076, 1090, 1105, 1120, 1137, 1153, 1170, 1186, 1202, 1218, 1236,
    1253, 1271, 1288, 1306, 1323, 1342, 1361, 1379, 1398, 1416, 1436, 1456, 1476,
    1496, 1516, 1537, 1559, 1580, 1601, 1624, 1647, 1670, 1692, 1717, 1741, 1766,
    1791, 1817, 1844, 1871, 1900, 1929, 1958, 1990, 2021, 2054, 2088, 2123, 2159,
    2197, 2236, 2276, 2319, 2363, 2410, 2458, 2508, 2561, 2616, 2675, 2737, 2802,
    2871, 2944, 3020, 3102, 3188, 3280, 3375, 3478, 3586, 3702, 3823, 3953, 4089,
    4236, 4394, 4559, 4737, 4929, 5130, 5347};

/// Steps at quantizers 24, 33 and 10.5 (index = 4 * quantizer)
constexpr double STEP_PASS1 = 343.0;
constexpr double STEP_PASS2_HIGH = 592.0;
constexpr double STEP_PASS2_LOW = 155.0;

/// Steps above this are compressed toward it
constexpr double DAMPING_KNEE = 163.0;

constexpr double LINEAR_MIN_Q = 10.0;
constexpr double LINEAR_MAX_Q = 50.0;

struct DampingFactor {
  int threshold;
  double factor;
};

/// Factors keyed by final preset, picked by analysis preset
std::vector<DampingFactor> damping_factors(int analysis_preset) {
  if (analysis_preset >= 6)
    return {{-1, 0.72}, {0, 0.73}, {2, 0.76}, {5, 0.84}};
  if (analysis_preset >= 5)
    return {{-1, 0.82}, {0, 0.83}, {2, 0.86}};
  if (analysis_preset >= 3)
    return {{-1, 0.90}, {0, 0.91}, {2, 0.94}};
  return {};
}

/// Fractional quantizer index for a step, clamped to the table
double step_to_index(double step) {
  const int last = static_cast<int>(std::size(DC_QSTEP)) - 1;
  if (step <= DC_QSTEP[0])
    return 0.0;
  if (step >= DC_QSTEP[last])
    return static_cast<double>(last);

  const int *upper = std::upper_bound(DC_QSTEP, DC_QSTEP + last + 1, step);
  int hi = static_cast<int>(upper - DC_QSTEP);
  int lo = hi - 1;
  double frac = (step - DC_QSTEP[lo]) / double(DC_QSTEP[hi] - DC_QSTEP[lo]);
  return lo + frac;
}

} // anonymous namespace

double linear_pass2_quantizer(double score_pass1, double target) {
  return score_pass1 < target ? 33.0 : 10.5;
}

bool linear_fit_quantizer(double score_pass1, double score_pass2,
                          double step_pass1, double step_pass2, double target,
                          int analysis_preset, int final_preset, double min_q,
                          double max_q, double &q) {
  if (score_pass1 == score_pass2)
    return false;

  const double slope = (step_pass2 - step_pass1) / (score_pass2 - score_pass1);
  double step = step_pass1 + slope * (target - score_pass1);

  if (step > DAMPING_KNEE) {
    for (const auto &d : damping_factors(analysis_preset)) {
      if (final_preset <= d.threshold) {
        step = (step - DAMPING_KNEE) * d.factor + DAMPING_KNEE;
        break;
      }
    }
  }

  double quantizer = step_to_index(step) / 4.0;
  quantizer = std::clamp(quantizer, min_q, max_q);
  q = ceil_to_quarter(quantizer);
  return true;
}

namespace {

ChunkAdjustment fit_chunk(ChunkAdjustment adj, double target, double base_q,
                          int analysis_preset, int final_preset) {
  adj.fallback = false;

  /// A higher quantizer that scored better than the reference is noise
  if (adj.pass2_q > LINEAR_PASS1_Q && adj.score_pass2 < adj.score_pass1) {
    LOG_INFO("Fallback q {} used for chunk {}", format_quantizer(base_q),
             adj.chunk_id);
    adj.adjusted_q = base_q;
    adj.fallback = true;
    return adj;
  }

  const double step_pass2 =
      adj.pass2_q > LINEAR_PASS1_Q ? STEP_PASS2_HIGH : STEP_PASS2_LOW;

  double q = base_q;
  if (!linear_fit_quantizer(adj.score_pass1, adj.score_pass2, STEP_PASS1,
                            step_pass2, target, analysis_preset, final_preset,
                            LINEAR_MIN_Q, LINEAR_MAX_Q, q)) {
    LOG_WARN("Chunk {} scored {:.5f} in both passes, fallback q {} used",
             adj.chunk_id, adj.score_pass1, format_quantizer(base_q));
    adj.adjusted_q = base_q;
    adj.fallback = true;
    return adj;
  }

  adj.adjusted_q = q;
  return adj;
}

} // anonymous namespace

AdjustmentResult adjust_linear_fit(const std::vector<Chunk> &chunks,
                                   const std::vector<ScoredChunk> &pass1,
                                   const std::vector<ScoredChunk> &pass2,
                                   double target, double base_q,
                                   int analysis_preset, int final_preset) {
  AdjustmentResult result;
  result.mode = QAdjustMode::LinearFit;
  result.base_q = base_q;
  result.target = target;

  std::map<int, const ScoredChunk *> first, second;
  std::vector<double> pooled;
  for (const auto &s : pass1)
    first[s.chunk_id] = &s;
  for (const auto &s : pass2)
    second[s.chunk_id] = &s;
  for (const auto &entry : first) {
    auto positive = filter_positive(entry.second->raw_samples);
    pooled.insert(pooled.end(), positive.begin(), positive.end());
  }
  result.score_pass1 = cube_mean(pooled);

  std::vector<Chunk> ordered = chunks;
  std::sort(ordered.begin(), ordered.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });

  for (const auto &chunk : ordered) {
    if (chunk.is_credits)
      continue;

    ChunkAdjustment adj;
    adj.chunk_id = chunk.id;
    adj.length = chunk.length;

    auto a = first.find(chunk.id);
    auto b = second.find(chunk.id);
    if (a == first.end() || b == second.end()) {
      LOG_WARN("Chunk {} is missing a pass score, keeping q {}", chunk.id,
               format_quantizer(base_q));
      adj.adjusted_q = base_q;
      adj.fallback = true;
      result.chunks.push_back(adj);
      continue;
    }

    adj.score_pass1 = a->second->score;
    adj.score_pass2 = b->second->score;
    adj.pass2_q = linear_pass2_quantizer(adj.score_pass1, target);
    result.chunks.push_back(
        fit_chunk(adj, target, base_q, analysis_preset, final_preset));
  }

  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

AdjustmentResult recompute_linear_fit(const AdjustmentResult &stored,
                                      double target, int analysis_preset,
                                      int final_preset) {
  AdjustmentResult result = stored;
  result.target = target;
  for (auto &adj : result.chunks) {
    /// Chunks that never had a pass-2 encode cannot be refitted
    if (adj.pass2_q <= 0.0) {
      adj.adjusted_q = stored.base_q;
      continue;
    }
    adj = fit_chunk(adj, target, stored.base_q, analysis_preset, final_preset);
  }
  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

} // namespace chunk_encode
