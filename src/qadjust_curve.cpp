/**
 * @file qadjust_curve.cpp
 * @brief Probe-curve quality policy with dark scene damping
 *
 * @details A handful of short probe windows are encoded at several
 *          quantizers. The resulting (quantizer, score) curve gives the
 *          global analysis quantizer for the target score and, around it,
 *          the local slope used to turn each chunk's score error into a
 *          quantizer correction.
 *
 * @attention Raising the quantizer of dark scenes is where banding shows
 *            first, so raises are scaled down by average luma. Lowering is
 *            never damped.
 */

#include "chunk_encode/qadjust.hpp"

#include <algorithm>
#include <cmath>

#include "chunk_encode/logging.hpp"
#include "chunk_encode/system.hpp"

namespace chunk_encode {

namespace {

constexpr double PROBE_EXPONENT = 1.4;

void sort_by_quantizer(std::vector<QCurvePoint> &curve) {
  std::sort(curve.begin(), curve.end(),
            [](const QCurvePoint &a, const QCurvePoint &b) {
              return a.quantizer < b.quantizer;
            });
}

ChunkAdjustment correct_chunk(ChunkAdjustment adj,
                              const std::vector<QCurvePoint> &curve,
                              double analysis_q, double target, double min_q,
                              double max_q, double luma_min, double luma_max,
                              bool pq) {
  const double slope = curve_slope(curve, analysis_q);

  /// Unknown luma is treated as bright
  const double scale =
      adj.luma < 0.0 ? 1.0 : luma_scale(adj.luma, luma_min, luma_max, pq);

  adj.delta_q = curve_delta(adj.score, target, slope, scale);
  adj.adjusted_q =
      std::clamp(round_to_quarter(analysis_q + adj.delta_q), min_q, max_q);
  return adj;
}

} // anonymous namespace

// **----- CURVE -----**

std::vector<double> probe_quantizers(double lo, double hi, int n) {
  std::vector<double> qs;
  if (n <= 0 || lo <= 0.0 || hi <= lo)
    return qs;

  for (int k = 0; k < n; ++k) {
    double t = std::pow(static_cast<double>(k) / n, PROBE_EXPONENT);
    qs.push_back(round_to_quarter(lo * std::pow(hi / lo, t)));
  }
  std::sort(qs.begin(), qs.end());
  qs.erase(std::unique(qs.begin(), qs.end()), qs.end());
  return qs;
}

QCurvePoint make_curve_point(double quantizer,
                             const std::vector<Chunk> &windows,
                             const std::vector<ScoredChunk> &scores) {
  QCurvePoint point;
  point.quantizer = quantizer;

  double weighted = 0.0;
  long long total = 0;
  for (const auto &w : windows) {
    for (const auto &s : scores) {
      if (s.chunk_id != w.id)
        continue;
      weighted += s.score * w.length;
      total += w.length;
      break;
    }
  }
  point.score = total > 0 ? weighted / static_cast<double>(total) : 0.0;
  return point;
}

bool interpolate_quantizer(std::vector<QCurvePoint> curve, double target,
                           double &q) {
  std::sort(curve.begin(), curve.end(),
            [](const QCurvePoint &a, const QCurvePoint &b) {
              return a.score < b.score;
            });
  curve.erase(std::unique(curve.begin(), curve.end(),
                          [](const QCurvePoint &a, const QCurvePoint &b) {
                            return a.score == b.score;
                          }),
              curve.end());
  if (curve.size() < 2)
    return false;

  /// Bracketing segment, or the edge segment outside the curve
  size_t hi = 1;
  while (hi < curve.size() - 1 && curve[hi].score < target)
    ++hi;
  const QCurvePoint &a = curve[hi - 1];
  const QCurvePoint &b = curve[hi];

  double t = (target - a.score) / (b.score - a.score);
  q = a.quantizer + t * (b.quantizer - a.quantizer);
  return true;
}

double curve_slope(std::vector<QCurvePoint> curve, double q) {
  sort_by_quantizer(curve);
  curve.erase(std::unique(curve.begin(), curve.end(),
                          [](const QCurvePoint &a, const QCurvePoint &b) {
                            return a.quantizer == b.quantizer;
                          }),
              curve.end());
  if (curve.size() < 2)
    return 0.0;

  size_t hi = 1;
  while (hi < curve.size() - 1 && curve[hi].quantizer < q)
    ++hi;
  const QCurvePoint &a = curve[hi - 1];
  const QCurvePoint &b = curve[hi];
  return (b.score - a.score) / (b.quantizer - a.quantizer);
}

// **----- DAMPING -----**

double luma_scale(double luma, double luma_min, double luma_max, bool pq) {
  if (luma <= luma_min)
    return 0.0;
  if (luma >= luma_max)
    return 1.0;

  const double t = (luma - luma_min) / (luma_max - luma_min);
  if (pq)
    return std::log(1.0 + 9.0 * t) / std::log(10.0);
  return std::pow(t, 2.2);
}

double curve_delta(double score, double target, double slope, double scale) {
  if (slope == 0.0)
    return 0.0;
  double delta = -(score - target) / slope;
  if (delta > 0.0)
    delta *= scale;
  return delta;
}

// **----- POLICY -----**

AdjustmentResult adjust_probe_curve(const std::vector<Chunk> &chunks,
                                    const std::vector<ScoredChunk> &scores,
                                    const std::vector<QCurvePoint> &curve,
                                    double analysis_q,
                                    const std::map<int, double> &luma,
                                    const ProbeCurveSettings &settings) {
  AdjustmentResult result;
  result.mode = QAdjustMode::ProbeCurve;
  result.base_q = settings.base_q;
  result.target = settings.target;
  result.analysis_q = analysis_q;
  result.curve = curve;
  sort_by_quantizer(result.curve);
  result.luma_min = settings.luma_min;
  result.luma_max = settings.luma_max;
  result.pq = settings.pq;

  std::vector<Chunk> ordered = chunks;
  std::sort(ordered.begin(), ordered.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });

  for (const auto &chunk : ordered) {
    if (chunk.is_credits)
      continue;

    ChunkAdjustment adj;
    adj.chunk_id = chunk.id;
    adj.length = chunk.length;

    auto l = luma.find(chunk.id);
    if (l != luma.end())
      adj.luma = l->second;

    auto s = std::find_if(scores.begin(), scores.end(),
                          [&chunk](const ScoredChunk &sc) {
                            return sc.chunk_id == chunk.id;
                          });
    if (s == scores.end()) {
      LOG_WARN("Chunk {} has no analysis score, keeping q {}", chunk.id,
               format_quantizer(analysis_q));
      adj.adjusted_q =
          std::clamp(round_to_quarter(analysis_q), settings.min_q,
                     settings.max_q);
      result.chunks.push_back(adj);
      continue;
    }

    adj.score = s->score;
    result.chunks.push_back(correct_chunk(
        adj, result.curve, analysis_q, settings.target, settings.min_q,
        settings.max_q, settings.luma_min, settings.luma_max, settings.pq));
  }

  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

AdjustmentResult keep_base_quantizer(const std::vector<Chunk> &chunks,
                                     QAdjustMode mode, double base_q,
                                     double target) {
  AdjustmentResult result;
  result.mode = mode;
  result.base_q = base_q;
  result.target = target;
  result.analysis_q = base_q;

  for (const auto &chunk : chunks) {
    if (chunk.is_credits)
      continue;
    ChunkAdjustment adj;
    adj.chunk_id = chunk.id;
    adj.length = chunk.length;
    adj.adjusted_q = base_q;
    result.chunks.push_back(adj);
  }
  std::sort(result.chunks.begin(), result.chunks.end(),
            [](const ChunkAdjustment &a, const ChunkAdjustment &b) {
              return a.chunk_id < b.chunk_id;
            });
  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

AdjustmentResult recompute_probe_curve(const AdjustmentResult &stored,
                                       double target, double min_q,
                                       double max_q) {
  AdjustmentResult result = stored;
  result.target = target;
  for (auto &adj : result.chunks) {
    adj = correct_chunk(adj, result.curve, result.analysis_q, target, min_q,
                        max_q, result.luma_min, result.luma_max, result.pq);
  }
  result.weighted_q = weighted_mean_quantizer(result.chunks);
  return result;
}

} // namespace chunk_encode
