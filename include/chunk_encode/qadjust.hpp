/**
 * @file qadjust.hpp
 * @brief Per-chunk quantizer correction from perceptual metric scores
 *
 * @details Three policies, all producing one corrected quantizer per
 *          non-credits chunk plus the length-weighted mean quantizer:
 *
 *          - Percentile match: lift or lower each chunk so its 5th
 *            percentile score tracks the global average (one pass)
 *
 *          - Linear fit: two analysis passes at reference quantizers,
 *            solve the quantizer step for the target score (SVT-AV1 only)
 *
 *          - Probe curve: a global quantizer/score curve from probe
 *            windows, per-chunk correction along the local slope with dark
 *            scene damping
 *
 * @note All functions are pure. Inputs in any order; outputs sorted by id.
 */

#ifndef CHUNK_ENCODE_QADJUST_HPP
#define CHUNK_ENCODE_QADJUST_HPP

#include <map>
#include <string>
#include <vector>

#include "types.hpp"

namespace chunk_encode {

// **----- RESULTS -----**

/**
 * @struct ChunkAdjustment
 * @brief Per-chunk outcome, including the inputs needed to recompute it.
 */
struct ChunkAdjustment {
  int chunk_id = 0;
  int length = 0;
  double adjusted_q = 0.0;

  /// Percentile match
  double percentile_5th = 0.0;

  /// Linear fit
  double pass2_q = 0.0;
  double score_pass1 = 0.0;
  double score_pass2 = 0.0;
  bool fallback = false;

  /// Probe curve
  double score = 0.0;
  double luma = -1.0; //< Normalized average luma, -1 = unknown
  double delta_q = 0.0;
};

/**
 * @struct AdjustmentResult
 * @brief Outcome of one policy run.
 */
struct AdjustmentResult {
  QAdjustMode mode = QAdjustMode::Percentile;
  double base_q = 0.0;
  double target = 0.0;

  double average_score = 0.0; //< Percentile: pooled mean of valid samples
  double score_pass1 = 0.0;   //< Linear fit: pooled cube mean at pass 1

  double analysis_q = 0.0;        //< Probe curve: global quantizer
  std::vector<QCurvePoint> curve; //< Probe curve: sorted by quantizer
  double luma_min = 0.0;
  double luma_max = 0.0;
  bool pq = false;

  std::vector<ChunkAdjustment> chunks; //< Sorted by id
  double weighted_q = 0.0;
};

// **----- STATISTICS -----**

/// Samples >= 0 (negative values are invalid-sample sentinels)
std::vector<double> filter_valid(const std::vector<double> &samples);

/// Samples > 0 (zero marks black frames for distance metrics)
std::vector<double> filter_positive(const std::vector<double> &samples);

/// Arithmetic mean, 0 for an empty list
double mean(const std::vector<double> &values);

/**
 * @brief Percentile with linear interpolation between closest ranks.
 * @param values Unsorted values
 * @param pct Percentile in [0, 100]
 * @return 0 for an empty list
 */
double percentile(std::vector<double> values, double pct);

/// Root mean cube: (mean(x^3))^(1/3), 0 for an empty list
double cube_mean(const std::vector<double> &values);

/// Median, averaging the middle pair for even counts
double median(std::vector<double> values);

/// Round to two decimals
double round_to_cents(double value);

/**
 * @brief Length-weighted mean quantizer of the non-credits chunks.
 * @note Sums in id order so the result does not depend on input order.
 * @return Rounded to two decimals, 0 if there are no non-credits chunks
 */
double weighted_mean_quantizer(std::vector<Chunk> chunks);

/// Same as above over adjustments (never credits)
double weighted_mean_quantizer(std::vector<ChunkAdjustment> chunks);

// **----- AGGREGATORS -----**

/// score = mean of valid samples, secondary = their 5th percentile
void aggregate_percentile(ScoredChunk &chunk);

/// score = root mean cube of positive samples
void aggregate_cube_mean(ScoredChunk &chunk);

/// score = mean of valid samples
void aggregate_mean(ScoredChunk &chunk);

// **----- PERCENTILE MATCH -----**

/// Deficit scale: 20 for SVT-AV1, 10 otherwise
double percentile_scale_factor(EncoderFamily family);

/// Maximum distance from base_q: ceil(base_q / 8) for SVT-AV1, 2 otherwise
double percentile_bound(double base_q, EncoderFamily family);

/**
 * @brief Corrected quantizer for one chunk.
 * @return base_q - round_quarter((1 - p5 / average) * scale), clamped to
 *         base_q +/- bound
 */
double percentile_quantizer(double base_q, double p5, double average,
                            EncoderFamily family);

/**
 * @brief Percentile match over a whole analysis pass.
 * @param chunks Planned chunks (credits are skipped)
 * @param scores Aggregated with aggregate_percentile
 */
AdjustmentResult adjust_percentile(const std::vector<Chunk> &chunks,
                                   const std::vector<ScoredChunk> &scores,
                                   double base_q, EncoderFamily family);

// **----- LINEAR FIT -----**

/// Analysis quantizer of the first pass
constexpr double LINEAR_PASS1_Q = 24.0;

/// Pass-2 quantizer: 33.0 when the pass-1 score beats the target, else 10.5
double linear_pass2_quantizer(double score_pass1, double target);

/**
 * @brief Solve the quantizer for `target` from two (score, step) samples.
 *
 * @param analysis_preset Preset of the analysis passes (damping table)
 * @param final_preset Preset of the final encode (damping threshold)
 * @param q Output: quantizer, clamped to [min_q, max_q], ceiled to 0.25
 * @return false if both scores are equal (no line through the points)
 */
bool linear_fit_quantizer(double score_pass1, double score_pass2,
                          double step_pass1, double step_pass2, double target,
                          int analysis_preset, int final_preset, double min_q,
                          double max_q, double &q);

/**
 * @brief Two-pass linear fit for every chunk.
 *
 * @param chunks Planned chunks (credits are skipped)
 * @param pass1 Scores at LINEAR_PASS1_Q (aggregate_cube_mean)
 * @param pass2 Scores at each chunk's pass-2 quantizer
 * @param base_q Fallback quantizer
 */
AdjustmentResult adjust_linear_fit(const std::vector<Chunk> &chunks,
                                   const std::vector<ScoredChunk> &pass1,
                                   const std::vector<ScoredChunk> &pass2,
                                   double target, double base_q,
                                   int analysis_preset, int final_preset);

/**
 * @brief Recompute a stored linear-fit result for a new target.
 * @note Uses the stored pass scores and pass-2 quantizers only.
 */
AdjustmentResult recompute_linear_fit(const AdjustmentResult &stored,
                                      double target, int analysis_preset,
                                      int final_preset);

// **----- PROBE CURVE -----**

/**
 * @brief Probe quantizers q_k = lo * (hi / lo)^((k / n)^1.4), k = 0..n-1.
 * @return Quarter-rounded, ascending, without duplicates
 */
std::vector<double> probe_quantizers(double lo, double hi, int n);

/**
 * @brief Length-weighted mean score of the probe windows at one quantizer.
 */
QCurvePoint make_curve_point(double quantizer,
                             const std::vector<Chunk> &windows,
                             const std::vector<ScoredChunk> &scores);

/**
 * @brief Quantizer at which the curve reaches `target`.
 * @note Interpolates within the bracketing segment, extrapolates along the
 *       edge segment outside the curve.
 * @return false if fewer than two points with distinct scores
 */
bool interpolate_quantizer(std::vector<QCurvePoint> curve, double target,
                           double &q);

/**
 * @brief d(score)/d(quantizer) of the curve segment around `q`.
 * @return 0 if the curve has fewer than two distinct quantizers
 */
double curve_slope(std::vector<QCurvePoint> curve, double q);

/**
 * @brief Damping factor for quantizer raises in dark content.
 * @return 0 at or below luma_min, 1 at or above luma_max, log or power
 *         ramp in between (PQ vs SDR)
 */
double luma_scale(double luma, double luma_min, double luma_max, bool pq);

/**
 * @brief Quantizer correction for one chunk.
 * @return -(score - target) / slope, raises scaled by luma_scale; 0 for a
 *         flat slope
 */
double curve_delta(double score, double target, double slope, double scale);

/**
 * @struct ProbeCurveSettings
 * @brief Inputs shared by every chunk of a probe-curve run.
 */
struct ProbeCurveSettings {
  double target = 0.0;
  double base_q = 0.0;
  double min_q = 0.0;
  double max_q = 0.0;
  double luma_min = 0.06;
  double luma_max = 0.30;
  bool pq = false;
};

/**
 * @brief Per-chunk correction around the analysis quantizer.
 *
 * @param chunks Planned chunks (credits are skipped)
 * @param scores Analysis-pass scores (aggregate_mean)
 * @param curve Probe curve
 * @param analysis_q Quantizer of the analysis pass
 * @param luma Normalized average luma per chunk id
 */
AdjustmentResult adjust_probe_curve(const std::vector<Chunk> &chunks,
                                    const std::vector<ScoredChunk> &scores,
                                    const std::vector<QCurvePoint> &curve,
                                    double analysis_q,
                                    const std::map<int, double> &luma,
                                    const ProbeCurveSettings &settings);

/**
 * @brief Every chunk keeps base_q (curve unusable).
 */
AdjustmentResult keep_base_quantizer(const std::vector<Chunk> &chunks,
                                     QAdjustMode mode, double base_q,
                                     double target);

/**
 * @brief Recompute a stored probe-curve result for a new target.
 */
AdjustmentResult recompute_probe_curve(const AdjustmentResult &stored,
                                       double target, double min_q,
                                       double max_q);

// **----- APPLY AND REPORT -----**

/**
 * @brief Write adjusted quantizers into both views of a plan.
 * @note The credits chunk keeps its own quantizer.
 * @return Number of chunks whose quantizer changed
 */
int apply_adjustments(const AdjustmentResult &result, ChunkPlan &plan);

/**
 * @brief Bar chart of the quantizer distribution around the median.
 * @return One line per shown quantizer, plus the weighted mean line
 */
std::vector<std::string>
format_quantizer_distribution(const std::vector<Chunk> &chunks);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_QADJUST_HPP
