/**
 * @file metric_engine.hpp
 * @brief Perceptual metric evaluation of encoded chunks
 *
 * @details A MetricEngine compares a source frame range with an encoded
 *          chunk and returns per-frame scores. The MetricRunner fans chunks
 *          out over a bounded pool and collects ScoredChunks in id order.
 *
 * @note Negative per-frame scores are invalid-sample sentinels. Filtering
 *       and aggregation belong to the quality policies.
 */

#ifndef CHUNK_ENCODE_METRIC_ENGINE_HPP
#define CHUNK_ENCODE_METRIC_ENGINE_HPP

#include <functional>
#include <string>
#include <vector>

#include "process_pipeline.hpp"
#include "types.hpp"

namespace chunk_encode {

/**
 * @brief Metric computed by the engine; selected by the policy.
 */
enum class MetricKind { Ssimulacra2, Butteraugli, Cvvdp };

/// Name substituted for {metric}
const char *metric_name(MetricKind kind);

/**
 * @struct MetricRequest
 * @brief One chunk to score.
 */
struct MetricRequest {
  int chunk_id = 0;
  int start = 0;         //< First source frame (inclusive)
  int end = 0;           //< Last source frame (inclusive)
  std::string distorted; //< Encoded chunk file
};

/**
 * @class MetricEngine
 * @brief Source of per-frame scores.
 * @attention evaluate() is called concurrently from the runner's workers.
 */
class MetricEngine {
public:
  virtual ~MetricEngine() = default;

  /**
   * @brief Score one chunk.
   * @param request Chunk to score
   * @param scores Output: per-frame scores, one per sampled frame
   * @return true on success, false if the engine failed (logged)
   */
  virtual bool evaluate(const MetricRequest &request,
                        std::vector<double> &scores) = 0;
};

/**
 * @class CommandMetricEngine
 * @brief Runs an external scorer rendered from a command template.
 *
 * @note Placeholders: {reference} {distorted} {start} {end} {skip}
 *       {metric} {threads}. Paths are shell-quoted. The command prints one
 *       score per stdout line; unparsable lines are ignored.
 */
class CommandMetricEngine : public MetricEngine {
public:
  CommandMetricEngine(std::string command_template, std::string reference,
                      MetricKind kind, int skip, int threads);

  /// Command line for one request
  std::string render(const MetricRequest &request) const;

  bool evaluate(const MetricRequest &request,
                std::vector<double> &scores) override;

private:
  std::string template_;
  std::string reference_;
  MetricKind kind_;
  int skip_;
  int threads_;
};

/// Single-quote a string for /bin/sh
std::string shell_quote(const std::string &text);

/**
 * @brief Parse one score per line, skipping anything that is not a number.
 */
std::vector<double> parse_score_lines(const std::string &text);

/**
 * @class MetricRunner
 * @brief Bounded pool of metric workers.
 */
class MetricRunner {
public:
  using Aggregator = std::function<void(ScoredChunk &)>;

  MetricRunner(MetricEngine &engine, int workers,
               const CancellationToken &token)
      : engine_(engine), workers_(workers), token_(token) {}

  /**
   * @brief Score every request.
   *
   * @param requests Chunks to score
   * @param aggregate Fills score/secondary_score from raw_samples
   * @param results Output: one ScoredChunk per request, sorted by id
   * @return true if every chunk was scored, false on engine failure or
   *         interrupt
   */
  bool run(const std::vector<MetricRequest> &requests,
           const Aggregator &aggregate, std::vector<ScoredChunk> &results);

private:
  MetricEngine &engine_;
  int workers_;
  const CancellationToken &token_;
};

} // namespace chunk_encode

#endif // CHUNK_ENCODE_METRIC_ENGINE_HPP
