/**
 * @file orchestrator.hpp
 * @brief Run orchestration: analysis passes, adjustment, final pass
 *
 * @details The Orchestrator class sequences one complete run:
 *
 *          1. Probe the source and resolve the derived defaults
 *
 *          2. Load scene changes and plan the chunks
 *
 *          3. Prepare the run folders and the run log
 *
 *          4. Quality adjustment (optional): analysis pass(es), metric
 *             evaluation, per-chunk quantizers, persisted record; or reuse
 *             of a stored record
 *
 *          5. Final pass over every chunk
 *
 *          6. Concatenation, only when every chunk succeeded
 *
 * @note Folder layout under <work_dir>/<source stem>:
 *
 *       - output/  final file, encode_log.txt, <stem>_qadjust.json
 *
 *       - chunks/  encoded chunks of every pass
 *
 *       - logs/    encoder stderr per chunk and pass
 */

#ifndef CHUNK_ENCODE_ORCHESTRATOR_HPP
#define CHUNK_ENCODE_ORCHESTRATOR_HPP

#include <map>
#include <string>
#include <vector>

#include "encoder_params.hpp"
#include "metric_engine.hpp"
#include "process_pipeline.hpp"
#include "qadjust.hpp"
#include "qadjust_record.hpp"
#include "run_settings.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include "video_probe.hpp"

namespace chunk_encode {

// **----- EXIT CODES -----**

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_FAILED_CHUNKS = 2;
constexpr int EXIT_INTERRUPTED = 130;

/**
 * @class Orchestrator
 * @brief Owns one run: settings, plan, process registry, cancellation.
 */
class Orchestrator {
  RunSettings settings_;
  VideoInfo info_;
  ChunkPlan plan_;

  std::string output_dir_;
  std::string chunks_dir_;
  std::string logs_dir_;
  std::string record_path_;
  std::string output_file_;

  ProcessRegistry registry_;
  CancellationToken token_;

  /// Probe the source, resolve defaults
  int prepare();

  /// Scene changes to chunk plan
  int plan();

  /// Create the run folders, open the run log
  int setup_folders();

  int list_parameters();

  EncoderParameters final_parameters() const;
  EncoderParameters analysis_parameters() const;

  /// Credits preset for the final pass ("" = same as regular chunks)
  std::string credits_preset() const;

  /// Preset of the final pass as a speed level (0 if not numeric)
  int final_preset_level() const;

  RecordParameters record_parameters() const;

  // **---- QUALITY ADJUSTMENT ----**

  int run_qadjust();
  int reuse_record(AdjustmentRecord &record);
  int analyse_percentile(AdjustmentRecord &record);
  int analyse_linear_fit(AdjustmentRecord &record);
  int analyse_probe_curve(AdjustmentRecord &record);

  /// Measure per-chunk average luma for dark scene damping
  std::map<int, double> measure_luma();

  /// Delete every encoded chunk in the chunks folder
  void remove_encoded_chunks();

  // **---- PASSES ----**

  /**
   * @brief Encode chunks with a factory.
   * @param chunks Chunks in processing order, quantizers already set
   * @param factory Pass-specific command factory
   * @param skip_credits Leave the credits chunk out
   * @param report Output: pass report
   * @return EXIT_OK, EXIT_FAILED_CHUNKS or EXIT_INTERRUPTED
   */
  int encode_pass(const std::vector<Chunk> &chunks,
                  const PipelineFactory &factory, bool skip_credits,
                  CompletionReport &report);

  /**
   * @brief Score encoded chunks with the metric engine.
   * @return EXIT_OK, EXIT_CONFIG_ERROR (engine failure) or EXIT_INTERRUPTED
   */
  int score_pass(const std::vector<Chunk> &chunks,
                 const PipelineFactory &factory, MetricKind kind,
                 const MetricRunner::Aggregator &aggregate,
                 std::vector<ScoredChunk> &scores);

  PipelineFactory make_factory(const EncoderParameters &params,
                               const std::string &tag) const;

  int final_pass();

  int execute();

public:
  explicit Orchestrator(RunSettings settings);

  /// Disable copy (owns the process registry)
  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  /**
   * @brief Run everything.
   * @return Process exit code (EXIT_*)
   */
  int run();
};

/**
 * @brief Copy of chunks with every non-credits quantizer set to `q`.
 */
std::vector<Chunk> with_quantizer(const std::vector<Chunk> &chunks, double q);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_ORCHESTRATOR_HPP
