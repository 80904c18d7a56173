/**
 * @file scheduler.hpp
 * @brief Bounded worker pool running chunk pipelines
 *
 * @details The ExecutionScheduler orchestrates one encoding pass:
 *
 *          - Spawns max_parallel worker threads
 *
 *          - Workers pop PipelineJobs (longest chunk first) and run each
 *            with one retry
 *
 *          - The calling thread drains outcomes and keeps the bitrate and
 *            projected size accounting
 *
 *          - An interrupt drops queued work and terminates running
 *            pipelines
 */

#ifndef CHUNK_ENCODE_SCHEDULER_HPP
#define CHUNK_ENCODE_SCHEDULER_HPP

#include <string>
#include <utility>
#include <vector>

#include "process_pipeline.hpp"

namespace chunk_encode {

/**
 * @struct RunContext
 * @brief Everything a pass needs from the surrounding run.
 */
struct RunContext {
  ProcessRegistry &registry;
  CancellationToken &token;
  double fps = 0.0;          //< Source frame rate
  int timeline_frames = 0;   //< Frames covered by this pass
  int terminate_timeout_sec = 5;
};

/**
 * @struct CompletionReport
 * @brief Outcome of one pass.
 */
struct CompletionReport {
  std::vector<int> completed;                 //< Chunk ids, completion order
  std::vector<std::pair<int, int>> failed;    //< (chunk id, exit code)
  bool interrupted = false;
  int discarded = 0;                          //< Jobs never started
  double average_bitrate_kbps = 0.0;
  double estimated_size_mb = 0.0;
  double elapsed_sec = 0.0;

  bool ok() const { return failed.empty() && !interrupted; }
};

/**
 * @struct PipelineOutcome
 * @brief What a worker reports for one job after all attempts.
 */
struct PipelineOutcome {
  int chunk_id = 0;
  int frames = 0;
  int exit_code = 0;
  int attempts = 0;
  std::string output_path;
};

/**
 * @class ExecutionScheduler
 * @brief Runs a list of PipelineJobs on a bounded pool.
 */
class ExecutionScheduler {
public:
  explicit ExecutionScheduler(RunContext &context) : context_(context) {}

  /**
   * @brief Run every job, at most `max_parallel` at a time.
   *
   * @param jobs Jobs in processing order
   * @param max_parallel Concurrent pipelines (clamped to >= 1)
   * @return Per-pass report; never throws for pipeline failures
   */
  CompletionReport run_all(const std::vector<PipelineJob> &jobs,
                           int max_parallel);

private:
  RunContext &context_;
};

} // namespace chunk_encode

#endif // CHUNK_ENCODE_SCHEDULER_HPP
