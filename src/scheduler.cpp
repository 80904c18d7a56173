/**
 * @file scheduler.cpp
 * @brief Bounded pipeline pool implementation
 *
 * @details Workers only run pipelines and push outcomes. All counters live
 *          on the draining thread, so the accounting needs no locking and
 *          is updated exactly once per completed chunk.
 */

#include "chunk_encode/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include "chunk_encode/logging.hpp"
#include "chunk_encode/types.hpp"
#include "chunk_encode/work_queue.hpp"

namespace chunk_encode {

namespace {

/// Drain poll interval; bounds how late an interrupt is noticed
constexpr std::chrono::milliseconds DRAIN_POLL{200};

struct WorkerOutcome {
  PipelineOutcome outcome;
  bool cancelled = false;
};

} // anonymous namespace

CompletionReport ExecutionScheduler::run_all(
    const std::vector<PipelineJob> &jobs, int max_parallel) {
  CompletionReport report;
  if (jobs.empty())
    return report;

  const int total = static_cast<int>(jobs.size());
  const int workers = std::max(1, std::min(max_parallel, total));

  WorkQueue<PipelineJob> job_queue;
  WorkQueue<WorkerOutcome> outcomes;
  for (const auto &job : jobs)
    job_queue.push(job);
  job_queue.finish();

  auto pass_start = std::chrono::steady_clock::now();
  std::atomic<int> active_workers{workers};

  // **---- WORKERS ----**

  auto worker = [this, &job_queue, &outcomes, &active_workers]() {
    ProcessPipeline pipeline(context_.registry, context_.token);
    PipelineJob job;

    while (!context_.token.is_cancelled() && job_queue.pop(job)) {
      WorkerOutcome result;
      result.outcome.chunk_id = job.chunk_id;
      result.outcome.frames = job.frames;
      result.outcome.output_path = job.output_path;
      result.outcome.exit_code = -1;

      for (int attempt = 1; attempt <= MAX_PIPELINE_ATTEMPTS; ++attempt) {
        if (context_.token.is_cancelled())
          break;

        result.outcome.attempts = attempt;
        result.outcome.exit_code = pipeline.run(job);
        if (result.outcome.exit_code == 0 || context_.token.is_cancelled())
          break;

        if (attempt < MAX_PIPELINE_ATTEMPTS) {
          LOG_WARN("Chunk {} failed with exit code {} (attempt {}/{}), "
                   "retrying",
                   job.chunk_id, result.outcome.exit_code, attempt,
                   MAX_PIPELINE_ATTEMPTS);
        }
      }

      result.cancelled =
          result.outcome.exit_code != 0 && context_.token.is_cancelled();
      outcomes.push(std::move(result));
    }

    if (--active_workers == 0)
      outcomes.finish();
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (int i = 0; i < workers; ++i)
    pool.emplace_back(worker);

  // **---- DRAIN ----**

  double total_kbits = 0.0;
  long long processed_frames = 0;
  int finished = 0;
  bool terminated = false;

  WorkerOutcome result;
  while (true) {
    if (context_.token.is_cancelled() && !terminated) {
      terminated = true;
      report.interrupted = true;
      report.discarded = static_cast<int>(job_queue.clear());
      LOG_WARN("Interrupt received, discarding {} queued chunks",
               report.discarded);
      context_.registry.terminate_all(context_.terminate_timeout_sec);
    }

    if (!outcomes.pop_for(result, DRAIN_POLL)) {
      if (outcomes.is_done())
        break;
      continue;
    }

    const PipelineOutcome &out = result.outcome;

    if (result.cancelled) {
      LOG_INFO("Chunk {} stopped by interrupt", out.chunk_id);
      continue;
    }

    if (out.exit_code != 0) {
      LOG_ERROR("Chunk {} failed after {} attempts with exit code {}",
                out.chunk_id, out.attempts, out.exit_code);
      report.failed.emplace_back(out.chunk_id, out.exit_code);
      continue;
    }

    ++finished;
    report.completed.push_back(out.chunk_id);

    /// Bitrate over everything finished so far
    total_kbits += file_size_or_zero(out.output_path) / 1024.0 * 8.0;
    processed_frames += out.frames;

    double chunk_seconds = 0.0;
    if (context_.fps > 0.0 && processed_frames > 0) {
      chunk_seconds = out.frames / context_.fps;
      double processed_seconds = processed_frames / context_.fps;
      report.average_bitrate_kbps = total_kbits / processed_seconds;
      report.estimated_size_mb = (context_.timeline_frames / context_.fps) *
                                 report.average_bitrate_kbps / 8.0 / 1024.0;
    }

    LOG_INFO("[{}/{}] Chunk {} finished, length {:.2f}s, average bitrate "
             "{:.2f} kbps, estimated size {:.2f} MB",
             finished, total, out.chunk_id, chunk_seconds,
             report.average_bitrate_kbps, report.estimated_size_mb);
  }

  for (auto &t : pool)
    t.join();

  report.elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - pass_start)
                           .count();
  return report;
}

} // namespace chunk_encode
