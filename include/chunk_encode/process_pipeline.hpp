/**
 * @file process_pipeline.hpp
 * @brief decode | encode process pairs, process registry and cancellation
 *
 * @details A PipelineJob is one chunk's two-stage pipeline:
 *
 *          - ffmpeg trims the source range and writes y4m to a pipe
 *
 *          - the encoder reads the pipe and writes the chunk output
 *
 *          Both processes share one process group so that cancellation can
 *          signal the pair at once. The ProcessRegistry tracks running groups
 *          for cooperative shutdown.
 */

#ifndef CHUNK_ENCODE_PROCESS_PIPELINE_HPP
#define CHUNK_ENCODE_PROCESS_PIPELINE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <sys/types.h>

namespace chunk_encode {

/**
 * @struct PipelineJob
 * @brief One chunk's decode | encode command pair.
 */
struct PipelineJob {
  int chunk_id = 0;
  int frames = 0;                       //< Chunk length, for accounting
  std::vector<std::string> decode_argv; //< Writes y4m to stdout
  std::vector<std::string> encode_argv; //< Reads y4m from stdin
  std::string output_path;              //< Encoder output file
  std::string log_path;                 //< stderr of both stages (empty = /dev/null)
};

/**
 * @class CancellationToken
 * @brief Run-wide interrupt flag, safe to set from a signal handler.
 */
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }
  void reset() { cancelled_.store(false); }

private:
  std::atomic<bool> cancelled_{false};
};

/**
 * @brief Route SIGINT and SIGTERM to `token`.
 * @note The token must outlive the handler; call
 *       remove_interrupt_handler() before it is destroyed.
 */
void install_interrupt_handler(CancellationToken &token);

/// Restore the default SIGINT/SIGTERM dispositions
void remove_interrupt_handler();

/**
 * @class ProcessRegistry
 * @brief Mutex-guarded set of running pipeline process groups.
 *
 * @attention Only the worker that launched a group reaps it; terminate_all()
 *            signals and waits for the workers to deregister.
 */
class ProcessRegistry {
public:
  void add(pid_t pgid);
  void remove(pid_t pgid);
  size_t size() const;

  /**
   * @brief SIGTERM every registered group, wait up to `timeout_sec` for
   *        them to be reaped, then SIGKILL the stragglers.
   * @return Number of groups that needed SIGKILL
   */
  int terminate_all(int timeout_sec);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::set<pid_t> groups_;
};

/**
 * @brief Combine raw waitpid statuses of the two stages into one exit code.
 *
 * @note The encoder's failure wins. A decoder killed by SIGPIPE after the
 *       encoder exited cleanly is not a failure. Death by signal N maps to
 *       128 + N.
 *
 * @return 0 on success, the failing stage's exit code otherwise
 */
int combine_exit_status(int decode_status, int encode_status);

/**
 * @class ProcessPipeline
 * @brief Runs one PipelineJob attempt and reports its combined exit code.
 */
class ProcessPipeline {
public:
  ProcessPipeline(ProcessRegistry &registry, const CancellationToken &token)
      : registry_(registry), token_(token) {}

  /**
   * @brief Launch both stages, wait for both, return the combined code.
   * @return 0 on success, non-zero exit code, or -1 if the processes
   *         could not be started (or the run was already cancelled)
   */
  int run(const PipelineJob &job);

private:
  ProcessRegistry &registry_;
  const CancellationToken &token_;
};

/**
 * @brief Size of a file in bytes, 0 if it does not exist.
 */
uint64_t file_size_or_zero(const std::string &path);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_PROCESS_PIPELINE_HPP
