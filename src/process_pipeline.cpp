/**
 * @file process_pipeline.cpp
 * @brief decode | encode pipeline execution implementation
 */

#include "chunk_encode/process_pipeline.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <initializer_list>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "chunk_encode/logging.hpp"

namespace chunk_encode {

// **----- INTERRUPT HANDLING -----**

namespace {

std::atomic<CancellationToken *> g_interrupt_token{nullptr};

extern "C" void handle_interrupt(int) {
  CancellationToken *token = g_interrupt_token.load();
  if (token)
    token->cancel();
}

/// argv vector for execvp; pointers stay valid while `args` lives
std::vector<char *> to_exec_args(const std::vector<std::string> &args) {
  std::vector<char *> out;
  out.reserve(args.size() + 1);
  for (const auto &a : args)
    out.push_back(const_cast<char *>(a.c_str()));
  out.push_back(nullptr);
  return out;
}

/// Blocking waitpid that survives EINTR from our own signal handler
bool wait_for_child(pid_t pid, int &status) {
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return false;
  }
  return true;
}

int status_to_code(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return 1;
}

void close_all(std::initializer_list<int> fds) {
  for (int fd : fds) {
    if (fd >= 0)
      close(fd);
  }
}

} // anonymous namespace

void install_interrupt_handler(CancellationToken &token) {
  g_interrupt_token.store(&token);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handle_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

void remove_interrupt_handler() {
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  g_interrupt_token.store(nullptr);
}

// **----- PROCESS REGISTRY -----**

void ProcessRegistry::add(pid_t pgid) {
  std::lock_guard<std::mutex> lock(mutex_);
  groups_.insert(pgid);
}

void ProcessRegistry::remove(pid_t pgid) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.erase(pgid);
  }
  cv_.notify_all();
}

size_t ProcessRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_.size();
}

int ProcessRegistry::terminate_all(int timeout_sec) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (groups_.empty())
    return 0;

  LOG_WARN("Terminating {} running pipelines", groups_.size());
  for (pid_t pgid : groups_)
    kill(-pgid, SIGTERM);

  bool drained = cv_.wait_for(lock, std::chrono::seconds(timeout_sec),
                              [this] { return groups_.empty(); });
  if (drained)
    return 0;

  int killed = 0;
  for (pid_t pgid : groups_) {
    if (kill(-pgid, SIGKILL) == 0)
      ++killed;
  }
  LOG_WARN("Killed {} pipelines that ignored SIGTERM for {}s", killed,
           timeout_sec);
  return killed;
}

// **----- EXIT STATUS -----**

int combine_exit_status(int decode_status, int encode_status) {
  int encode_code = status_to_code(encode_status);
  if (encode_code != 0)
    return encode_code;

  /// Encoder stopped reading early and exited cleanly
  if (WIFSIGNALED(decode_status) && WTERMSIG(decode_status) == SIGPIPE)
    return 0;

  return status_to_code(decode_status);
}

// **----- PIPELINE -----**

int ProcessPipeline::run(const PipelineJob &job) {
  if (token_.is_cancelled())
    return -1;

  if (job.decode_argv.empty() || job.encode_argv.empty()) {
    LOG_ERROR("[Chunk {}] Empty pipeline command", job.chunk_id);
    return -1;
  }

  /// Everything the children touch is prepared before fork
  std::vector<char *> decode_args = to_exec_args(job.decode_argv);
  std::vector<char *> encode_args = to_exec_args(job.encode_argv);

  const char *log_target =
      job.log_path.empty() ? "/dev/null" : job.log_path.c_str();
  int log_fd =
      open(log_target, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (log_fd < 0 || null_fd < 0) {
    LOG_ERROR("[Chunk {}] Cannot open {}: {}", job.chunk_id, log_target,
              std::strerror(errno));
    close_all({log_fd, null_fd});
    return -1;
  }

  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
    LOG_ERROR("[Chunk {}] pipe2 failed: {}", job.chunk_id,
              std::strerror(errno));
    close_all({log_fd, null_fd});
    return -1;
  }

  pid_t decoder = fork();
  if (decoder == 0) {
    setpgid(0, 0);
    dup2(null_fd, STDIN_FILENO);
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    execvp(decode_args[0], decode_args.data());
    _exit(127);
  }
  if (decoder < 0) {
    LOG_ERROR("[Chunk {}] fork failed: {}", job.chunk_id,
              std::strerror(errno));
    close_all({log_fd, null_fd, pipe_fds[0], pipe_fds[1]});
    return -1;
  }
  /// Set from both sides so the group exists before either execs
  setpgid(decoder, decoder);

  pid_t encoder = fork();
  if (encoder == 0) {
    setpgid(0, decoder);
    dup2(pipe_fds[0], STDIN_FILENO);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    execvp(encode_args[0], encode_args.data());
    _exit(127);
  }

  close_all({log_fd, null_fd, pipe_fds[0], pipe_fds[1]});

  int decode_status = 0;
  if (encoder < 0) {
    LOG_ERROR("[Chunk {}] fork failed: {}", job.chunk_id,
              std::strerror(errno));
    kill(-decoder, SIGKILL);
    wait_for_child(decoder, decode_status);
    return -1;
  }
  setpgid(encoder, decoder);

  registry_.add(decoder);
  /// Cancelled between the launch check and registration
  if (token_.is_cancelled())
    kill(-decoder, SIGTERM);

  int encode_status = 0;
  bool reaped = wait_for_child(encoder, encode_status);
  reaped = wait_for_child(decoder, decode_status) && reaped;
  registry_.remove(decoder);

  if (!reaped) {
    LOG_ERROR("[Chunk {}] waitpid failed: {}", job.chunk_id,
              std::strerror(errno));
    return -1;
  }

  return combine_exit_status(decode_status, encode_status);
}

uint64_t file_size_or_zero(const std::string &path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

} // namespace chunk_encode
