/**
 * @file concat.cpp
 * @brief Chunk concatenation implementation
 */

#include "chunk_encode/concat.hpp"

#include <cstdlib>
#include <filesystem>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "chunk_encode/config.hpp"
#include "chunk_encode/logging.hpp"
#include "chunk_encode/metric_engine.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace chunk_encode {

std::string build_concat_list(const std::vector<std::string> &chunk_paths) {
  std::string list_content;
  list_content.reserve(64 * chunk_paths.size());

  for (const auto &path : chunk_paths) {
    std::string abs_path = std::filesystem::absolute(path).string();

    /// The demuxer reads 'it'\''s' as it's
    std::string escaped;
    for (char c : abs_path) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    list_content += fmt::format("file '{}'\n", escaped);
  }
  return list_content;
}

std::string build_concat_command(const std::string &list_path,
                                 const std::string &output_path,
                                 EncoderFamily family, double fps) {
  std::string cmd = fmt::format(
      "{} -hide_banner -loglevel warning -f concat -safe 0 "
      "-protocol_whitelist file,pipe,fd -i {}",
      shell_quote(Config::ffmpeg_bin()), shell_quote(list_path));

  /// Raw HEVC chunks carry no timestamps
  if (family == EncoderFamily::X265)
    cmd += fmt::format(" -fflags +genpts -r {}", fps);

  cmd += fmt::format(" -c copy -map 0 -y {}", shell_quote(output_path));
  return cmd;
}

int concat_chunks(const std::vector<std::string> &chunk_paths,
                  const std::string &output_path, EncoderFamily family,
                  double fps) {
  if (chunk_paths.empty()) {
    LOG_WARN("No chunks to concatenate");
    return 0;
  }

  std::string list_content;
  try {
    list_content = build_concat_list(chunk_paths);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to resolve chunk paths: {}", e.what());
    return -1;
  }

  /// Create memory file for concat list
  int fd = syscall(SYS_memfd_create, "concat_list_mem", MFD_CLOEXEC);
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file!");
    return -1;
  }

  if (write(fd, list_content.c_str(), list_content.size()) == -1) {
    LOG_ERROR("Failed to write to memory file");
    close(fd);
    return -1;
  }

  std::string mem_file_path = fmt::format("/proc/{}/fd/{}", getpid(), fd);
  std::string cmd =
      build_concat_command(mem_file_path, output_path, family, fps);

  LOG_INFO("Concatenating {} chunks into {}", chunk_paths.size(),
           std::filesystem::path(output_path).filename().string());

  int status = std::system(cmd.c_str());

  close(fd);

  if (status != 0) {
    int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status)
                                                   : status;
    LOG_ERROR("FFmpeg concat failed with status {}", code);
    return code != 0 ? code : -1;
  }

  return 0;
}

} // namespace chunk_encode
