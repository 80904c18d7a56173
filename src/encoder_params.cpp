/**
 * @file encoder_params.cpp
 * @brief Encoder command formatting implementation
 */

#include "chunk_encode/encoder_params.hpp"

#include <cmath>
#include <filesystem>

#include <fmt/core.h>

#include "chunk_encode/config.hpp"
#include "chunk_encode/logging.hpp"
#include "chunk_encode/system.hpp"

namespace chunk_encode {

namespace fs = std::filesystem;

namespace {

void push_option(std::vector<std::string> &argv, const char *name, int value) {
  if (value < 0)
    return;
  argv.emplace_back(name);
  argv.push_back(std::to_string(value));
}

void append_extra(std::vector<std::string> &argv,
                  const std::vector<std::string> &extra) {
  argv.insert(argv.end(), extra.begin(), extra.end());
}

// **----- FAMILY FORMATTERS -----**

std::vector<std::string> svt_argv(const EncoderParameters &p,
                                  const std::string &output) {
  std::vector<std::string> argv = {encoder_binary(p.family),
                                   "--preset",
                                   p.preset,
                                   "--lp",
                                   std::to_string(p.threads),
                                   "--crf",
                                   format_quantizer(p.quantizer)};
  push_option(argv, "--keyint", p.keyint);
  push_option(argv, "--film-grain", p.film_grain);
  push_option(argv, "--tile-columns", p.tile_columns);
  push_option(argv, "--tile-rows", p.tile_rows);
  append_extra(argv, p.extra);
  argv.insert(argv.end(), {"-b", output, "-i", "-"});
  return argv;
}

std::vector<std::string> x265_argv(const EncoderParameters &p,
                                   const std::string &output, int frames) {
  std::vector<std::string> argv = {encoder_binary(p.family),
                                   "--y4m",
                                   "--no-progress",
                                   "--frames",
                                   std::to_string(frames),
                                   "--log-level",
                                   "-1",
                                   "--pools",
                                   std::to_string(p.threads),
                                   "--preset",
                                   p.analysis ? std::string("fast") : p.preset,
                                   "--crf",
                                   format_quantizer(p.quantizer)};
  push_option(argv, "--keyint", p.keyint);
  push_option(argv, "--min-keyint", p.keyint);
  append_extra(argv, p.extra);

  /// Analysis speed settings go last so they win over user extras
  if (p.analysis) {
    argv.insert(argv.end(),
                {"--limit-refs", "3", "--rdoq-level", "2", "--rc-lookahead",
                 "40", "--lookahead-slices", "0", "--subme", "3", "--me",
                 "umh", "--b-adapt", "2"});
  }
  argv.insert(argv.end(), {"--output", output, "--input", "-"});
  return argv;
}

std::vector<std::string> aom_argv(const EncoderParameters &p,
                                  const std::string &output) {
  std::vector<std::string> argv = {
      encoder_binary(p.family),
      "-q",
      "--ivf",
      "--cpu-used=" + p.preset,
      "--end-usage=q",
      "--cq-level=" + format_quantizer(p.quantizer),
      fmt::format("--threads={}", p.threads)};
  if (p.keyint >= 0)
    argv.push_back(fmt::format("--kf-max-dist={}", p.keyint));
  append_extra(argv, p.extra);
  argv.insert(argv.end(), {"--passes=1", "-o", output, "-"});
  return argv;
}

std::vector<std::string> rav1e_argv(const EncoderParameters &p,
                                    const std::string &output) {
  std::vector<std::string> argv = {encoder_binary(p.family),
                                   "--speed",
                                   p.preset,
                                   "--quantizer",
                                   format_quantizer(p.quantizer),
                                   "--threads",
                                   std::to_string(p.threads)};
  push_option(argv, "--keyint", p.keyint);
  append_extra(argv, p.extra);
  argv.insert(argv.end(), {"-q", "-o", output, "-"});
  return argv;
}

/// Value following `name` in an argument list, -1 if absent or malformed
int find_int_argument(const std::vector<std::string> &args,
                      const std::string &name) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] != name)
      continue;
    try {
      return std::stoi(args[i + 1]);
    } catch (const std::exception &) {
      LOG_WARN("Ignoring non-numeric value '{}' for {}", args[i + 1], name);
      return -1;
    }
  }
  return -1;
}

} // anonymous namespace

// **----- PARAMETERS -----**

EncoderParameters make_analysis_parameters(const EncoderParameters &final_params,
                                           int analysis_preset) {
  EncoderParameters p = final_params;
  p.analysis = true;
  if (p.family == EncoderFamily::Svt) {
    p.preset = std::to_string(analysis_preset);
    p.film_grain = 0;
    p.tile_columns = 1;
    p.tile_rows = 0;
  } else if (p.family != EncoderFamily::X265) {
    p.preset = std::to_string(analysis_preset);
  }
  return p;
}

std::string encoder_binary(EncoderFamily family) {
  switch (family) {
  case EncoderFamily::Svt:
    return Config::svt_bin();
  case EncoderFamily::X265:
    return Config::x265_bin();
  case EncoderFamily::Aom:
    return Config::aom_bin();
  case EncoderFamily::Rav1e:
    return Config::rav1e_bin();
  }
  return Config::svt_bin();
}

const char *encoder_output_extension(EncoderFamily family) {
  return family == EncoderFamily::X265 ? "hevc" : "ivf";
}

bool is_av1_family(EncoderFamily family) {
  return family != EncoderFamily::X265;
}

std::vector<std::string> build_encode_argv(const EncoderParameters &params,
                                           const std::string &output_path,
                                           int frames) {
  switch (params.family) {
  case EncoderFamily::Svt:
    return svt_argv(params, output_path);
  case EncoderFamily::X265:
    return x265_argv(params, output_path, frames);
  case EncoderFamily::Aom:
    return aom_argv(params, output_path);
  case EncoderFamily::Rav1e:
    return rav1e_argv(params, output_path);
  }
  return svt_argv(params, output_path);
}

std::vector<std::string> build_decode_argv(const std::string &source,
                                           const Chunk &chunk,
                                           EncoderFamily family) {
  std::vector<std::string> argv = {
      Config::ffmpeg_bin(), "-loglevel", "fatal", "-i", source, "-vf",
      fmt::format("trim=start_frame={}:end_frame={},setpts=PTS-STARTPTS",
                  chunk.start, chunk.end + 1)};
  if (is_av1_family(family))
    argv.insert(argv.end(), {"-pix_fmt", "yuv420p10le"});
  argv.insert(argv.end(), {"-f", "yuv4mpegpipe", "-strict", "-1", "-"});
  return argv;
}

// **----- KEYINT -----**

int svt_aligned_keyint(double fps, double seconds, int startup_levels,
                       int hierarchical_levels) {
  const int startup_size = 1 << (startup_levels - 1);
  const int regular_size = 1 << (hierarchical_levels - 1);

  double remaining = fps * seconds - startup_size;
  if (remaining <= 0.0)
    return startup_size;

  int regular_count = static_cast<int>(std::ceil(remaining / regular_size));
  return startup_size + regular_count * regular_size;
}

void svt_gop_levels(const std::vector<std::string> &extra, int &startup_levels,
                    int &hierarchical_levels) {
  int hierarchical = find_int_argument(extra, "--hierarchical-levels");
  int startup = find_int_argument(extra, "--startup-mg-size");

  /// Encoder values count from 2 (= 3 levels)
  switch (hierarchical) {
  case 2:
    hierarchical_levels = 3;
    break;
  case 3:
    hierarchical_levels = 4;
    break;
  case 4:
    hierarchical_levels = 5;
    break;
  default:
    hierarchical_levels = 6;
    break;
  }

  switch (startup) {
  case -1:
  case 0:
    startup_levels = hierarchical_levels;
    break;
  case 2:
    startup_levels = 3;
    break;
  case 3:
    startup_levels = 4;
    break;
  default:
    startup_levels = 5;
    break;
  }
}

int default_min_chunk_length(EncoderFamily family, double fps,
                             const std::vector<std::string> &extra) {
  if (family == EncoderFamily::Svt) {
    int startup = 0, hierarchical = 0;
    svt_gop_levels(extra, startup, hierarchical);
    return svt_aligned_keyint(fps, 2.0, startup, hierarchical);
  }
  return static_cast<int>(std::ceil(fps)) * 2;
}

int default_keyint(EncoderFamily family, double fps,
                   const std::vector<std::string> &extra) {
  if (family == EncoderFamily::Svt) {
    int startup = 0, hierarchical = 0;
    svt_gop_levels(extra, startup, hierarchical);
    return svt_aligned_keyint(fps, 10.0, startup, hierarchical);
  }
  return static_cast<int>(std::ceil(fps)) * 10;
}

// **----- ARGUMENT HELPERS -----**

std::vector<std::string> split_arguments(const std::string &text) {
  std::vector<std::string> args;
  std::string current;
  bool in_token = false;
  char quote = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else if (c == '\\' && quote == '"' && i + 1 < text.size()) {
        current += text[++i];
      } else {
        current += c;
      }
    } else if (c == '\'' || c == '"') {
      quote = c;
      in_token = true;
    } else if (c == '\\' && i + 1 < text.size()) {
      current += text[++i];
      in_token = true;
    } else if (c == ' ' || c == '\t' || c == '\n') {
      if (in_token) {
        args.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current += c;
      in_token = true;
    }
  }
  if (in_token)
    args.push_back(current);
  return args;
}

std::string join_argv(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &a : argv) {
    if (!out.empty())
      out += ' ';
    if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
      out += '"';
      out += a;
      out += '"';
    } else {
      out += a;
    }
  }
  return out;
}

// **----- PIPELINE FACTORY -----**

PipelineFactory::PipelineFactory(std::string source, std::string chunks_dir,
                                 std::string logs_dir, EncoderParameters params,
                                 std::string credits_preset, std::string tag)
    : source_(std::move(source)), chunks_dir_(std::move(chunks_dir)),
      logs_dir_(std::move(logs_dir)), params_(std::move(params)),
      credits_preset_(std::move(credits_preset)), tag_(std::move(tag)) {}

std::string PipelineFactory::output_path(int chunk_id) const {
  return (fs::path(chunks_dir_) /
          fmt::format("encoded_chunk_{}{}.{}", tag_, chunk_id,
                      encoder_output_extension(params_.family)))
      .string();
}

PipelineJob PipelineFactory::make_job(const Chunk &chunk) const {
  EncoderParameters p = params_;
  p.quantizer = chunk.quantizer;
  if (chunk.is_credits && !credits_preset_.empty())
    p.preset = credits_preset_;

  PipelineJob job;
  job.chunk_id = chunk.id;
  job.frames = chunk.length;
  job.output_path = output_path(chunk.id);
  job.decode_argv = build_decode_argv(source_, chunk, p.family);
  job.encode_argv = build_encode_argv(p, job.output_path, chunk.length);
  if (!logs_dir_.empty()) {
    job.log_path = (fs::path(logs_dir_) /
                    fmt::format("chunk_{}{}.log", tag_, chunk.id))
                       .string();
  }
  return job;
}

std::vector<PipelineJob>
PipelineFactory::make_jobs(const std::vector<Chunk> &chunks,
                           bool skip_credits) const {
  std::vector<PipelineJob> jobs;
  jobs.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    if (skip_credits && chunk.is_credits)
      continue;
    jobs.push_back(make_job(chunk));
  }
  return jobs;
}

} // namespace chunk_encode
