/**
 * @file run_settings.cpp
 * @brief Run settings validation and derived defaults
 */

#include "chunk_encode/run_settings.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <fmt/core.h>

#include "chunk_encode/config.hpp"
#include "chunk_encode/encoder_params.hpp"
#include "chunk_encode/logging.hpp"

namespace chunk_encode {

namespace {

/// Frame area above which metrics sample every third frame (1280x720)
constexpr long long METRIC_SKIP_AREA = 921600;

constexpr double DEFAULT_MIN_Q = 10.0;
constexpr double DEFAULT_MAX_Q = 50.0;

bool out_of_range(double value, double low, double high) {
  return value < low || value > high;
}

} // anonymous namespace

void quantizer_range(EncoderFamily family, double &low, double &high) {
  if (family == EncoderFamily::Rav1e) {
    low = 0.0;
    high = 255.0;
  } else {
    low = 2.0;
    high = 64.0;
  }
}

bool parse_worker_spec(const std::string &text, int &workers, int &threads) {
  size_t comma = text.find(',');
  if (comma == std::string::npos)
    return false;
  try {
    size_t used = 0;
    std::string w = text.substr(0, comma);
    std::string t = text.substr(comma + 1);
    int parsed_workers = std::stoi(w, &used);
    if (used != w.size())
      return false;
    int parsed_threads = std::stoi(t, &used);
    if (used != t.size())
      return false;
    if (parsed_workers < 1 || parsed_threads < 0)
      return false;
    workers = parsed_workers;
    threads = parsed_threads == 0 ? 1 : parsed_threads;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool preset_is_numeric(const std::string &preset, int &level) {
  if (preset.empty())
    return false;
  try {
    size_t used = 0;
    level = std::stoi(preset, &used);
    return used == preset.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool validate_settings(RunSettings &settings, std::string &error) {
  if (settings.source.empty()) {
    error = "You need to supply a source video to encode.";
    return false;
  }
  if (settings.scenes_path.empty() && !settings.list_parameters) {
    error = "You need to supply a scene change file with --scenes.";
    return false;
  }

  if (settings.qadjust_reuse || settings.qadjust_only)
    settings.qadjust = true;

  double q_low = 0.0, q_high = 0.0;
  quantizer_range(settings.encoder, q_low, q_high);
  if (settings.q >= 0.0 && out_of_range(settings.q, q_low, q_high)) {
    error = fmt::format("Q must be {}-{}.", q_low, q_high);
    return false;
  }
  if (settings.credits_q >= 0.0 &&
      out_of_range(settings.credits_q, q_low, q_high)) {
    error = fmt::format("Q for credits must be {}-{}.", q_low, q_high);
    return false;
  }

  int level = 0;
  if (!settings.preset.empty()) {
    if (preset_is_numeric(settings.preset, level)) {
      if (out_of_range(level, -1, 12)) {
        error = "Preset must be -1..12.";
        return false;
      }
    } else if (settings.encoder != EncoderFamily::X265) {
      error = fmt::format("Preset '{}' is not a speed level.", settings.preset);
      return false;
    }
  }

  if (settings.threads >= 0 && out_of_range(settings.threads, 1, 64)) {
    error = "Threads must be 1-64.";
    return false;
  }
  if (settings.min_chunk_length >= 0 &&
      out_of_range(settings.min_chunk_length, 5, 999999)) {
    error = "Minimum chunk length must be 5-999999.";
    return false;
  }
  if (settings.max_parallel >= 0 && out_of_range(settings.max_parallel, 1, 64)) {
    error = "Maximum parallel encodes is 1-64.";
    return false;
  }
  if (settings.credits_cpu != -100 &&
      out_of_range(settings.credits_cpu, -1, 12)) {
    error = "CPU for credits must be -1..12.";
    return false;
  }
  if (settings.qadjust && out_of_range(settings.qadjust_cpu, -1, 12)) {
    error = "CPU for qadjust must be -1..12.";
    return false;
  }
  if (settings.qadjust_skip >= 0 && out_of_range(settings.qadjust_skip, 1, 100)) {
    error = "Qadjust skip must be 1-100.";
    return false;
  }
  if (settings.probe_count >= 0 && out_of_range(settings.probe_count, 1, 64)) {
    error = "Probe count must be 1-64.";
    return false;
  }
  if (settings.min_q >= 0.0 && settings.max_q >= 0.0 &&
      settings.min_q >= settings.max_q) {
    error = "Minimum Q must be below maximum Q.";
    return false;
  }

  if (!settings.qadjust)
    return true;

  if (settings.encoder != EncoderFamily::Svt &&
      settings.qadjust_mode == QAdjustMode::LinearFit) {
    error = "You can use qadjust-mode 2 only with SVT-AV1.";
    return false;
  }
  if (settings.encoder != EncoderFamily::Svt &&
      settings.encoder != EncoderFamily::X265) {
    LOG_WARN("Qadjust enabled and encoder not svt or x265, encoder set to "
             "SVT-AV1.");
    settings.encoder = EncoderFamily::Svt;
    if (!settings.preset.empty() && !preset_is_numeric(settings.preset, level))
      settings.preset.clear();
  }
  if (settings.qadjust_mode != QAdjustMode::Percentile &&
      !settings.has_target && !settings.qadjust_reuse) {
    error = fmt::format("qadjust-mode {} needs --qadjust-target.",
                        static_cast<int>(settings.qadjust_mode));
    return false;
  }
  return true;
}

bool resolve_settings(RunSettings &settings, const VideoInfo &info,
                      std::string &error) {
  const EncoderFamily family = settings.encoder;

  if (settings.credits_start >= 0 &&
      settings.credits_start >= info.frame_count - 1) {
    error = "The credits cannot start at or after the end of video.";
    return false;
  }

  std::string bad_name;
  if (!Config::check_environment(bad_name)) {
    error = fmt::format("Invalid value for {}: '{}'.", bad_name,
                        std::getenv(bad_name.c_str()));
    return false;
  }

  try {
    if (settings.max_parallel < 0)
      settings.max_parallel = Config::max_parallel_encodes();
    if (settings.probe_count < 0)
      settings.probe_count = Config::probe_count();
    settings.terminate_timeout_sec = Config::terminate_timeout_sec();
    settings.probe_points = Config::probe_points();
    settings.probe_window = Config::probe_window_frames();
    settings.probe_skip_fraction = Config::probe_skip_fraction();
    settings.luma_min = Config::luma_min();
    settings.luma_max = Config::luma_max();
  } catch (const std::exception &e) {
    error = fmt::format("Invalid tuning environment: {}", e.what());
    return false;
  }
  if (settings.probe_window <= 0)
    settings.probe_window = info.fps_ceil * 2;
  if (settings.luma_min >= settings.luma_max) {
    error = "LUMA_MIN must be below LUMA_MAX.";
    return false;
  }

  if (settings.work_dir.empty())
    settings.work_dir = Config::work_dir();

  if (settings.preset.empty())
    settings.preset = family == EncoderFamily::X265 ? "slow" : "2";

  if (settings.q < 0.0)
    settings.q = family == EncoderFamily::Rav1e ? 60.0 : 18.0;

  if (settings.credits_q < 0.0) {
    switch (family) {
    case EncoderFamily::Rav1e:
      settings.credits_q = 180.0;
      break;
    case EncoderFamily::X265:
      settings.credits_q = settings.q + 8.0;
      break;
    default:
      settings.credits_q = 40.0;
      break;
    }
  }

  int level = 0;
  if (settings.credits_cpu == -100 && preset_is_numeric(settings.preset, level))
    settings.credits_cpu = std::clamp(level + 2, 4, 12);

  if (settings.threads < 0)
    settings.threads = family == EncoderFamily::Svt ? 4 : 6;

  const std::vector<std::string> extra =
      split_arguments(settings.extra_params);
  if (settings.min_chunk_length < 0)
    settings.min_chunk_length = default_min_chunk_length(family, info.fps, extra);
  settings.keyint = default_keyint(family, info.fps, extra);

  if (settings.qadjust_skip < 0) {
    long long area = static_cast<long long>(info.width) * info.height;
    settings.qadjust_skip = area > METRIC_SKIP_AREA ? 3 : 1;
  }

  if (settings.metric_workers < 0 &&
      !parse_worker_spec(Config::qadjust_workers(), settings.metric_workers,
                         settings.metric_threads)) {
    error = fmt::format("Invalid QADJUST_WORKERS '{}', expected "
                        "workers,threads (e.g. 2,4).",
                        Config::qadjust_workers());
    return false;
  }

  if (settings.min_q < 0.0)
    settings.min_q = DEFAULT_MIN_Q;
  if (settings.max_q < 0.0)
    settings.max_q = DEFAULT_MAX_Q;
  if (settings.min_q >= settings.max_q) {
    error = "Minimum Q must be below maximum Q.";
    return false;
  }

  if (settings.metric_command.empty())
    settings.metric_command = Config::metric_command();
  if (settings.qadjust && !settings.qadjust_reuse &&
      !settings.list_parameters && settings.metric_command.empty()) {
    error = "Qadjust needs a metric command (--metric-command or "
            "METRIC_COMMAND).";
    return false;
  }
  return true;
}

} // namespace chunk_encode
