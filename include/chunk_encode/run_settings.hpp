/**
 * @file run_settings.hpp
 * @brief User-facing run settings, validation and derived defaults
 *
 * @details Settings arrive from the command line with "unset" sentinels.
 *          validate_settings() checks what can be checked without the
 *          source; resolve_settings() fills the derived defaults once the
 *          source has been probed (frame rate, resolution, length).
 */

#ifndef CHUNK_ENCODE_RUN_SETTINGS_HPP
#define CHUNK_ENCODE_RUN_SETTINGS_HPP

#include <string>

#include "types.hpp"
#include "video_probe.hpp"

namespace chunk_encode {

/**
 * @struct RunSettings
 * @brief Everything one run needs. Negative numbers mean "not given".
 */
struct RunSettings {
  std::string source;
  std::string scenes_path;
  std::string work_dir; //< Base folder, the run uses <work_dir>/<stem>

  EncoderFamily encoder = EncoderFamily::Svt;
  std::string preset;  //< Speed level, or an x265 preset name
  int threads = -1;
  double q = -1.0;
  int min_chunk_length = -1;
  int keyint = -1; //< Derived from the frame rate
  int max_parallel = -1;
  std::string extra_params;

  int credits_start = -1;
  double credits_q = -1.0;
  int credits_cpu = -100; //< -1 is a valid speed level

  bool qadjust = false;
  QAdjustMode qadjust_mode = QAdjustMode::Percentile;
  bool qadjust_reuse = false;
  bool qadjust_only = false;
  int qadjust_skip = -1;
  int qadjust_cpu = 7;
  int metric_workers = -1;
  int metric_threads = -1;
  double target = -1.0;
  bool has_target = false;
  double min_q = -1.0;
  double max_q = -1.0;
  int probe_count = -1;
  std::string metric_command;

  // Tuning knobs, read once from the environment by resolve_settings()
  int terminate_timeout_sec = -1;
  int probe_points = -1;
  int probe_window = -1; //< Frames per probe window
  double probe_skip_fraction = -1.0;
  double luma_min = -1.0;
  double luma_max = -1.0;

  bool list_parameters = false;
};

/// Quantizer range accepted by an encoder family
void quantizer_range(EncoderFamily family, double &low, double &high);

/**
 * @brief Parse "workers,threads".
 * @note A thread count of 0 becomes 1.
 * @return false if the text is not two integers with workers >= 1
 */
bool parse_worker_spec(const std::string &text, int &workers, int &threads);

/**
 * @brief Range and consistency checks that do not need the source.
 * @note May switch the encoder to SVT-AV1 for qadjust (logged).
 * @param error Output: user-facing message
 * @return true if the settings are usable
 */
bool validate_settings(RunSettings &settings, std::string &error);

/**
 * @brief Fill every derived default from the probed source.
 * @param error Output: user-facing message
 * @note Reads every environment tuning knob, so nothing later in the run
 *       touches Config.
 * @return false if a setting conflicts with the source (credits range) or
 *         an environment variable is malformed
 */
bool resolve_settings(RunSettings &settings, const VideoInfo &info,
                      std::string &error);

/// Whether a preset string is a plain integer speed level
bool preset_is_numeric(const std::string &preset, int &level);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_RUN_SETTINGS_HPP
