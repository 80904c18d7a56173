/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          These are the defaults underneath the command line: a CLI flag
 *          always wins over its environment variable.
 *
 */

#ifndef CHUNK_ENCODE_CONFIG_HPP
#define CHUNK_ENCODE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace chunk_encode {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Check that every numeric tuning variable parses completely.
 * @details The getters below convert with std::stoi / std::stod, which
 *          throw on text like "abc" and silently drop trailing garbage.
 *          Run this before the first getter so a bad value becomes a
 *          startup error instead of an exception mid-run.
 * @param bad_name Output: the first variable that failed to parse
 * @return true if all set variables are well-formed numbers
 */
inline bool check_environment(std::string &bad_name) {
  static const char *const int_names[] = {
      "MAX_PARALLEL_ENCODES", "TERMINATE_TIMEOUT_SEC", "PROBE_COUNT",
      "PROBE_POINTS", "PROBE_WINDOW_FRAMES"};
  static const char *const double_names[] = {"PROBE_SKIP_FRACTION",
                                             "LUMA_MIN", "LUMA_MAX"};

  for (const char *name : int_names) {
    const char *val = std::getenv(name);
    if (!val)
      continue;
    try {
      size_t used = 0;
      std::stoi(val, &used);
      if (used != std::strlen(val)) {
        bad_name = name;
        return false;
      }
    } catch (const std::exception &) {
      bad_name = name;
      return false;
    }
  }
  for (const char *name : double_names) {
    const char *val = std::getenv(name);
    if (!val)
      continue;
    try {
      size_t used = 0;
      std::stod(val, &used);
      if (used != std::strlen(val)) {
        bad_name = name;
        return false;
      }
    } catch (const std::exception &) {
      bad_name = name;
      return false;
    }
  }
  return true;
}

// **---- PARALLEL PROCESSING ----**

/// Concurrent decode|encode pipelines
inline int max_parallel_encodes() {
  static int val = get_env_int("MAX_PARALLEL_ENCODES", 4);
  return val;
}

/**
 * @brief Metric workers as "workers,threads"
 * @note workers = chunks evaluated in parallel, threads = per-engine
 *       stream/thread count handed to the metric command.
 */
inline std::string qadjust_workers() {
  static std::string val = get_env_string("QADJUST_WORKERS", "1,1");
  return val;
}

/// Seconds between SIGTERM and SIGKILL when cancelling
inline int terminate_timeout_sec() {
  static int val = get_env_int("TERMINATE_TIMEOUT_SEC", 5);
  return val;
}

// **---- PROBE CURVE (MODE 3) ----**

/// Number of probe windows sampled from the source
inline int probe_count() {
  static int val = get_env_int("PROBE_COUNT", 8);
  return val;
}

/// Number of quantizer levels probed to build the curve
inline int probe_points() {
  static int val = get_env_int("PROBE_POINTS", 6);
  return val;
}

/// Probe window length in frames (0 = two seconds of frames)
inline int probe_window_frames() {
  static int val = get_env_int("PROBE_WINDOW_FRAMES", 0);
  return val;
}

/// Fraction of the source skipped before the first probe window
inline double probe_skip_fraction() {
  static double val = get_env_double("PROBE_SKIP_FRACTION", 0.05);
  return val;
}

/**
 * @brief Normalized average luma at or below which quantizer raises are
 *        fully suppressed.
 */
inline double luma_min() {
  static double val = get_env_double("LUMA_MIN", 0.06);
  return val;
}

/// Normalized average luma at or above which raises are fully trusted
inline double luma_max() {
  static double val = get_env_double("LUMA_MAX", 0.30);
  return val;
}

// **---- PATHS AND TOOLS ----**

/// Base working folder; each source gets its own subfolder
inline std::string work_dir() {
  static std::string val = get_env_string("WORK_DIR", "./encodes");
  return val;
}

inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline std::string svt_bin() {
  static std::string val = get_env_string("SVT_BIN", "SvtAv1EncApp");
  return val;
}

inline std::string x265_bin() {
  static std::string val = get_env_string("X265_BIN", "x265");
  return val;
}

inline std::string aom_bin() {
  static std::string val = get_env_string("AOM_BIN", "aomenc");
  return val;
}

inline std::string rav1e_bin() {
  static std::string val = get_env_string("RAV1E_BIN", "rav1e");
  return val;
}

/**
 * @brief Metric engine command template
 * @note Placeholders: {reference} {distorted} {start} {end} {skip}
 *       {metric} {threads}. The command prints one score per line.
 */
inline std::string metric_command() {
  static std::string val = get_env_string("METRIC_COMMAND", "");
  return val;
}

} // namespace Config
} // namespace chunk_encode

#endif // CHUNK_ENCODE_CONFIG_HPP
