/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - An optional run log file mirroring every console line
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress stays visible while encoders run.
 *
 */

#ifndef CHUNK_ENCODE_LOGGING_HPP
#define CHUNK_ENCODE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace chunk_encode {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Open (append) the run log file that mirrors console output.
 * @param path Log file path, usually <output>/encode_log.txt
 * @return true if the file could be opened
 */
bool open_log_file(const std::string &path);

/**
 * @brief Close the run log file if one is open.
 */
void close_log_file();

/**
 * @brief Append one timestamped line to the run log file.
 * @attention Caller must hold log_mutex. No-op when no file is open.
 */
void mirror_to_log_file(const char *level, const std::string &line);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(chunk_encode::log_mutex);                 \
    std::string log_line_ = fmt::format(format_str, ##__VA_ARGS__);            \
    fmt::print("[INFO] {}\n", log_line_);                                      \
    chunk_encode::mirror_to_log_file("INFO", log_line_);                       \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(chunk_encode::log_mutex);                 \
    std::string log_line_ = fmt::format(format_str, ##__VA_ARGS__);            \
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", log_line_);             \
    chunk_encode::mirror_to_log_file("WARNING", log_line_);                    \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(chunk_encode::log_mutex);                 \
    std::string log_line_ = fmt::format(format_str, ##__VA_ARGS__);            \
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", log_line_);                \
    chunk_encode::mirror_to_log_file("ERROR", log_line_);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(chunk_encode::log_mutex);                 \
    std::string log_line_ = fmt::format(format_str, ##__VA_ARGS__);            \
    fmt::print(fg(fmt::color::cyan), "{}\n", log_line_);                       \
    chunk_encode::mirror_to_log_file("INFO", log_line_);                       \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(chunk_encode::log_mutex);                 \
    std::string log_line_ = fmt::format(format_str, ##__VA_ARGS__);            \
    fmt::print(fg(fmt::color::green), "{}\n", log_line_);                      \
    chunk_encode::mirror_to_log_file("INFO", log_line_);                       \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Function or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 * @note All worker threads can safely record their timings here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   *        Called at program end for summary.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    chunk_encode::TimingCollector::record(#name, timer_duration_##name);       \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace chunk_encode

#endif // CHUNK_ENCODE_LOGGING_HPP
