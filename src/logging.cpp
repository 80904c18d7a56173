/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and the run log file
 *
 *          - TimingCollector static members and methods
 */

#include "chunk_encode/logging.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>

#include "chunk_encode/system.hpp"

namespace chunk_encode {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

namespace {

/// Run log file, guarded by log_mutex
std::FILE *log_file = nullptr;

} // anonymous namespace

bool open_log_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
  log_file = std::fopen(path.c_str(), "a");
  return log_file != nullptr;
}

void close_log_file() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
}

void mirror_to_log_file(const char *level, const std::string &line) {
  if (!log_file)
    return;

  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  fmt::print(log_file, "{:%Y-%m-%d %H:%M:%S} - {} - {}\n", local, level, line);
  std::fflush(log_file);
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time [hh:mm:ss]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, format_time(seconds),
               seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace chunk_encode
