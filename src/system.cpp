/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Time formatting and quarter-step rounding utilities
 */

#include "chunk_encode/system.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <sched.h>

#include <fmt/core.h>

namespace chunk_encode {

// **---- Internal Helpers ----**

namespace {

/// CPU quota from a "quota period" pair, -1 when unlimited or unreadable
int quota_to_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

/// cgroup v2 unified hierarchy: "max 100000" or "200000 100000"
int cgroup_v2_limit() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota, period;
  f >> quota >> period;
  if (quota == "max" || period.empty())
    return -1;
  try {
    return quota_to_cpus(std::stol(quota), std::stol(period));
  } catch (const std::exception &) {
    return -1;
  }
}

/// cgroup v1 CFS quota
int cgroup_v1_limit() {
  long quota = -1, period = -1;
  std::ifstream q("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  std::ifstream p("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (!(q >> quota) || !(p >> period))
    return -1;
  return quota_to_cpus(quota, period);
}

/// CPUs in this process's affinity mask (reflects cpusets)
int affinity_cpus() {
  cpu_set_t set;
  CPU_ZERO(&set);
  if (sched_getaffinity(0, sizeof(set), &set) != 0)
    return -1;
  return CPU_COUNT(&set);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = cgroup_v2_limit();
  if (limit <= 0)
    limit = cgroup_v1_limit();

  /// A quota never grants more than the cores we may run on
  int allowed = affinity_cpus();
  if (allowed > 0 && (limit <= 0 || allowed < limit))
    limit = allowed;

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());
  return limit > 0 ? limit : 4;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

double round_to_quarter(double value) {
  /// nearbyint honours the default FE_TONEAREST mode (half to even)
  return std::nearbyint(value * 4.0) / 4.0;
}

double ceil_to_quarter(double value) { return std::ceil(value * 4.0) / 4.0; }

std::string format_quantizer(double q) {
  std::string text = fmt::format("{:.2f}", q);
  text.erase(text.find_last_not_of('0') + 1);
  if (!text.empty() && text.back() == '.')
    text.pop_back();
  return text;
}

} // namespace chunk_encode
