/**
 * @file system.hpp
 * @brief System utilities: CPU detection and formatting helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Time and size formatting utilities
 *
 * @note The encoder pool size is always user configured. The CPU limit is
 *       only used to warn about oversubscription.
 */

#ifndef CHUNK_ENCODE_SYSTEM_HPP
#define CHUNK_ENCODE_SYSTEM_HPP

#include <string>

namespace chunk_encode {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - The scheduler affinity mask, which reflects cpusets
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Round to the nearest multiple of 0.25.
 * @note Ties go to the even quarter, matching round-half-even.
 */
double round_to_quarter(double value);

/**
 * @brief Round up to the next multiple of 0.25.
 */
double ceil_to_quarter(double value);

/**
 * @brief Format a quantizer for a command line or log ("27.25", "30").
 */
std::string format_quantizer(double q);

} // namespace chunk_encode

#endif // CHUNK_ENCODE_SYSTEM_HPP
