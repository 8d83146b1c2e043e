/**
 * @file system.hpp
 * @brief System utilities: CPU detection, executable lookup, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - PATH lookup for external tools (encoder, copy utility)
 *
 *          - Shell quoting for command lines run through /bin/sh
 *
 *          - Time formatting utilities
 */

#ifndef TRANSYNC_SYSTEM_HPP
#define TRANSYNC_SYSTEM_HPP

#include <optional>
#include <string>

namespace transync {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads
 *       cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- External Tools ----**

/**
 * @brief Resolve an executable name against PATH.
 * @param name Bare name ("ffmpeg") or a path containing '/'
 * @return Path to an executable file, or nullopt if none was found
 */
std::optional<std::string> find_executable(const std::string &name);

/**
 * @brief Quote a single argument for /bin/sh.
 * @note Wraps in single quotes; embedded quotes become '\''.
 */
std::string shell_quote(const std::string &arg);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

} // namespace transync

#endif // TRANSYNC_SYSTEM_HPP
