/**
 * @file config.hpp
 * @brief Run configuration and environment defaults
 *
 * @details Provides:
 *
 *          - Config namespace with lazy-initialized, memoized defaults loaded
 *            from environment variables
 *
 *          - SyncOptions: the complete configuration of one run
 *
 *          - ConfigError: fatal setup error raised before any work starts
 */

#ifndef TRANSYNC_CONFIG_HPP
#define TRANSYNC_CONFIG_HPP

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include "logging.hpp"

namespace transync {

namespace fs = std::filesystem;

/**
 * @class ConfigError
 * @brief Fatal setup error (invalid formats, unusable source/destination).
 */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set, not a number or out of
 *        int range
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(val, &end, 10);
  if (!end || *end != '\0' || errno == ERANGE || parsed < INT_MIN ||
      parsed > INT_MAX)
    return default_val;
  return static_cast<int>(parsed);
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/**
 * @brief Transcode pool size override.
 * @note -1 = unset (use detected CPU limit), 0 = fully sequential
 */
inline int jobs() {
  static int val = get_env_int("TRANSYNC_JOBS", -1);
  return val;
}

/// Width of the staleness prefetch pass
inline int stale_check_threads() {
  static int val = get_env_int("TRANSYNC_STALE_CHECK_THREADS", 8);
  return val;
}

/// Encoder executable
inline const std::string &encoder_path() {
  static std::string val = get_env_string("TRANSYNC_FFMPEG", "ffmpeg");
  return val;
}

/// Fast-copy utility executable
inline const std::string &copy_utility() {
  static std::string val = get_env_string("TRANSYNC_COPY_UTILITY", "rsync");
  return val;
}

/// Parent directory for the private staging directory
inline const std::string &temp_dir() {
  static std::string val = get_env_string("TMPDIR", "/tmp");
  return val;
}

} // namespace Config

/**
 * @struct SyncOptions
 * @brief Everything the orchestrator needs to mirror one tree.
 *
 * @note Built from Config defaults, then overridden by the command line.
 *       Call normalize_options() before handing it to SyncPipeline.
 */
struct SyncOptions {
  fs::path source_dir;
  fs::path dest_dir;
  std::set<std::string> transcode_formats{"flac"}; //< Lower case, no dot
  std::string target_format = "mp3";               //< Lower case, no dot
  std::string encoder_path = Config::encoder_path();
  std::optional<std::string> encoder_options; //< Verbatim, unvalidated
  std::string copy_utility = Config::copy_utility();
  fs::path temp_dir = Config::temp_dir();
  int jobs = Config::jobs();                  //< -1 = auto, 0 = sequential
  int stale_check_threads = Config::stale_check_threads();
  bool dry_run = false;
  bool include_hidden = false;
  bool delete_extraneous = false;
  bool force = false;
  bool checksum_mode = true;
  Verbosity verbosity = Verbosity::Normal;
};

/**
 * @brief Lower-case a format name and strip a leading dot.
 */
std::string normalize_format(std::string format);

/**
 * @brief Parse a comma-delimited format list ("flac, WAV,.aiff").
 * @throws ConfigError if the list contains no formats
 */
std::set<std::string> parse_format_list(const std::string &list);

/**
 * @brief Validate and normalise options in place.
 *
 * @attention Checks, in order:
 *
 *   - target format is not itself a transcode format
 *
 *   - job count is not below -1
 *
 *   - source directory exists and is a directory
 *
 *   - destination is neither the source nor inside it
 *
 * Source and destination are made absolute and lexically normal; the
 * destination does not need to exist yet.
 *
 * @throws ConfigError on the first violation
 */
void normalize_options(SyncOptions &options);

} // namespace transync

#endif // TRANSYNC_CONFIG_HPP
