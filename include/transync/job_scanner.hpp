/**
 * @file job_scanner.hpp
 * @brief Job Record producer and destination path mapping
 *
 * @details Walks the source tree and builds one JobRecord per regular file,
 *          mapping its relative path into the destination tree. Also lists
 *          destination files no JobRecord maps to (extraneous files).
 */

#ifndef TRANSYNC_JOB_SCANNER_HPP
#define TRANSYNC_JOB_SCANNER_HPP

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class JobScanner
 * @brief Produces JobRecords for a source/destination pair.
 *
 * @attention MAPPING:
 *
 *   - dest parent = dest_dir / (source parent relative to source_dir)
 *
 *   - transcode formats get the target extension, others keep theirs
 *
 *   - dotfiles and dot-directories are skipped unless include_hidden
 *
 * @note Expects options already passed through normalize_options().
 */
class JobScanner {
public:
  explicit JobScanner(const SyncOptions &options);

  /**
   * @brief Build the record for one source file (no filesystem access).
   * @param source Absolute path below source_dir
   */
  JobRecord make_job(const fs::path &source) const;

  /**
   * @brief Walk the source tree and hand every record to `sink`.
   * @throws fs::filesystem_error if the tree cannot be walked
   */
  void scan(const std::function<void(JobRecord &&)> &sink) const;

  /**
   * @brief Walk the source tree into a vector, sorted by relative path.
   */
  std::vector<JobRecord> scan_all() const;

  /**
   * @brief Move out every job whose destination an earlier job already owns.
   *
   * @details "a.flac" and "a.wav" both map to "a.mp3" when both formats are
   *          transcoded. The first in `jobs` order keeps the destination.
   *
   * @return Removed jobs, in their original order
   */
  static std::vector<JobRecord>
  extract_conflicts(std::vector<JobRecord> &jobs);

  /**
   * @brief Destination files not in `expected`.
   * @param expected Destination paths of all JobRecords
   * @return Sorted list; empty if dest_dir does not exist
   */
  std::vector<fs::path>
  find_extraneous(const std::set<fs::path> &expected) const;

  /**
   * @brief True if `format` (lower case, no dot) is in the transcode set.
   */
  bool is_transcode_format(const std::string &format) const;

private:
  /// Lower-case extension without the dot ("" if none)
  static std::string extension_of(const fs::path &path);
  static bool is_hidden(const fs::path &name);

  const SyncOptions &options_;
};

} // namespace transync

#endif // TRANSYNC_JOB_SCANNER_HPP
