/**
 * @file staging.hpp
 * @brief Private scratch directory for transcoded files
 */

#ifndef TRANSYNC_STAGING_HPP
#define TRANSYNC_STAGING_HPP

#include <filesystem>
#include <string>

namespace transync {

namespace fs = std::filesystem;

/**
 * @class StagingDirectory
 * @brief Uniquely named directory removed with everything in it on
 *        destruction.
 *
 * @note Staged names are derived from the job's relative path, so workers
 *       never collide and no locking is needed.
 */
class StagingDirectory {
public:
  /**
   * @brief Create `<parent>/transync-XXXXXX`.
   * @throws std::system_error if the directory cannot be created
   */
  explicit StagingDirectory(const fs::path &parent);
  ~StagingDirectory();

  StagingDirectory(const StagingDirectory &) = delete;
  StagingDirectory &operator=(const StagingDirectory &) = delete;

  const fs::path &path() const { return path_; }

  /**
   * @brief Staged location for a job.
   * @param relative Source path relative to the source root
   * @param target_format Extension of the transcoded file
   * @return Source name with the target extension appended, so sources
   *         differing only in extension never share a staged file
   */
  fs::path staged_path_for(const fs::path &relative,
                           const std::string &target_format) const;

  /**
   * @brief Remove the directory tree now.
   * @return true if nothing is left behind
   */
  bool remove();

private:
  fs::path path_;
  bool removed_ = false;
};

} // namespace transync

#endif // TRANSYNC_STAGING_HPP
