/**
 * @file copier.hpp
 * @brief Atomic file placement into the destination tree
 *
 * @details Provides:
 *
 *          - InFlightFile: the single "currently being written" handle the
 *            orchestrator cleans up on cancellation
 *
 *          - Copier: transfer capability used by the sequential stage
 *
 *          - RsyncCopier: fast-copy through the rsync utility
 *
 *          - PlainCopier: in-process copy to a temp name, then rename
 */

#ifndef TRANSYNC_COPIER_HPP
#define TRANSYNC_COPIER_HPP

#include <memory>
#include <optional>
#include <string>

#include "cancellation.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class InFlightFile
 * @brief Tracks at most one incomplete destination-side file.
 *
 * @note Whatever is still tracked when the object is destroyed (or
 *       discard() is called) gets deleted. commit() forgets the file once it
 *       has been renamed into place.
 */
class InFlightFile {
public:
  InFlightFile() = default;
  ~InFlightFile() { discard(); }

  InFlightFile(const InFlightFile &) = delete;
  InFlightFile &operator=(const InFlightFile &) = delete;

  void track(fs::path path) { path_ = std::move(path); }
  void commit() { path_.reset(); }

  /**
   * @brief Delete the tracked file, if any.
   * @return true if a file was removed
   */
  bool discard();

  const std::optional<fs::path> &path() const { return path_; }

private:
  std::optional<fs::path> path_;
};

/**
 * @class Copier
 * @brief Places a file at its final destination path.
 *
 * @attention CONTRACT:
 *
 *   - The destination's parent directory already exists
 *
 *   - A failed or canceled copy never leaves a partial file under the
 *     final name
 *
 *   - Failures are returned, never thrown
 */
class Copier {
public:
  virtual ~Copier() = default;

  virtual StageResult copy(const fs::path &from, const fs::path &to,
                           InFlightFile &in_flight,
                           const CancellationToken &token) = 0;

  virtual std::string name() const = 0;
};

/**
 * @class RsyncCopier
 * @brief Copies through rsync, which writes a temp file and renames it.
 */
class RsyncCopier : public Copier {
public:
  RsyncCopier(std::string rsync_path, const Logger &logger);

  StageResult copy(const fs::path &from, const fs::path &to,
                   InFlightFile &in_flight,
                   const CancellationToken &token) override;

  std::string name() const override { return "rsync"; }

  /// Always transfers: a stale-by-fingerprint file may match in size and mtime
  std::string build_command(const fs::path &from, const fs::path &to) const;

private:
  std::string rsync_path_;
  const Logger &logger_;
};

/**
 * @class PlainCopier
 * @brief Copies bytes to a hidden sibling temp file, then renames it.
 * @note The token is checked between 1 MiB chunks.
 */
class PlainCopier : public Copier {
public:
  StageResult copy(const fs::path &from, const fs::path &to,
                   InFlightFile &in_flight,
                   const CancellationToken &token) override;

  std::string name() const override { return "plain copy"; }

  /**
   * @brief Temp name used while copying to `to`.
   */
  static fs::path temp_path_for(const fs::path &to);
};

/**
 * @brief Pick the fast-copy utility if it can be found, else PlainCopier.
 */
std::unique_ptr<Copier> make_copier(const std::string &copy_utility,
                                    const Logger &logger);

} // namespace transync

#endif // TRANSYNC_COPIER_HPP
