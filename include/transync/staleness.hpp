/**
 * @file staleness.hpp
 * @brief Staleness Oracle: does a destination need to be (re)produced?
 *
 * @details Two strategies:
 *
 *          - fingerprint: compare the tag embedded in the transcoded
 *            destination with the SHA-256 of the current source
 *
 *          - modification time: destination is current iff it exists and is
 *            not older than the source
 *
 *          The verdict is cached on the JobRecord and computed once.
 */

#ifndef TRANSYNC_STALENESS_HPP
#define TRANSYNC_STALENESS_HPP

#include <vector>

#include "cancellation.hpp"
#include "fingerprint.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class StalenessOracle
 * @brief Computes and caches per-job staleness verdicts.
 *
 * @attention POLICY:
 *
 *   - Transcode jobs in checksum mode use the fingerprint tag; the source
 *     fingerprint is cached on the job for the encoder to embed
 *
 *   - Copy-only jobs, and every job with checksum mode off, use
 *     modification times
 *
 *   - A missing destination is always stale
 *
 *   - force makes every job stale without running either check
 */
class StalenessOracle {
public:
  StalenessOracle(const TagReader &tags, const Logger &logger,
                  bool force = false);

  /**
   * @brief Cached staleness verdict.
   * @note Computes on first call only. Never throws.
   */
  bool is_stale(JobRecord &job) const;

  /**
   * @brief Compute every verdict up front with `threads` workers.
   * @note Stops handing out work once the token is set; jobs not reached
   *       keep Staleness::Unknown.
   * @return Number of verdicts computed
   */
  size_t prefetch(std::vector<JobRecord> &jobs, int threads,
                  const CancellationToken &token) const;

private:
  Staleness evaluate(JobRecord &job) const;
  Staleness evaluate_fingerprint(JobRecord &job) const;
  static Staleness evaluate_mtime(const JobRecord &job);

  const TagReader &tags_;
  const Logger &logger_;
  bool force_;
};

} // namespace transync

#endif // TRANSYNC_STALENESS_HPP
