/**
 * @file transcode_pool.hpp
 * @brief Transcode stage and its fixed-size worker pool
 *
 * @details Enables parallel transcoding with sequential transfer:
 *
 *          - The orchestrator (producer) submits jobs, copy-only first
 *
 *          - Workers run TranscodeStage::execute and push StageResults
 *
 *          - The transfer consumer pops results in completion order
 */

#ifndef TRANSYNC_TRANSCODE_POOL_HPP
#define TRANSYNC_TRANSCODE_POOL_HPP

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "logging.hpp"
#include "staging.hpp"
#include "task_queue.hpp"
#include "transcoder.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class TranscodeStage
 * @brief Per-job unit of work of the transcode stage.
 *
 * @attention BEHAVIOUR:
 *
 *   - Copy-only jobs pass through: the payload is the source file
 *
 *   - Transcode jobs are encoded into the staging directory; the staged
 *     path is recorded on the job
 *
 *   - Every failure, including exceptions, comes back as a StageResult
 */
class TranscodeStage {
public:
  TranscodeStage(Transcoder &transcoder, const StagingDirectory *staging,
                 std::string target_format, const Logger &logger);

  StageResult execute(JobRecord &job, const CancellationToken &token) const;

private:
  Transcoder &transcoder_;
  const StagingDirectory *staging_; //< Null in dry-run
  std::string target_format_;
  const Logger &logger_;
};

/**
 * @class TranscodePool
 * @brief Fixed number of workers between a feed queue and a completion
 *        queue.
 *
 * @attention SHUTDOWN:
 *
 *   - close() after the last submit(); the completion queue finishes when
 *     the last worker drains the feed
 *
 *   - stop() drops unstarted jobs and joins the workers; running encoders
 *     are killed through the shared token
 */
class TranscodePool {
public:
  TranscodePool(int workers, const TranscodeStage &stage,
                const CancellationToken &token);
  ~TranscodePool();

  TranscodePool(const TranscodePool &) = delete;
  TranscodePool &operator=(const TranscodePool &) = delete;

  void start();
  void submit(JobRecord *job) { feed_.push(job); }
  void close() { feed_.finish(); }

  /**
   * @brief Next completed result (blocking).
   * @return false once every result was consumed or on cancellation
   */
  bool next_result(StageResult &result);

  void stop();

  int worker_count() const { return workers_; }

private:
  void worker_loop();

  int workers_;
  const TranscodeStage &stage_;
  const CancellationToken &token_;

  TaskQueue<JobRecord *> feed_;
  TaskQueue<StageResult> results_;
  std::atomic<int> active_{0};
  std::vector<std::thread> threads_;
};

} // namespace transync

#endif // TRANSYNC_TRANSCODE_POOL_HPP
