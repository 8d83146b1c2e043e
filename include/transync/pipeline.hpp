/**
 * @file pipeline.hpp
 * @brief Mirror/transcode orchestration
 *
 * @details The SyncPipeline class orchestrates one run:
 *
 *          1. Validate options and resolve paths
 *
 *          2. Scan the source tree into JobRecords
 *
 *          3. Prefetch staleness verdicts
 *
 *          4. Transcode stale jobs in a worker pool (copy-only jobs first)
 *
 *          5. Transfer results sequentially, in completion order
 *
 *          6. Clean up staging and any in-flight file; delete extraneous
 *             destination files on request
 *
 * @note With jobs == 0, nothing to transcode, or dry-run, steps 4 and 5
 *       collapse into a single sequential loop.
 */

#ifndef TRANSYNC_PIPELINE_HPP
#define TRANSYNC_PIPELINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "config.hpp"
#include "copier.hpp"
#include "fingerprint.hpp"
#include "logging.hpp"
#include "transcode_pool.hpp"
#include "transcoder.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class SyncPipeline
 * @brief Orchestrates scanning, staleness, transcoding and transfer.
 *
 * @attention STATES:
 *
 *   Setup -> Scanning -> StalenessCheck -> Transcoding -> Transferring ->
 *   Cleanup -> {Finished, FinishedWithErrors, Canceled}
 *
 * @attention FAILURES:
 *
 *   - ConfigError is thrown only from Setup and Scanning, before any file
 *     is written
 *
 *   - Per-file failures are collected in RunReport::failures and never
 *     stop the run
 *
 *   - Cancellation stops feeding the pool, kills running encoders, removes
 *     the in-flight file and the staging directory
 */
class SyncPipeline {
public:
  enum class State {
    Setup,
    Scanning,
    StalenessCheck,
    Transcoding,
    Transferring,
    Cleanup,
    Finished,
    FinishedWithErrors,
    Canceled
  };

  /**
   * @brief Construct a pipeline.
   * @param options Run configuration (normalised inside run())
   * @param logger Reporter for progress and failures
   * @param transcoder Encoder capability
   * @param copier Transfer capability
   * @param tags Fingerprint tag reader
   * @param token Cancellation token, usually wired to SIGINT/SIGTERM
   */
  SyncPipeline(SyncOptions options, const Logger &logger,
               Transcoder &transcoder, Copier &copier, const TagReader &tags,
               const CancellationToken &token);

  /**
   * @brief Run the complete pipeline.
   * @return Counters, failed source paths and the terminal status
   * @throws ConfigError on fatal setup errors
   */
  RunReport run();

  State state() const { return state_; }
  const SyncOptions &options() const { return options_; }

  /**
   * @brief Print the final summary (failure list is always printed).
   */
  static void print_summary(const RunReport &report, const Logger &logger);

  static const char *state_name(State state);

private:
  struct Progress;

  void enter(State state);

  /**
   * @brief Create destination (and staging) parents ahead of the stages.
   * @return Jobs whose directories exist; the rest are recorded as failed
   */
  std::vector<JobRecord *> prepare_directories(
      const std::vector<JobRecord *> &jobs, const StagingDirectory *staging,
      Progress &progress, RunReport &report);

  void run_parallel(const std::vector<JobRecord *> &ordered,
                    const TranscodeStage &stage, int workers,
                    InFlightFile &in_flight, Progress &progress,
                    RunReport &report);

  void run_sequential(const std::vector<JobRecord *> &ordered,
                      const TranscodeStage &stage, InFlightFile &in_flight,
                      Progress &progress, RunReport &report);

  void run_dry(const std::vector<JobRecord *> &ordered, Progress &progress,
               RunReport &report);

  /**
   * @brief Sequential transfer of one stage result.
   */
  void transfer(const StageResult &result, InFlightFile &in_flight,
                Progress &progress, RunReport &report);

  void record_failure(const JobRecord &job, FailureKind kind,
                      const std::string &detail, Progress &progress,
                      RunReport &report);

  void delete_extraneous(const std::vector<JobRecord> &jobs,
                         RunReport &report);

  SyncOptions options_;
  const Logger &logger_;
  Transcoder &transcoder_;
  Copier &copier_;
  const TagReader &tags_;
  const CancellationToken &token_;
  State state_ = State::Setup;
};

} // namespace transync

#endif // TRANSYNC_PIPELINE_HPP
