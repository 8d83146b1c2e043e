/**
 * @file pipeline.cpp
 * @brief Mirror/transcode orchestration implementation
 *
 * @details Orchestrates one run:
 *
 *          1. Validate options, create the destination root
 *
 *          2. Scan the source tree
 *
 *          3. Prefetch staleness verdicts (own bounded pass)
 *
 *          4. Create destination/staging directories ahead of the stages
 *
 *          5. Transcode in the pool, transfer sequentially
 *
 *          6. Clean up, delete extraneous files, summarise
 */

#include "transync/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "transync/job_scanner.hpp"
#include "transync/staging.hpp"
#include "transync/staleness.hpp"
#include "transync/system.hpp"

namespace transync {

struct SyncPipeline::Progress {
  size_t done = 0;
  size_t total = 0;
};

// **---- Constructor ----**

SyncPipeline::SyncPipeline(SyncOptions options, const Logger &logger,
                           Transcoder &transcoder, Copier &copier,
                           const TagReader &tags,
                           const CancellationToken &token)
    : options_(std::move(options)), logger_(logger), transcoder_(transcoder),
      copier_(copier), tags_(tags), token_(token) {}

const char *SyncPipeline::state_name(State state) {
  switch (state) {
  case State::Setup:
    return "Setup";
  case State::Scanning:
    return "Scanning";
  case State::StalenessCheck:
    return "StalenessCheck";
  case State::Transcoding:
    return "Transcoding";
  case State::Transferring:
    return "Transferring";
  case State::Cleanup:
    return "Cleanup";
  case State::Finished:
    return "Finished";
  case State::FinishedWithErrors:
    return "FinishedWithErrors";
  case State::Canceled:
    return "Canceled";
  }
  return "Unknown";
}

void SyncPipeline::enter(State state) {
  state_ = state;
  logger_.debug("State -> {}", state_name(state));
}

// **---- Main Processing ----**

RunReport SyncPipeline::run() {
  TimingCollector::clear();
  auto run_start = std::chrono::steady_clock::now();
  RunReport report;

  // **----- SETUP -----**

  enter(State::Setup);
  normalize_options(options_);

  if (!options_.dry_run) {
    std::error_code ec;
    fs::create_directories(options_.dest_dir, ec);
    if (ec)
      throw ConfigError(fmt::format("Cannot create destination '{}': {}",
                                    options_.dest_dir.string(), ec.message()));
  }

  logger_.info("Source: {}", options_.source_dir.string());
  logger_.info("Destination: {}", options_.dest_dir.string());
  if (options_.dry_run)
    logger_.warn("Dry run: no files will be written or deleted");

  // **----- SCANNING -----**

  enter(State::Scanning);
  logger_.phase("Scanning...");
  TIMER_START(scan);

  JobScanner scanner(options_);
  std::vector<JobRecord> jobs;
  try {
    jobs = scanner.scan_all();
  } catch (const fs::filesystem_error &e) {
    throw ConfigError(fmt::format("Cannot scan source: {}", e.what()));
  }
  report.total = jobs.size();

  for (const auto &job : JobScanner::extract_conflicts(jobs)) {
    logger_.error("Skipping {}: destination {} is produced by another file",
                  job.relative_path.string(), job.dest_path.string());
    report.failures.push_back(job.source_path.string());
  }

  TIMER_END(scan);
  logger_.info("Found {} files", report.total);

  // **----- STALENESS CHECK -----**

  enter(State::StalenessCheck);
  logger_.phase("Checking for changes...");
  TIMER_START(staleness);

  StalenessOracle oracle(tags_, logger_, options_.force);
  oracle.prefetch(jobs, options_.stale_check_threads, token_);

  std::vector<JobRecord *> copy_jobs;
  std::vector<JobRecord *> transcode_jobs;
  if (!token_.requested()) {
    for (auto &job : jobs) {
      if (!oracle.is_stale(job)) {
        ++report.up_to_date;
        continue;
      }
      (job.needs_transcode ? transcode_jobs : copy_jobs).push_back(&job);
    }
  }

  TIMER_END(staleness);
  logger_.info("{} up to date, {} to transcode, {} to copy", report.up_to_date,
               transcode_jobs.size(), copy_jobs.size());

  /// Parallelism only pays off for transcoding
  int workers = options_.jobs < 0 ? detect_cpu_limit() : options_.jobs;
  bool parallel = workers > 0 && !transcode_jobs.empty() && !options_.dry_run;

  /// Declared before the staging directory: destroyed after it on unwind
  InFlightFile in_flight;
  std::unique_ptr<StagingDirectory> staging;

  if (!token_.requested() && !options_.dry_run && !transcode_jobs.empty()) {
    try {
      staging = std::make_unique<StagingDirectory>(options_.temp_dir);
    } catch (const std::system_error &e) {
      throw ConfigError(e.what());
    }
    logger_.debug("Staging directory: {}", staging->path().string());
  }

  // **----- TRANSCODING || TRANSFERRING -----**

  /// Copy-only jobs first so the transfer stage starts immediately
  std::vector<JobRecord *> ordered;
  ordered.reserve(copy_jobs.size() + transcode_jobs.size());
  ordered.insert(ordered.end(), copy_jobs.begin(), copy_jobs.end());
  ordered.insert(ordered.end(), transcode_jobs.begin(), transcode_jobs.end());

  Progress progress;
  progress.total = ordered.size();

  if (!token_.requested() && !ordered.empty()) {
    TIMER_START(transfer);
    TranscodeStage stage(transcoder_, staging.get(), options_.target_format,
                         logger_);

    if (options_.dry_run) {
      run_dry(ordered, progress, report);
    } else {
      ordered = prepare_directories(ordered, staging.get(), progress, report);
      if (parallel) {
        run_parallel(ordered, stage, workers, in_flight, progress, report);
      } else {
        run_sequential(ordered, stage, in_flight, progress, report);
      }
    }
    TIMER_END(transfer);
  }

  // **----- CLEANUP -----**

  enter(State::Cleanup);
  bool canceled = token_.requested();

  if (in_flight.discard())
    logger_.warn("Removed incomplete file");
  if (staging && !staging->remove())
    logger_.warn("Could not fully remove staging directory {}",
                 staging->path().string());

  if (options_.delete_extraneous && !canceled) {
    TIMER_START(delete_extraneous);
    delete_extraneous(jobs, report);
    TIMER_END(delete_extraneous);
  }

  /// Report failures by path, not in completion order
  std::sort(report.failures.begin(), report.failures.end());

  if (canceled) {
    report.status = RunStatus::Canceled;
    enter(State::Canceled);
  } else if (!report.failures.empty()) {
    report.status = RunStatus::FinishedWithErrors;
    enter(State::FinishedWithErrors);
  } else {
    report.status = RunStatus::Finished;
    enter(State::Finished);
  }

  report.elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - run_start)
                           .count();

  if (logger_.verbose())
    TimingCollector::print_summary();

  return report;
}

// **---- Directory Preparation ----**

std::vector<JobRecord *>
SyncPipeline::prepare_directories(const std::vector<JobRecord *> &jobs,
                                  const StagingDirectory *staging,
                                  Progress &progress, RunReport &report) {
  std::set<fs::path> created;
  std::vector<JobRecord *> ready;
  ready.reserve(jobs.size());

  for (JobRecord *job : jobs) {
    std::vector<fs::path> dirs{job->dest_path.parent_path()};
    if (job->needs_transcode && staging) {
      dirs.push_back(staging
                         ->staged_path_for(job->relative_path,
                                           options_.target_format)
                         .parent_path());
    }

    std::error_code ec;
    for (const auto &dir : dirs) {
      if (created.count(dir))
        continue;
      fs::create_directories(dir, ec);
      if (ec)
        break;
      created.insert(dir);
    }

    if (ec) {
      record_failure(*job, FailureKind::Transfer,
                     fmt::format("cannot create directory: {}", ec.message()),
                     progress, report);
      continue;
    }
    ready.push_back(job);
  }
  return ready;
}

// **---- Stage Drivers ----**

void SyncPipeline::run_parallel(const std::vector<JobRecord *> &ordered,
                                const TranscodeStage &stage, int workers,
                                InFlightFile &in_flight, Progress &progress,
                                RunReport &report) {
  enter(State::Transcoding);
  logger_.phase("Transcoding with {} workers...", workers);

  TranscodePool pool(workers, stage, token_);
  pool.start();
  for (JobRecord *job : ordered)
    pool.submit(job);
  pool.close();

  enter(State::Transferring);
  StageResult result;
  while (pool.next_result(result)) {
    transfer(result, in_flight, progress, report);
    if (token_.requested())
      break;
  }

  if (token_.requested())
    logger_.warn("Canceled: stopping workers...");
  pool.stop();
}

void SyncPipeline::run_sequential(const std::vector<JobRecord *> &ordered,
                                  const TranscodeStage &stage,
                                  InFlightFile &in_flight, Progress &progress,
                                  RunReport &report) {
  enter(State::Transferring);
  logger_.phase("Transferring...");

  for (JobRecord *job : ordered) {
    if (token_.requested())
      break;
    transfer(stage.execute(*job, token_), in_flight, progress, report);
  }
}

void SyncPipeline::run_dry(const std::vector<JobRecord *> &ordered,
                           Progress &progress, RunReport &report) {
  enter(State::Transferring);
  logger_.phase("Dry run...");

  for (JobRecord *job : ordered) {
    ++progress.done;
    if (job->needs_transcode) {
      ++report.transcoded;
      logger_.info("[{}/{}] Would transcode: {}", progress.done,
                   progress.total, job->relative_path.string());
    } else {
      ++report.copied;
      logger_.info("[{}/{}] Would copy: {}", progress.done, progress.total,
                   job->relative_path.string());
    }
  }
}

// **---- Transfer ----**

void SyncPipeline::transfer(const StageResult &result, InFlightFile &in_flight,
                            Progress &progress, RunReport &report) {
  JobRecord &job = *result.job;

  if (result.failure == FailureKind::Canceled)
    return;
  if (!result.ok()) {
    record_failure(job, result.failure, result.detail, progress, report);
    return;
  }

  StageResult copied;
  try {
    copied = copier_.copy(result.payload, job.dest_path, in_flight, token_);
  } catch (const std::exception &e) {
    in_flight.discard();
    copied = StageResult::fail(&job, FailureKind::Unexpected, e.what());
  }

  /// Staged files are reclaimed as soon as they have been placed
  if (job.staged_path) {
    std::error_code ec;
    fs::remove(*job.staged_path, ec);
    job.staged_path.reset();
  }

  if (copied.failure == FailureKind::Canceled)
    return;
  if (!copied.ok()) {
    record_failure(job, copied.failure, copied.detail, progress, report);
    return;
  }

  ++progress.done;
  if (job.needs_transcode) {
    ++report.transcoded;
    logger_.success("[{}/{}] Transcoded: {}", progress.done, progress.total,
                    job.relative_path.string());
  } else {
    ++report.copied;
    logger_.success("[{}/{}] Copied: {}", progress.done, progress.total,
                    job.relative_path.string());
  }
}

void SyncPipeline::record_failure(const JobRecord &job, FailureKind kind,
                                  const std::string &detail,
                                  Progress &progress, RunReport &report) {
  ++progress.done;
  report.failures.push_back(job.source_path.string());
  const char *what = kind == FailureKind::Encoder ? "transcode" : "transfer";
  logger_.error("[{}/{}] Failed to {} {}: {}", progress.done, progress.total,
                what, job.relative_path.string(), detail);
}

// **---- Extraneous Files ----**

void SyncPipeline::delete_extraneous(const std::vector<JobRecord> &jobs,
                                     RunReport &report) {
  logger_.phase("Deleting extraneous files...");

  std::set<fs::path> expected;
  for (const auto &job : jobs)
    expected.insert(job.dest_path);

  JobScanner scanner(options_);
  std::vector<fs::path> extraneous;
  try {
    extraneous = scanner.find_extraneous(expected);
  } catch (const fs::filesystem_error &e) {
    logger_.error("Cannot list destination: {}", e.what());
    return;
  }

  std::set<fs::path> parents;
  for (const auto &path : extraneous) {
    if (options_.dry_run) {
      logger_.info("Would delete: {}", path.string());
      ++report.deleted;
      continue;
    }
    std::error_code ec;
    if (fs::remove(path, ec)) {
      logger_.info("Deleted: {}", path.string());
      ++report.deleted;
      parents.insert(path.parent_path());
    } else if (ec) {
      logger_.error("Cannot delete {}: {}", path.string(), ec.message());
    }
  }

  /// Prune directories the deletion left empty, deepest first
  for (auto it = parents.rbegin(); it != parents.rend(); ++it) {
    fs::path dir = *it;
    std::error_code ec;
    while (dir != options_.dest_dir &&
           dir.native().size() > options_.dest_dir.native().size() &&
           fs::is_empty(dir, ec) && !ec) {
      if (!fs::remove(dir, ec) || ec)
        break;
      logger_.debug("Removed empty directory: {}", dir.string());
      dir = dir.parent_path();
    }
  }
}

// **---- Summary ----**

void SyncPipeline::print_summary(const RunReport &report,
                                 const Logger &logger) {
  std::lock_guard<std::mutex> lock(log_mutex);

  if (logger.verbosity() != Verbosity::Quiet) {
    const char *status = "FINISHED";
    if (report.status == RunStatus::Canceled)
      status = "CANCELED";
    else if (report.status == RunStatus::FinishedWithErrors)
      status = "FINISHED WITH ERRORS";

    fmt::print("\n");
    fmt::print(fg(fmt::color::cyan),
               "==================== SYNC SUMMARY ====================\n");
    fmt::print("{:<25} {:>26}\n", "Status:", status);
    fmt::print("{:<25} {:>26}\n", "Files scanned:", report.total);
    fmt::print("{:<25} {:>26}\n", "Up to date:", report.up_to_date);
    fmt::print("{:<25} {:>26}\n", "Transcoded:", report.transcoded);
    fmt::print("{:<25} {:>26}\n", "Copied:", report.copied);
    fmt::print("{:<25} {:>26}\n", "Deleted:", report.deleted);
    fmt::print("{:<25} {:>26}\n", "Failed:", report.failures.size());
    fmt::print("{:<25} {:>26}\n", "Wall-clock time:",
               format_time(report.elapsed_sec));
    fmt::print(fg(fmt::color::cyan),
               "======================================================\n");
  }

  /// List failed files if any
  if (!report.failures.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &path : report.failures) {
      fmt::print(fg(fmt::color::red), "  - {}\n", path);
    }
  }
  std::fflush(stdout);
}

} // namespace transync
