/**
 * @file transcode_pool.cpp
 * @brief Transcode stage and worker pool implementation
 */

#include "transync/transcode_pool.hpp"

#include <system_error>

#include "transync/fingerprint.hpp"

namespace transync {

// **---- TranscodeStage ----**

TranscodeStage::TranscodeStage(Transcoder &transcoder,
                               const StagingDirectory *staging,
                               std::string target_format,
                               const Logger &logger)
    : transcoder_(transcoder), staging_(staging),
      target_format_(std::move(target_format)), logger_(logger) {}

StageResult TranscodeStage::execute(JobRecord &job,
                                    const CancellationToken &token) const {
  if (!job.needs_transcode)
    return StageResult::success(&job, job.source_path);

  if (token.requested())
    return StageResult::fail(&job, FailureKind::Canceled, "canceled");

  if (!staging_)
    return StageResult::fail(&job, FailureKind::Unexpected,
                             "no staging directory");

  try {
    /// Forced runs skip the staleness check, so the digest may be missing
    if (job.checksum_mode && !job.source_fingerprint) {
      std::error_code ec;
      job.source_fingerprint = compute_fingerprint(job.source_path, ec);
      if (!job.source_fingerprint)
        logger_.debug("Cannot fingerprint {}: {}", job.source_path.string(),
                      ec.message());
    }

    fs::path staged = staging_->staged_path_for(job.relative_path,
                                                target_format_);
    job.staged_path = staged;

    StageResult result = transcoder_.transcode(job, staged, token);
    result.job = &job;
    if (result.ok())
      result.payload = staged;
    return result;
  } catch (const std::exception &e) {
    return StageResult::fail(&job, FailureKind::Unexpected, e.what());
  }
}

// **---- TranscodePool ----**

TranscodePool::TranscodePool(int workers, const TranscodeStage &stage,
                             const CancellationToken &token)
    : workers_(workers > 0 ? workers : 1), stage_(stage), token_(token) {}

TranscodePool::~TranscodePool() { stop(); }

void TranscodePool::start() {
  active_.store(workers_);
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i)
    threads_.emplace_back(&TranscodePool::worker_loop, this);
}

void TranscodePool::worker_loop() {
  JobRecord *job = nullptr;
  while (!token_.requested() && feed_.pop(job)) {
    results_.push(stage_.execute(*job, token_));
  }

  /// Last worker out closes the completion queue
  if (--active_ == 0)
    results_.finish();
}

bool TranscodePool::next_result(StageResult &result) {
  return results_.pop(result, token_);
}

void TranscodePool::stop() {
  feed_.cancel();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

} // namespace transync
