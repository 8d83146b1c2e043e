/**
 * @file staleness.cpp
 * @brief Staleness Oracle implementation
 */

#include "transync/staleness.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "transync/task_queue.hpp"

namespace transync {

StalenessOracle::StalenessOracle(const TagReader &tags, const Logger &logger,
                                 bool force)
    : tags_(tags), logger_(logger), force_(force) {}

bool StalenessOracle::is_stale(JobRecord &job) const {
  if (force_)
    return true;

  if (job.staleness == Staleness::Unknown) {
    try {
      job.staleness = evaluate(job);
    } catch (const std::exception &e) {
      logger_.warn("Staleness check failed for {}: {}",
                   job.source_path.string(), e.what());
      job.staleness = Staleness::Stale;
    }
  }
  return job.staleness == Staleness::Stale;
}

Staleness StalenessOracle::evaluate(JobRecord &job) const {
  if (job.checksum_mode && job.needs_transcode)
    return evaluate_fingerprint(job);
  return evaluate_mtime(job);
}

Staleness StalenessOracle::evaluate_fingerprint(JobRecord &job) const {
  /// Computed even when the destination is missing: the encoder embeds it
  std::error_code ec;
  job.source_fingerprint = compute_fingerprint(job.source_path, ec);
  if (!job.source_fingerprint) {
    logger_.debug("Cannot fingerprint {}: {}", job.source_path.string(),
                  ec.message());
    return Staleness::Stale;
  }

  auto tag = tags_.read_fingerprint(job.dest_path);
  if (!tag) {
    logger_.debug("No fingerprint tag on {}", job.dest_path.string());
    return Staleness::Stale;
  }
  return *tag == *job.source_fingerprint ? Staleness::UpToDate
                                         : Staleness::Stale;
}

Staleness StalenessOracle::evaluate_mtime(const JobRecord &job) {
  std::error_code ec;
  auto dest_time = fs::last_write_time(job.dest_path, ec);
  if (ec)
    return Staleness::Stale; //< Missing or unreadable destination
  auto source_time = fs::last_write_time(job.source_path, ec);
  if (ec)
    return Staleness::Stale;
  return dest_time >= source_time ? Staleness::UpToDate : Staleness::Stale;
}

size_t StalenessOracle::prefetch(std::vector<JobRecord> &jobs, int threads,
                                 const CancellationToken &token) const {
  if (jobs.empty() || force_)
    return 0;

  TaskQueue<JobRecord *> queue;
  for (auto &job : jobs)
    queue.push(&job);
  queue.finish();

  int num_threads = std::max(1, std::min(threads, static_cast<int>(jobs.size())));
  PaddedAtomic<size_t> checked{0};

  std::vector<std::thread> workers;
  workers.reserve(num_threads);
  for (int i = 0; i < num_threads; ++i) {
    workers.emplace_back([this, &queue, &checked, &token]() {
      size_t local_checked = 0;
      JobRecord *job = nullptr;
      while (!token.requested() && queue.pop(job)) {
        is_stale(*job);
        ++local_checked;
      }
      checked += local_checked;
    });
  }
  for (auto &w : workers)
    w.join();

  return checked.load();
}

} // namespace transync
