/**
 * @file job_scanner.cpp
 * @brief Job Record producer implementation
 */

#include "transync/job_scanner.hpp"

#include <algorithm>
#include <cctype>

namespace transync {

JobScanner::JobScanner(const SyncOptions &options) : options_(options) {}

std::string JobScanner::extension_of(const fs::path &path) {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.')
    ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

bool JobScanner::is_hidden(const fs::path &name) {
  std::string s = name.string();
  return !s.empty() && s.front() == '.' && s != "." && s != "..";
}

bool JobScanner::is_transcode_format(const std::string &format) const {
  return options_.transcode_formats.count(format) != 0;
}

JobRecord JobScanner::make_job(const fs::path &source) const {
  JobRecord job;
  job.source_path = source;
  job.relative_path = source.lexically_relative(options_.source_dir);
  job.needs_transcode = is_transcode_format(extension_of(source));
  job.encoder_options = options_.encoder_options;
  job.checksum_mode = options_.checksum_mode;

  fs::path dest = options_.dest_dir / job.relative_path;
  if (job.needs_transcode)
    dest.replace_extension(options_.target_format);
  job.dest_path = dest.lexically_normal();
  return job;
}

void JobScanner::scan(const std::function<void(JobRecord &&)> &sink) const {
  auto it = fs::recursive_directory_iterator(
      options_.source_dir, fs::directory_options::skip_permission_denied);

  for (auto end = fs::end(it); it != end; ++it) {
    const auto &entry = *it;
    if (!options_.include_hidden && is_hidden(entry.path().filename())) {
      if (entry.is_directory())
        it.disable_recursion_pending();
      continue;
    }
    if (entry.is_regular_file())
      sink(make_job(entry.path()));
  }
}

std::vector<JobRecord> JobScanner::scan_all() const {
  std::vector<JobRecord> jobs;
  scan([&jobs](JobRecord &&job) { jobs.push_back(std::move(job)); });
  std::sort(jobs.begin(), jobs.end(),
            [](const JobRecord &a, const JobRecord &b) {
              return a.relative_path < b.relative_path;
            });
  return jobs;
}

std::vector<JobRecord>
JobScanner::extract_conflicts(std::vector<JobRecord> &jobs) {
  std::set<fs::path> claimed;
  std::vector<JobRecord> kept;
  std::vector<JobRecord> conflicts;
  kept.reserve(jobs.size());
  for (auto &job : jobs) {
    if (claimed.insert(job.dest_path).second)
      kept.push_back(std::move(job));
    else
      conflicts.push_back(std::move(job));
  }
  jobs = std::move(kept);
  return conflicts;
}

std::vector<fs::path>
JobScanner::find_extraneous(const std::set<fs::path> &expected) const {
  std::vector<fs::path> extraneous;
  std::error_code ec;
  if (!fs::is_directory(options_.dest_dir, ec))
    return extraneous;

  auto it = fs::recursive_directory_iterator(
      options_.dest_dir, fs::directory_options::skip_permission_denied);

  for (auto end = fs::end(it); it != end; ++it) {
    const auto &entry = *it;
    if (!options_.include_hidden && is_hidden(entry.path().filename())) {
      if (entry.is_directory())
        it.disable_recursion_pending();
      continue;
    }
    if (entry.is_regular_file() &&
        !expected.count(entry.path().lexically_normal()))
      extraneous.push_back(entry.path());
  }
  std::sort(extraneous.begin(), extraneous.end());
  return extraneous;
}

} // namespace transync
