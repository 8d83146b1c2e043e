/**
 * @file transcoder.cpp
 * @brief FFmpeg execution for transcode jobs
 */

#include "transync/transcoder.hpp"

#include <map>
#include <system_error>

#include <fmt/core.h>

#include "transync/process.hpp"
#include "transync/system.hpp"

namespace transync {

namespace {

/// Roughly 190 kbps-equivalent defaults per target container
const std::map<std::string, std::string> &default_option_table() {
  static const std::map<std::string, std::string> table = {
      {"mp3", "-codec:a libmp3lame -qscale:a 2"},
      {"ogg", "-vn -codec:a libvorbis -qscale:a 6"},
      {"aac", "-vn -codec:a aac -b:a 192k"},
      {"m4a", "-codec:a aac -b:a 192k"},
      {"mp4", "-codec:a aac -b:a 192k"},
      {"opus", "-vn -codec:a libopus -b:a 160k"},
  };
  return table;
}

/// MP4 family only stores unknown keys when asked to
bool needs_metadata_tags_flag(const std::string &ext) {
  return ext == "m4a" || ext == "mp4";
}

/// ADTS writes tags only as an ID3v2 header
bool needs_id3v2_flag(const std::string &ext) { return ext == "aac"; }

} // anonymous namespace

std::string default_encoder_options(const std::string &target_format) {
  const auto &table = default_option_table();
  auto it = table.find(target_format);
  return it == table.end() ? std::string() : it->second;
}

// **---- FFmpegTranscoder ----**

FFmpegTranscoder::FFmpegTranscoder(std::string encoder_path,
                                   const Logger &logger)
    : encoder_path_(std::move(encoder_path)), logger_(logger) {}

std::string FFmpegTranscoder::build_command(const JobRecord &job,
                                            const fs::path &output) const {
  std::string ext = output.extension().string();
  if (!ext.empty())
    ext.erase(0, 1);

  std::string options = job.encoder_options ? *job.encoder_options
                                            : default_encoder_options(ext);

  std::string cmd = fmt::format(
      "{} -nostdin -y -hide_banner -loglevel error -i {} -map_metadata 0",
      shell_quote(encoder_path_), shell_quote(job.source_path.string()));

  if (!options.empty())
    cmd += " " + options;

  if (job.checksum_mode && job.source_fingerprint) {
    if (needs_metadata_tags_flag(ext))
      cmd += " -movflags use_metadata_tags";
    else if (needs_id3v2_flag(ext))
      cmd += " -write_id3v2 1";
    cmd += " -metadata " +
           shell_quote(fmt::format("{}={}", FINGERPRINT_TAG,
                                   *job.source_fingerprint));
  }

  cmd += " " + shell_quote(output.string());
  return cmd;
}

StageResult FFmpegTranscoder::transcode(const JobRecord &job,
                                        const fs::path &output,
                                        const CancellationToken &token) {
  std::string cmd = build_command(job, output);
  logger_.debug("[Encoder] {}", cmd);

  ProcessResult result = run_shell_command(cmd, token);

  if (result.ok())
    return StageResult::success(nullptr, output);

  /// Never leave a half-written file behind in staging
  std::error_code ec;
  fs::remove(output, ec);

  if (result.canceled)
    return StageResult::fail(nullptr, FailureKind::Canceled, "canceled");
  return StageResult::fail(nullptr, FailureKind::Encoder, result.describe());
}

} // namespace transync
