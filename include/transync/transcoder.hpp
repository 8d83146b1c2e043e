/**
 * @file transcoder.hpp
 * @brief Encoder capability and the FFmpeg implementation
 *
 * @details The transcode stage only sees the Transcoder interface. The
 *          production implementation runs the ffmpeg command line tool as an
 *          external process; tests substitute an in-process fake.
 */

#ifndef TRANSYNC_TRANSCODER_HPP
#define TRANSYNC_TRANSCODER_HPP

#include <string>

#include "cancellation.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace transync {

/**
 * @class Transcoder
 * @brief Converts one source file into the target format.
 *
 * @attention CONTRACT:
 *
 *   - Writes exactly one file, at `output`, and nothing else
 *
 *   - Returns failures as StageResult values and never throws for encoder
 *     errors
 *
 *   - Returns FailureKind::Canceled when stopped by the token
 *
 * @note Called concurrently from the transcode pool.
 */
class Transcoder {
public:
  virtual ~Transcoder() = default;

  virtual StageResult transcode(const JobRecord &job, const fs::path &output,
                                const CancellationToken &token) = 0;
};

/**
 * @brief Built-in encoder options for a target format.
 * @param target_format Lower-case extension ("mp3", "ogg", "m4a", ...)
 * @return Option string, or "" when the format has no default
 */
std::string default_encoder_options(const std::string &target_format);

/**
 * @class FFmpegTranscoder
 * @brief Transcoder that shells out to ffmpeg.
 *
 * @attention COMMAND:
 *
 *   ffmpeg -nostdin -y -hide_banner -loglevel error -i SRC -map_metadata 0
 *   OPTIONS [-movflags use_metadata_tags] [-metadata KEY=FINGERPRINT] OUT
 *
 *   - OPTIONS are the job's encoder options appended verbatim, or the
 *     per-format default
 *
 *   - the fingerprint tag is only added when the job carries one
 *
 *   - the output format is inferred by ffmpeg from OUT's extension
 */
class FFmpegTranscoder : public Transcoder {
public:
  FFmpegTranscoder(std::string encoder_path, const Logger &logger);

  /**
   * @brief Build the shell command line for one job.
   */
  std::string build_command(const JobRecord &job,
                            const fs::path &output) const;

  StageResult transcode(const JobRecord &job, const fs::path &output,
                        const CancellationToken &token) override;

private:
  std::string encoder_path_;
  const Logger &logger_;
};

} // namespace transync

#endif // TRANSYNC_TRANSCODER_HPP
