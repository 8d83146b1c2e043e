/**
 * @file fingerprint.hpp
 * @brief Source content fingerprints and embedded fingerprint tags
 *
 * @details Provides:
 *
 *          - compute_fingerprint: SHA-256 of a whole file, hex encoded
 *
 *          - TagReader: capability to read the fingerprint tag stored inside
 *            a destination media file
 *
 *          - AvTagReader: TagReader backed by libavformat metadata
 *
 * @note The tag itself is written by the encoder at transcode time (see
 *       FFmpegTranscoder), so there is no writer here.
 */

#ifndef TRANSYNC_FINGERPRINT_HPP
#define TRANSYNC_FINGERPRINT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace transync {

namespace fs = std::filesystem;

/**
 * @brief Hash a memory buffer.
 * @return First FINGERPRINT_BYTES of the SHA-256 digest, lower-case hex
 */
std::string fingerprint_buffer(const uint8_t *data, size_t size);

/**
 * @brief Hash a file's full content.
 * @param path File to hash
 * @param ec Set on I/O failure
 * @return Hex fingerprint, or nullopt on failure
 */
std::optional<std::string> compute_fingerprint(const fs::path &path,
                                               std::error_code &ec);

/**
 * @class TagReader
 * @brief Reads the embedded fingerprint tag of a destination file.
 */
class TagReader {
public:
  virtual ~TagReader() = default;

  /**
   * @brief Read the fingerprint tag.
   * @return Tag value, or nullopt if the file is missing, unreadable or
   *         carries no tag
   */
  virtual std::optional<std::string>
  read_fingerprint(const fs::path &path) const = 0;
};

/**
 * @class AvTagReader
 * @brief TagReader using libavformat's container metadata.
 *
 * @note Looks at the container-level dictionary first, then at each stream
 *       (Ogg/Opus keep Vorbis comments per stream). Safe to call from
 *       several threads at once.
 */
class AvTagReader : public TagReader {
public:
  AvTagReader();

  std::optional<std::string>
  read_fingerprint(const fs::path &path) const override;
};

} // namespace transync

#endif // TRANSYNC_FINGERPRINT_HPP
