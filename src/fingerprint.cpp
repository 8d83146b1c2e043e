/**
 * @file fingerprint.cpp
 * @brief Fingerprint hashing and libavformat tag reading
 */

#include "transync/fingerprint.hpp"

#include <algorithm>
#include <memory>
#include <new>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
#include <libavutil/sha.h>
}

#include <fmt/core.h>

#include "transync/memory_io.hpp"
#include "transync/types.hpp"

namespace transync {

namespace {

/// av_sha_update takes the length as an int on older libavutil
constexpr size_t HASH_CHUNK = 1 << 20;

struct ShaDeleter {
  void operator()(AVSHA *sha) const { av_free(sha); }
};

std::string to_hex(const uint8_t *digest, size_t n) {
  std::string hex;
  hex.reserve(n * 2);
  for (size_t i = 0; i < n; ++i)
    hex += fmt::format("{:02x}", digest[i]);
  return hex;
}

} // anonymous namespace

// **---- Hashing ----**

std::string fingerprint_buffer(const uint8_t *data, size_t size) {
  std::unique_ptr<AVSHA, ShaDeleter> sha(av_sha_alloc());
  if (!sha || av_sha_init(sha.get(), 256) < 0)
    throw std::bad_alloc();

  for (size_t off = 0; off < size; off += HASH_CHUNK) {
    size_t len = std::min(HASH_CHUNK, size - off);
    av_sha_update(sha.get(), data + off, static_cast<unsigned int>(len));
  }

  uint8_t digest[32];
  av_sha_final(sha.get(), digest);
  return to_hex(digest, std::min(FINGERPRINT_BYTES, sizeof(digest)));
}

std::optional<std::string> compute_fingerprint(const fs::path &path,
                                               std::error_code &ec) {
  MappedFile file;
  if (!MemoryLoader::load_file(path.string(), file, ec))
    return std::nullopt;
  return fingerprint_buffer(file.data(), file.size());
}

// **---- AvTagReader ----**

AvTagReader::AvTagReader() {
  /// Probing arbitrary destination files is noisy; failures are expected
  av_log_set_level(AV_LOG_QUIET);
}

std::optional<std::string>
AvTagReader::read_fingerprint(const fs::path &path) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return std::nullopt;

  AVFormatContext *ctx = nullptr;
  if (avformat_open_input(&ctx, path.c_str(), nullptr, nullptr) < 0)
    return std::nullopt;

  std::optional<std::string> value;
  const AVDictionaryEntry *entry =
      av_dict_get(ctx->metadata, FINGERPRINT_TAG, nullptr, 0);
  for (unsigned i = 0; !entry && i < ctx->nb_streams; ++i)
    entry = av_dict_get(ctx->streams[i]->metadata, FINGERPRINT_TAG, nullptr, 0);

  if (entry && entry->value && *entry->value)
    value = std::string(entry->value);

  avformat_close_input(&ctx);
  return value;
}

} // namespace transync
