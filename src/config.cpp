/**
 * @file config.cpp
 * @brief Option normalisation and validation
 */

#include "transync/config.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/core.h>

namespace transync {

namespace {

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos)
    return {};
  size_t end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

/// True if `inner` equals `outer` or lies below it (both lexically normal)
bool is_within(const fs::path &inner, const fs::path &outer) {
  auto rel = inner.lexically_relative(outer);
  if (rel.empty())
    return false;
  auto first = *rel.begin();
  return first != "..";
}

/// "/a/b/" -> "/a/b" so parent_path() walks stop at the root itself
fs::path strip_trailing_separator(fs::path p) {
  p = p.lexically_normal();
  if (p.filename().empty() && p != p.root_path())
    p = p.parent_path();
  return p;
}

} // anonymous namespace

std::string normalize_format(std::string format) {
  format = trim(format);
  if (!format.empty() && format.front() == '.')
    format.erase(0, 1);
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return format;
}

std::set<std::string> parse_format_list(const std::string &list) {
  std::set<std::string> formats;
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t end = list.find(',', pos);
    if (end == std::string::npos)
      end = list.size();
    std::string format = normalize_format(list.substr(pos, end - pos));
    if (!format.empty())
      formats.insert(format);
    pos = end + 1;
  }
  if (formats.empty())
    throw ConfigError(fmt::format("No formats in list '{}'", list));
  return formats;
}

void normalize_options(SyncOptions &options) {
  /// Formats
  std::set<std::string> formats;
  for (const auto &f : options.transcode_formats) {
    auto normalized = normalize_format(f);
    if (!normalized.empty())
      formats.insert(normalized);
  }
  options.transcode_formats = std::move(formats);
  options.target_format = normalize_format(options.target_format);

  if (options.target_format.empty())
    throw ConfigError("Target format must not be empty");

  if (options.transcode_formats.count(options.target_format)) {
    throw ConfigError(
        fmt::format("Target format '{}' is also a transcode format",
                    options.target_format));
  }

  if (options.jobs < -1)
    throw ConfigError(fmt::format("Invalid job count: {}", options.jobs));
  if (options.stale_check_threads < 1)
    options.stale_check_threads = 1;

  /// Paths
  if (options.source_dir.empty() || options.dest_dir.empty())
    throw ConfigError("Source and destination directories are required");

  std::error_code ec;
  fs::path source = fs::absolute(options.source_dir, ec);
  if (ec)
    throw ConfigError(fmt::format("Cannot resolve source '{}': {}",
                                  options.source_dir.string(), ec.message()));
  if (!fs::is_directory(source, ec))
    throw ConfigError(fmt::format("Source '{}' is not a readable directory",
                                  source.string()));
  source = fs::weakly_canonical(source, ec);
  if (ec)
    throw ConfigError(fmt::format("Cannot resolve source '{}': {}",
                                  options.source_dir.string(), ec.message()));

  fs::path dest = fs::absolute(options.dest_dir, ec);
  if (!ec)
    dest = fs::weakly_canonical(dest, ec);
  if (ec)
    throw ConfigError(fmt::format("Cannot resolve destination '{}': {}",
                                  options.dest_dir.string(), ec.message()));
  if (fs::exists(dest, ec) && !fs::is_directory(dest, ec))
    throw ConfigError(
        fmt::format("Destination '{}' is not a directory", dest.string()));

  source = strip_trailing_separator(source);
  dest = strip_trailing_separator(dest);

  if (is_within(dest, source))
    throw ConfigError(fmt::format(
        "Destination '{}' lies inside source '{}'", dest.string(),
        source.string()));

  /// Extraneous-file deletion walks the destination; it must never see sources
  if (is_within(source, dest))
    throw ConfigError(fmt::format(
        "Source '{}' lies inside destination '{}'", source.string(),
        dest.string()));

  options.source_dir = source;
  options.dest_dir = dest;
}

} // namespace transync
