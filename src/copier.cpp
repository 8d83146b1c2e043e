/**
 * @file copier.cpp
 * @brief Copier implementations
 */

#include "transync/copier.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "transync/memory_io.hpp"
#include "transync/process.hpp"
#include "transync/system.hpp"

namespace transync {

namespace {

constexpr size_t COPY_CHUNK = 1 << 20;

/// Write all of `data`, checking the token between chunks
bool write_all(int fd, const uint8_t *data, size_t size,
               const CancellationToken &token, std::error_code &ec,
               bool &canceled) {
  size_t off = 0;
  while (off < size) {
    if (token.requested()) {
      canceled = true;
      return false;
    }
    size_t len = std::min(COPY_CHUNK, size - off);
    ssize_t n = ::write(fd, data + off, len);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      ec.assign(errno, std::generic_category());
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

} // anonymous namespace

// **---- InFlightFile ----**

bool InFlightFile::discard() {
  if (!path_)
    return false;
  std::error_code ec;
  bool removed = fs::remove(*path_, ec);
  path_.reset();
  return removed;
}

// **---- RsyncCopier ----**

RsyncCopier::RsyncCopier(std::string rsync_path, const Logger &logger)
    : rsync_path_(std::move(rsync_path)), logger_(logger) {}

std::string RsyncCopier::build_command(const fs::path &from,
                                       const fs::path &to) const {
  return fmt::format("{} --times --whole-file --ignore-times -- {} {}",
                     shell_quote(rsync_path_), shell_quote(from.string()),
                     shell_quote(to.string()));
}

/// rsync removes its own temp file when stopped, nothing to track
StageResult RsyncCopier::copy(const fs::path &from, const fs::path &to,
                              InFlightFile &, const CancellationToken &token) {
  std::string cmd = build_command(from, to);
  logger_.debug("[Copy] {}", cmd);

  ProcessResult result = run_shell_command(cmd, token);
  if (result.ok())
    return StageResult::success(nullptr, to);
  if (result.canceled)
    return StageResult::fail(nullptr, FailureKind::Canceled, "canceled");
  return StageResult::fail(nullptr, FailureKind::Transfer,
                           "rsync " + result.describe());
}

// **---- PlainCopier ----**

fs::path PlainCopier::temp_path_for(const fs::path &to) {
  return to.parent_path() /
         fmt::format(".{}.transync-{}.tmp", to.filename().string(), ::getpid());
}

StageResult PlainCopier::copy(const fs::path &from, const fs::path &to,
                              InFlightFile &in_flight,
                              const CancellationToken &token) {
  std::error_code ec;
  MappedFile source;
  if (!MemoryLoader::load_file(from.string(), source, ec))
    return StageResult::fail(
        nullptr, FailureKind::Transfer,
        fmt::format("cannot read {}: {}", from.string(), ec.message()));

  struct stat sb;
  mode_t mode = 0644;
  if (::stat(from.c_str(), &sb) == 0)
    mode = sb.st_mode & 0777;

  fs::path temp = temp_path_for(to);
  int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd == -1)
    return StageResult::fail(nullptr, FailureKind::Transfer,
                             fmt::format("cannot create {}: {}",
                                         temp.string(), std::strerror(errno)));
  in_flight.track(temp);

  bool canceled = false;
  bool written =
      write_all(fd, source.data(), source.size(), token, ec, canceled);
  if (::close(fd) == -1 && written) {
    ec.assign(errno, std::generic_category());
    written = false;
  }

  if (canceled)
    return StageResult::fail(nullptr, FailureKind::Canceled, "canceled");

  if (!written) {
    in_flight.discard();
    return StageResult::fail(
        nullptr, FailureKind::Transfer,
        fmt::format("write to {} failed: {}", temp.string(), ec.message()));
  }

  fs::rename(temp, to, ec);
  if (ec) {
    in_flight.discard();
    return StageResult::fail(nullptr, FailureKind::Transfer,
                             fmt::format("rename to {} failed: {}",
                                         to.string(), ec.message()));
  }
  in_flight.commit();
  return StageResult::success(nullptr, to);
}

// **---- Factory ----**

std::unique_ptr<Copier> make_copier(const std::string &copy_utility,
                                    const Logger &logger) {
  if (!copy_utility.empty()) {
    if (auto path = find_executable(copy_utility)) {
      logger.debug("Using fast-copy utility: {}", *path);
      return std::make_unique<RsyncCopier>(*path, logger);
    }
    logger.debug("Copy utility '{}' not found, using plain copy",
                 copy_utility);
  }
  return std::make_unique<PlainCopier>();
}

} // namespace transync
