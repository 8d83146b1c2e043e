/**
 * @file memory_io.cpp
 * @brief Memory-mapped file access implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile: RAII wrapper for mmap
 *
 *          - MemoryLoader::load_file - Map file into memory
 */

#include "transync/memory_io.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace transync {

// **---- MappedFile Implementation ----**

MappedFile::~MappedFile() { reset(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    reset();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::reset() {
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ != -1) {
    close(fd_);
  }
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file,
                             std::error_code &ec) {
  ec.clear();

  /// Open file for reading
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    ec.assign(errno, std::generic_category());
    return false;
  }

  /// Get file size
  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    ec.assign(errno, std::generic_category());
    close(fd);
    return false;
  }

  if (!S_ISREG(sb.st_mode)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    close(fd);
    return false;
  }

  file.reset();

  /// Empty files cannot be mapped; keep the descriptor as the handle
  if (sb.st_size == 0) {
    file.fd_ = fd;
    return true;
  }

  /// Map file into memory (read-only, private)
  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    ec.assign(errno, std::generic_category());
    close(fd);
    return false;
  }

  /// Both consumers read front to back exactly once
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  /// Transfer ownership to MappedFile
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.fd_ = fd;
  return true;
}

} // namespace transync
