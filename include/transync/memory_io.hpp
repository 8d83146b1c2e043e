/**
 * @file memory_io.hpp
 * @brief Memory-mapped file access
 *
 * @details Provides:
 *          - MappedFile: RAII wrapper for a read-only mapping
 *
 *          - MemoryLoader: maps whole files for hashing and copying
 */

#ifndef TRANSYNC_MEMORY_IO_HPP
#define TRANSYNC_MEMORY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace transync {

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy. An empty file maps to a
 *       valid object with size() == 0 and data() == nullptr.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  /// Disable copy
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  /// Enable move
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_open() const { return fd_ != -1; }

private:
  friend class MemoryLoader;
  void reset();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryLoader
 * @brief Maps whole files into memory.
 *
 * @attention ROBUSTNESS:
 *
 * - Uses mmap for efficient file access (zero-copy)
 *
 * - Handles empty files without mapping
 *
 * - Reports failures through std::error_code, never throws
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file into memory using mmap.
   * @param path Path to the file
   * @param file Output MappedFile object (takes ownership of the mapping)
   * @param ec Set to the OS error on failure
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, MappedFile &file,
                        std::error_code &ec);
};

} // namespace transync

#endif // TRANSYNC_MEMORY_IO_HPP
