/**
 * @file memory_io.hpp
 * @brief Anonymous in-memory files handed to FFmpeg by path
 *
 * @details Provides:
 *          - MemoryFile: RAII wrapper around a memfd holding small text
 *            payloads (the concat demuxer's file list)
 *
 * @note The file is reachable by other processes through /proc/<pid>/fd/<fd>
 *       for as long as this process keeps it open. Linux only
 *       (kernel >= 3.17).
 */

#ifndef LOOPIFY_MEMORY_IO_HPP
#define LOOPIFY_MEMORY_IO_HPP

#include <string>

namespace loopify {

/**
 * @class MemoryFile
 * @brief RAII wrapper for a memfd.
 * @note Closed on destruction. Supports move semantics but not copy.
 */
class MemoryFile {
public:
  MemoryFile() = default;
  ~MemoryFile();

  /// Disable copy
  MemoryFile(const MemoryFile &) = delete;
  MemoryFile &operator=(const MemoryFile &) = delete;

  /// Enable move
  MemoryFile(MemoryFile &&other) noexcept;
  MemoryFile &operator=(MemoryFile &&other) noexcept;

  /**
   * @brief Create the memfd and write @p content into it.
   * @param name Debug name shown in /proc/<pid>/fd
   * @param content Bytes to store
   * @return true on success, false on failure (logged)
   */
  bool create(const char *name, const std::string &content);

  /// Path other processes can open, empty if not created
  const std::string &path() const { return path_; }
  bool is_valid() const { return fd_ != -1; }

private:
  void reset();

  int fd_ = -1;
  std::string path_;
};

} // namespace loopify

#endif // LOOPIFY_MEMORY_IO_HPP
