/**
 * @file memory_io.cpp
 * @brief MemoryFile implementation
 */

#include "loopify/memory_io.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#include "loopify/logging.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace loopify {

MemoryFile::~MemoryFile() { reset(); }

MemoryFile::MemoryFile(MemoryFile &&other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
  other.fd_ = -1;
  other.path_.clear();
}

MemoryFile &MemoryFile::operator=(MemoryFile &&other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
    other.path_.clear();
  }
  return *this;
}

void MemoryFile::reset() {
  if (fd_ != -1) {
    close(fd_);
    fd_ = -1;
  }
  path_.clear();
}

bool MemoryFile::create(const char *name, const std::string &content) {
  reset();

  int fd = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file: {}", std::strerror(errno));
    return false;
  }

  /// Short writes are possible in principle; loop until everything is in
  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd, content.data() + written, content.size() - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write to memory file: {}", std::strerror(errno));
      close(fd);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  fd_ = fd;
  path_ = fmt::format("/proc/{}/fd/{}", getpid(), fd);
  return true;
}

} // namespace loopify
