/**
 * @file scoped_path.cpp
 * @brief TempDirectory and StagingFile implementation
 */

#include "loopify/scoped_path.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

#include "loopify/logging.hpp"

namespace loopify {

namespace fs = std::filesystem;

// **---- TempDirectory ----**

TempDirectory::~TempDirectory() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Could not remove working directory {}: {}", path_,
             ec.message());
  }
}

bool TempDirectory::create(const std::string &parent,
                           const std::string &prefix, std::string &error) {
  std::string pattern = (fs::path(parent) / (prefix + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (!mkdtemp(buf.data())) {
    error = fmt::format("cannot create working directory in {}: {}", parent,
                        std::strerror(errno));
    return false;
  }
  path_ = buf.data();
  return true;
}

std::string TempDirectory::file(const std::string &name) const {
  return (fs::path(path_) / name).string();
}

// **---- StagingFile ----**

StagingFile::~StagingFile() { discard(); }

void StagingFile::discard() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("Could not remove staging file {}: {}", path_, ec.message());
  }
  path_.clear();
}

bool StagingFile::create(const std::string &destination, std::string &error) {
  discard();

  fs::path dest(destination);
  std::string suffix = dest.extension().string();
  fs::path pattern = dest.parent_path() /
                     ("." + dest.stem().string() + ".loopify-XXXXXX" + suffix);

  std::string pattern_str = pattern.string();
  std::vector<char> buf(pattern_str.begin(), pattern_str.end());
  buf.push_back('\0');

  int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    error = fmt::format("cannot create staging file beside {}: {}",
                        destination, std::strerror(errno));
    return false;
  }
  close(fd);

  path_ = buf.data();
  destination_ = destination;
  return true;
}

bool StagingFile::commit(std::string &error) {
  if (path_.empty()) {
    error = "nothing staged";
    return false;
  }

  /// mkstemps creates 0600; keep the mode of the file being replaced
  std::error_code ec;
  auto dest_status = fs::status(destination_, ec);
  if (!ec && fs::exists(dest_status)) {
    fs::permissions(path_, dest_status.permissions(), ec);
    if (ec) {
      LOG_WARN("Could not copy permissions onto {}: {}", path_, ec.message());
    }
  }

  if (std::rename(path_.c_str(), destination_.c_str()) != 0) {
    error = fmt::format("cannot replace {}: {}", destination_,
                        std::strerror(errno));
    discard();
    return false;
  }

  /// Renamed into place; nothing left to clean up
  path_.clear();
  return true;
}

} // namespace loopify
