/**
 * @file scoped_path.hpp
 * @brief Scoped temporary directories and staging files
 *
 * @details Provides:
 *          - TempDirectory: per-run working directory removed with all its
 *            contents on destruction
 *
 *          - StagingFile: temporary file next to a destination, renamed over
 *            it on commit and removed on destruction otherwise
 *
 * @note Both release their path on every exit path, including early returns
 *       on error. Destructors never throw; removal failures are logged.
 */

#ifndef LOOPIFY_SCOPED_PATH_HPP
#define LOOPIFY_SCOPED_PATH_HPP

#include <string>

namespace loopify {

/**
 * @class TempDirectory
 * @brief RAII wrapper for a mkdtemp directory.
 */
class TempDirectory {
public:
  TempDirectory() = default;
  ~TempDirectory();

  TempDirectory(const TempDirectory &) = delete;
  TempDirectory &operator=(const TempDirectory &) = delete;

  /**
   * @brief Create a fresh directory under @p parent.
   * @param parent Existing directory (e.g. $TMPDIR)
   * @param prefix Name prefix, six random characters are appended
   * @param error Receives the reason on failure
   * @return true on success
   */
  bool create(const std::string &parent, const std::string &prefix,
              std::string &error);

  const std::string &path() const { return path_; }

  /// Path of @p name inside the directory
  std::string file(const std::string &name) const;

private:
  std::string path_;
};

/**
 * @class StagingFile
 * @brief Temporary file in a destination's directory for atomic replacement.
 *
 * @attention The staging file lives in the same directory as the
 *            destination so that commit() is a single same-filesystem
 *            rename(2): readers see either the old file or the new one.
 */
class StagingFile {
public:
  StagingFile() = default;
  ~StagingFile();

  StagingFile(const StagingFile &) = delete;
  StagingFile &operator=(const StagingFile &) = delete;

  /**
   * @brief Reserve a uniquely named empty file beside @p destination.
   * @note The file keeps the destination's extension so that FFmpeg picks
   *       the same muxer for it.
   */
  bool create(const std::string &destination, std::string &error);

  const std::string &path() const { return path_; }

  /**
   * @brief Rename the staged file over the destination.
   * @return true on success; on failure the staging file is removed and the
   *         destination is left as it was
   */
  bool commit(std::string &error);

private:
  void discard();

  std::string path_;
  std::string destination_;
};

} // namespace loopify

#endif // LOOPIFY_SCOPED_PATH_HPP
