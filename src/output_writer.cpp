/**
 * @file output_writer.cpp
 * @brief Output placement implementation
 */

#include "loopify/output_writer.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "loopify/logging.hpp"
#include "loopify/system.hpp"

namespace loopify {

namespace fs = std::filesystem;

std::string default_output_path(const std::string &source) {
  fs::path src(source);
  return (src.parent_path() /
          (src.stem().string() + OUTPUT_MARKER + src.extension().string()))
      .string();
}

Status resolve_output_target(const std::string &source,
                             const std::string &requested,
                             OverwritePolicy policy, OutputTarget &target) {
  fs::path dest = requested.empty() ? fs::path(default_output_path(source))
                                    : fs::path(expand_user(requested));

  fs::path parent = dest.parent_path();
  if (parent.empty())
    parent = ".";

  std::error_code ec;
  if (!fs::is_directory(parent, ec)) {
    return Status::error(
        ErrorKind::OutputDirMissing,
        fmt::format("output directory does not exist: {}", parent.string()));
  }

  fs::path src_canon = fs::canonical(source, ec);
  if (ec) {
    return Status::error(ErrorKind::InputNotFound,
                         fmt::format("cannot resolve input {}: {}", source,
                                     ec.message()));
  }

  /// Destination may not exist yet; weakly_canonical resolves what does
  fs::path dest_canon = fs::weakly_canonical(fs::absolute(dest), ec);
  if (ec) {
    return Status::error(ErrorKind::OutputDirMissing,
                         fmt::format("cannot resolve output {}: {}",
                                     dest.string(), ec.message()));
  }

  /// The entry itself stays unresolved: replacing a symlink must not
  /// touch whatever it points at
  fs::path named = dest_canon;
  fs::path leaf = dest.filename();
  if (!leaf.empty() && leaf != "." && leaf != "..") {
    named = fs::canonical(parent, ec) / leaf;
    if (ec) {
      return Status::error(ErrorKind::OutputDirMissing,
                           fmt::format("cannot resolve output {}: {}",
                                       dest.string(), ec.message()));
    }
  }

  fs::file_status entry = fs::symlink_status(named, ec);
  if (fs::is_directory(entry)) {
    return Status::error(
        ErrorKind::OverwriteRefused,
        fmt::format("output path is a directory: {}", dest.string()));
  }

  OutputTarget out;
  out.source = src_canon.string();
  out.policy = policy;
  out.same_path = (src_canon == dest_canon);
  out.destination = out.same_path ? src_canon.string() : named.string();
  out.destination_existed = fs::exists(entry);

  if (out.destination_existed && policy != OverwritePolicy::Force) {
    return Status::error(
        ErrorKind::OverwriteRefused,
        fmt::format("refusing to overwrite existing file: {}",
                    dest.string()));
  }
  if (out.same_path && policy != OverwritePolicy::Force) {
    return Status::error(ErrorKind::OverwriteRefused,
                         "refusing to overwrite input file without force");
  }

  target = std::move(out);
  return Status::success();
}

Status clear_destination(const OutputTarget &target) {
  if (!target.destination_existed || target.same_path)
    return Status::success();

  std::error_code ec;
  fs::remove(target.destination, ec);
  if (ec) {
    return Status::error(ErrorKind::CommitFailure,
                         fmt::format("cannot remove existing {}: {}",
                                     target.destination, ec.message()));
  }
  LOG_INFO("Removed existing output {}", target.destination);
  return Status::success();
}

Status commit_copy(const OutputTarget &target) {
  std::error_code ec;

  if (!target.same_path) {
    fs::copy_file(target.source, target.destination,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(target.destination, ignored);
      return Status::error(ErrorKind::CommitFailure,
                           fmt::format("copy to {} failed: {}",
                                       target.destination, ec.message()));
    }
    return Status::success();
  }

  /// Destination is the source: stage a full copy, then swap it in
  StagingFile staging;
  std::string error;
  if (!staging.create(target.destination, error)) {
    return Status::error(ErrorKind::CommitFailure, error);
  }

  fs::copy_file(target.source, staging.path(),
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return Status::error(ErrorKind::CommitFailure,
                         fmt::format("staging copy failed: {}",
                                     ec.message()));
  }

  if (!staging.commit(error)) {
    return Status::error(ErrorKind::CommitFailure, error);
  }
  return Status::success();
}

Status open_work_output(const OutputTarget &target, StagingFile &staging,
                        std::string &work_output) {
  if (!target.same_path) {
    work_output = target.destination;
    return Status::success();
  }

  std::string error;
  if (!staging.create(target.destination, error)) {
    return Status::error(ErrorKind::CommitFailure, error);
  }
  work_output = staging.path();
  return Status::success();
}

Status finalize_work_output(const OutputTarget &target, StagingFile &staging) {
  if (!target.same_path)
    return Status::success();

  std::string error;
  if (!staging.commit(error)) {
    return Status::error(ErrorKind::CommitFailure, error);
  }
  return Status::success();
}

} // namespace loopify
