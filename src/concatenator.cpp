/**
 * @file concatenator.cpp
 * @brief Segment reassembly implementation
 */

#include "loopify/concatenator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "loopify/config.hpp"
#include "loopify/logging.hpp"
#include "loopify/memory_io.hpp"

namespace loopify {

namespace fs = std::filesystem;

// **---- Command Builders ----**

std::string concat_list_line(const std::string &path) {
  std::string escaped;
  escaped.reserve(path.size() + 8);
  for (char c : path) {
    if (c == '\'')
      escaped += "'\\''";
    else
      escaped += c;
  }
  return fmt::format("file '{}'", escaped);
}

std::string build_concat_list(const std::vector<std::string> &paths) {
  std::string list_content;
  list_content.reserve(256 * paths.size());
  for (const auto &p : paths) {
    list_content += concat_list_line(p);
    list_content += '\n';
  }
  return list_content;
}

std::vector<std::string> codec_args_for(const std::string &extension) {
  std::string ext = extension;
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (ext == ".mp3")
    return {"-c:a", "libmp3lame", "-q:a", Config::mp3_quality()};
  if (ext == ".wav")
    return {"-c:a", "pcm_s16le"};
  return {"-c:a", "aac", "-b:a", Config::aac_bitrate()};
}

std::vector<std::string> lossless_concat_args(const std::string &list_path,
                                              const std::string &output) {
  return {"-f",
          "concat",
          "-safe",
          "0",
          "-protocol_whitelist",
          "file,pipe,fd",
          "-i",
          list_path,
          "-c",
          "copy",
          output};
}

std::vector<std::string>
reencode_concat_args(const std::string &first, const std::string &second,
                     const std::vector<std::string> &codec_args,
                     const std::string &output) {
  std::vector<std::string> args{"-i",
                                first,
                                "-i",
                                second,
                                "-filter_complex",
                                "[0:a][1:a]concat=n=2:v=0:a=1[out]",
                                "-map",
                                "[out]"};
  args.insert(args.end(), codec_args.begin(), codec_args.end());
  args.push_back(output);
  return args;
}

// **---- Join ----**

Status join_segments(MediaToolkit &toolkit, const SegmentFiles &segments,
                     const std::string &output,
                     const std::string &codec_extension,
                     TranscodeAttempt &attempt) {
  std::string error;

  /// Concat demuxer resolves relative entries against the list location,
  /// which is /proc here, so entries must be absolute
  std::vector<std::string> order{fs::absolute(segments.tail_path).string(),
                                 fs::absolute(segments.head_path).string()};

  MemoryFile list_file;
  if (list_file.create("loopify_concat_list", build_concat_list(order))) {
    if (toolkit.run_transcode(lossless_concat_args(list_file.path(), output),
                              error)) {
      attempt = TranscodeAttempt{JoinStrategy::LosslessCopy, {}};
      return Status::success();
    }
    LOG_WARN("Lossless join rejected ({}), re-encoding", error);
  } else {
    LOG_WARN("Concat list unavailable, re-encoding");
  }

  std::vector<std::string> codec_args = codec_args_for(codec_extension);
  error.clear();
  if (toolkit.run_transcode(
          reencode_concat_args(order[0], order[1], codec_args, output),
          error)) {
    attempt = TranscodeAttempt{JoinStrategy::FilterReencode,
                               std::move(codec_args)};
    return Status::success();
  }

  std::error_code ec;
  fs::remove(output, ec);
  return Status::error(ErrorKind::JoinFailure,
                       error.empty() ? "re-encode join failed" : error);
}

} // namespace loopify
