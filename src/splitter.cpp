/**
 * @file splitter.cpp
 * @brief Segment extraction implementation
 */

#include "loopify/splitter.hpp"

#include <fmt/core.h>

#include "loopify/logging.hpp"

namespace loopify {

std::string format_seconds(double value) {
  std::string text = fmt::format("{:.6f}", value);

  size_t end = text.find_last_not_of('0');
  if (end != std::string::npos)
    text.erase(end + 1);
  if (!text.empty() && text.back() == '.')
    text.pop_back();

  if (text.empty() || text == "-0")
    return "0";
  return text;
}

std::vector<std::string> tail_extract_args(const std::string &source,
                                           const std::string &cut_text,
                                           const std::string &output) {
  /// -ss after -i: decode-side seek, exact to the timestamp
  return {"-i", source, "-ss", cut_text, "-c", "copy", output};
}

std::vector<std::string> head_extract_args(const std::string &source,
                                           const std::string &cut_text,
                                           const std::string &output) {
  return {"-i", source, "-t", cut_text, "-c", "copy", output};
}

Status split_segments(MediaToolkit &toolkit, const AudioAsset &asset,
                      double cut, const TempDirectory &work_dir,
                      const std::string &suffix, SegmentFiles &segments) {
  const std::string cut_text = format_seconds(cut);

  SegmentFiles out;
  out.tail_range = {cut, asset.duration};
  out.head_range = {0.0, cut};
  out.tail_path = work_dir.file("tail" + suffix);
  out.head_path = work_dir.file("head" + suffix);

  std::string error;
  if (!toolkit.run_transcode(
          tail_extract_args(asset.path, cut_text, out.tail_path), error)) {
    return Status::error(
        ErrorKind::SplitFailure,
        fmt::format("extracting tail [{}s, end) failed: {}", cut_text,
                    error));
  }
  LOG_INFO("Tail segment: {:.3f}s", out.tail_range.length());

  if (!toolkit.run_transcode(
          head_extract_args(asset.path, cut_text, out.head_path), error)) {
    return Status::error(
        ErrorKind::SplitFailure,
        fmt::format("extracting head [0, {}s) failed: {}", cut_text, error));
  }
  LOG_INFO("Head segment: {:.3f}s", out.head_range.length());

  segments = std::move(out);
  return Status::success();
}

} // namespace loopify
