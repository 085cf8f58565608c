/**
 * @file pipeline.cpp
 * @brief Loop rotation pipeline implementation
 *
 * @details Orchestrates the probe -> normalize -> split -> join -> commit
 *          workflow. Failures are returned immediately; the only recovery
 *          is the lossless -> re-encode fallback inside join_segments.
 */

#include "loopify/pipeline.hpp"

#include <cmath>
#include <filesystem>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "loopify/concatenator.hpp"
#include "loopify/config.hpp"
#include "loopify/cut_normalizer.hpp"
#include "loopify/duration_probe.hpp"
#include "loopify/logging.hpp"
#include "loopify/output_writer.hpp"
#include "loopify/scoped_path.hpp"
#include "loopify/splitter.hpp"
#include "loopify/system.hpp"

namespace loopify {

namespace fs = std::filesystem;

// **---- Constructor ----**

LoopPipeline::LoopPipeline(MediaToolkit &toolkit, LoopRequest request)
    : toolkit_(toolkit), request_(std::move(request)) {}

Status LoopPipeline::fail(const char *step, Status status) {
  failed_step_ = step;
  return status;
}

// **---- Main Processing ----**

Status LoopPipeline::run() {
  TimingCollector::clear();
  TIMER_START(total_run);
  failed_step_ = nullptr;

  const std::string input = expand_user(request_.input_path);

  std::error_code ec;
  if (!fs::is_regular_file(input, ec)) {
    return fail("input",
                Status::error(ErrorKind::InputNotFound,
                              fmt::format("input file not found: {}", input)));
  }

  if (!std::isfinite(request_.cut_seconds)) {
    return fail("normalize",
                Status::error(ErrorKind::InvalidCutSpec,
                              "cut_seconds must be a finite number"));
  }

  // **----- PHASE 1: PROBE -----**

  LOG_PHASE("Probing...");
  TIMER_START(probe);
  Status st = probe_duration(toolkit_, input, asset_);
  if (!st.ok())
    return fail("probe", st);
  TIMER_END(probe);
  LOG_INFO("Duration: {} ({:.6f}s)", format_time(asset_.duration),
           asset_.duration);

  // **----- PHASE 2: DESTINATION -----**

  st = resolve_output_target(input, request_.output_path, request_.policy,
                             target_);
  if (!st.ok())
    return fail("output", st);

  st = clear_destination(target_);
  if (!st.ok())
    return fail("output", st);

  // **----- PHASE 3: NORMALIZE -----**

  st = normalize_cut(request_.cut_seconds, asset_.duration, decision_);
  if (!st.ok())
    return fail("normalize", st);

  if (decision_.noop) {
    LOG_INFO("Cut {}s is a no-op, copying input unchanged",
             format_seconds(request_.cut_seconds));
    TIMER_START(commit);
    st = commit_copy(target_);
    if (!st.ok())
      return fail("commit", st);
    TIMER_END(commit);
  } else {
    LOG_INFO("Cut offset: {}s", format_seconds(decision_.cut));
    st = rotate();
    if (!st.ok())
      return st;
  }

  TIMER_END(total_run);

  LOG_SUCCESS("Output saved to: {}", target_.destination);
  if (Config::print_timing()) {
    TimingCollector::print_summary();
  }
  print_loop_summary();

  return Status::success();
}

// **---- Rotation ----**

Status LoopPipeline::rotate() {
  TempDirectory work_dir;
  std::string error;
  if (!work_dir.create(Config::temp_root(), "loopify-", error)) {
    return fail("split", Status::error(ErrorKind::SplitFailure, error));
  }

  /// Segments keep the source container; fall back to the destination's
  std::string suffix = asset_.format_hint;
  if (suffix.empty())
    suffix = fs::path(target_.destination).extension().string();

  // **----- PHASE 4: SPLIT -----**

  LOG_PHASE("Splitting...");
  TIMER_START(split);
  SegmentFiles segments;
  Status st = split_segments(toolkit_, asset_, decision_.cut, work_dir, suffix,
                             segments);
  if (!st.ok())
    return fail("split", st);
  TIMER_END(split);

  // **----- PHASE 5: JOIN -----**

  StagingFile staging;
  std::string work_output;
  st = open_work_output(target_, staging, work_output);
  if (!st.ok())
    return fail("commit", st);

  LOG_PHASE("Joining...");
  TIMER_START(join);
  std::string codec_ext = fs::path(target_.destination).extension().string();
  if (codec_ext.empty())
    codec_ext = asset_.format_hint;
  st = join_segments(toolkit_, segments, work_output, codec_ext, attempt_);
  if (!st.ok())
    return fail("join", st);
  TIMER_END(join);
  LOG_INFO("Joined with {}", to_string(attempt_.strategy));

  // **----- PHASE 6: COMMIT -----**

  st = finalize_work_output(target_, staging);
  if (!st.ok())
    return fail("commit", st);

  return Status::success();
}

// **---- Loop Summary ----**

void LoopPipeline::print_loop_summary() const {
  if (Config::quiet())
    return;

  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "=================== LOOP SUMMARY ===================\n");
  fmt::print(stderr, "{:<12} {}\n", "Source:", target_.source);
  fmt::print(stderr, "{:<12} {}\n", "Output:", target_.destination);
  fmt::print(stderr, "{:<12} {}\n", "Duration:", format_time(asset_.duration));
  if (decision_.noop) {
    fmt::print(stderr, "{:<12} {}\n", "Cut:", "none (copied)");
  } else {
    fmt::print(stderr, "{:<12} {} ({}s)\n", "Cut:",
               format_time(decision_.cut), format_seconds(decision_.cut));
    fmt::print(stderr, "{:<12} {}\n", "Join:", to_string(attempt_.strategy));
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stderr);
}

} // namespace loopify
