/**
 * @file duration_probe.cpp
 * @brief Duration discovery implementation
 */

#include "loopify/duration_probe.hpp"

#include <cmath>
#include <filesystem>

#include <fmt/core.h>

#include "loopify/logging.hpp"

namespace loopify {

Status interpret_probe_report(const ProbeReport &report, double &duration) {
  if (report.audio_streams <= 0) {
    return Status::error(ErrorKind::NoAudioStream,
                         "input file does not contain an audio stream");
  }
  if (!report.has_duration) {
    return Status::error(ErrorKind::InvalidDuration,
                         "unable to determine input duration");
  }

  double value = report.duration;
  if (std::isnan(value)) {
    LOG_WARN("Probe reported a NaN duration, treating input as empty");
    duration = 0.0;
    return Status::success();
  }
  if (std::isinf(value)) {
    return Status::error(ErrorKind::InvalidDuration,
                         "invalid duration value reported by probe");
  }
  if (value < 0) {
    LOG_WARN("Probe reported a negative duration ({:.6f}s), treating input "
             "as empty",
             value);
    value = 0.0;
  }

  duration = value;
  return Status::success();
}

Status probe_duration(MediaToolkit &toolkit, const std::string &path,
                      AudioAsset &asset) {
  ProbeReport report;
  std::string error;
  if (!toolkit.probe(path, report, error)) {
    return Status::error(ErrorKind::ProbeFailure,
                         error.empty() ? "unable to probe input" : error);
  }

  double duration = 0.0;
  Status st = interpret_probe_report(report, duration);
  if (!st.ok())
    return st;

  asset.path = path;
  asset.duration = duration;
  asset.format_hint = std::filesystem::path(path).extension().string();
  return st;
}

} // namespace loopify
