/**
 * @file types.hpp
 * @brief Core data types and constants for Loopify
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Tolerance and naming constants
 *
 *          - Status / ErrorKind for error propagation
 *
 *          - AudioAsset, CutDecision, TimeSegment, TranscodeAttempt,
 *            OutputTarget
 */

#ifndef LOOPIFY_TYPES_HPP
#define LOOPIFY_TYPES_HPP

#include <string>
#include <utility>
#include <vector>

namespace loopify {

// **----- CONSTANTS -----**

/**
 * @brief Absolute tolerance (seconds) under which a normalized cut counts
 *        as zero.
 */
constexpr double CUT_TOLERANCE_SEC = 1e-6;

/// Marker inserted between stem and extension for the default output name
constexpr const char *OUTPUT_MARKER = ".loopified";

// **----- ERROR REPORTING -----**

/**
 * @brief Every fatal condition a run can end with.
 * @note There is no partial-success mode: any kind other than Ok aborts.
 */
enum class ErrorKind {
  Ok,
  InputNotFound,
  ProbeFailure,
  NoAudioStream,
  InvalidDuration,
  InvalidCutSpec,
  OutputDirMissing,
  OverwriteRefused,
  SplitFailure,
  JoinFailure,
  CommitFailure,
};

/// Stable name used in log lines and error messages
const char *to_string(ErrorKind kind);

/**
 * @struct Status
 * @brief Result of a pipeline step: Ok, or an error kind plus message.
 */
struct Status {
  ErrorKind kind = ErrorKind::Ok;
  std::string message;

  bool ok() const { return kind == ErrorKind::Ok; }

  static Status success() { return {}; }
  static Status error(ErrorKind k, std::string msg) {
    return {k, std::move(msg)};
  }
};

// **----- DATA STRUCTURES -----**

/**
 * @struct AudioAsset
 * @brief Source file plus its probed duration.
 * @note format_hint is the extension including the dot (".mp3"), possibly
 *       empty.
 */
struct AudioAsset {
  std::string path;        //< Source path as given (after ~ expansion)
  double duration = 0.0;   //< Seconds, >= 0
  std::string format_hint; //< File extension, used for segment naming
};

/**
 * @struct CutDecision
 * @brief Outcome of cut normalization.
 */
struct CutDecision {
  bool noop = true;  //< Output equals input, no rotation
  double cut = 0.0;  //< Normalized offset, valid when !noop
};

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double length() const { return end - start; }
};

/**
 * @struct SegmentFiles
 * @brief The two materialized pieces of a rotation.
 */
struct SegmentFiles {
  TimeSegment tail_range; //< [cut, duration)
  TimeSegment head_range; //< [0, cut)
  std::string tail_path;
  std::string head_path;
};

enum class JoinStrategy { LosslessCopy, FilterReencode };

const char *to_string(JoinStrategy strategy);

/**
 * @struct TranscodeAttempt
 * @brief Records which join strategy produced the output.
 * @note codec_args is empty for LosslessCopy.
 */
struct TranscodeAttempt {
  JoinStrategy strategy = JoinStrategy::LosslessCopy;
  std::vector<std::string> codec_args;
};

enum class OverwritePolicy { Refuse, Force };

/**
 * @struct OutputTarget
 * @brief Resolved destination for one run.
 */
struct OutputTarget {
  std::string source;      //< Canonical source path
  /// Entry written to: canonical parent plus the name as given, so a
  /// symlink destination is replaced rather than followed. Canonical source
  /// path when same_path.
  std::string destination;
  OverwritePolicy policy = OverwritePolicy::Refuse;
  bool same_path = false;          //< destination aliases source
  bool destination_existed = false;
};

} // namespace loopify

#endif // LOOPIFY_TYPES_HPP
