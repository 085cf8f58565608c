/**
 * @file pipeline.hpp
 * @brief Loop rotation pipeline orchestration
 *
 * @details The LoopPipeline class drives one run end to end:
 *
 *          1. Check the input exists and the cut is finite
 *
 *          2. Probe the source duration
 *
 *          3. Resolve the destination and apply the overwrite policy
 *
 *          4. Normalize the cut offset
 *
 *          5a. No-op: copy the source to the destination
 *
 *          5b. Otherwise split into tail/head, join tail+head, commit
 *
 * @note Every step is a blocking call. The working directory, segment files
 *       and staging file are scoped to run() and removed on every exit path.
 */

#ifndef LOOPIFY_PIPELINE_HPP
#define LOOPIFY_PIPELINE_HPP

#include <string>

#include "media_toolkit.hpp"
#include "types.hpp"

namespace loopify {

/**
 * @struct LoopRequest
 * @brief User input for one run.
 */
struct LoopRequest {
  std::string input_path;
  double cut_seconds = 0.0; //< Negative counts from the end
  std::string output_path;  //< Empty = <stem>.loopified<ext> beside input
  OverwritePolicy policy = OverwritePolicy::Refuse;
};

/**
 * @class LoopPipeline
 * @brief Rotates an audio file around a cut point so it loops seamlessly.
 */
class LoopPipeline {
  MediaToolkit &toolkit_;
  LoopRequest request_;

  AudioAsset asset_;
  CutDecision decision_;
  OutputTarget target_;
  TranscodeAttempt attempt_;
  const char *failed_step_ = nullptr;

  /**
   * @brief Split, join and commit for a non-trivial cut.
   */
  Status rotate();

  /// Remember which step failed and pass the status through
  Status fail(const char *step, Status status);

  void print_loop_summary() const;

public:
  /**
   * @brief Construct a pipeline.
   * @param toolkit Media engine (not owned, must outlive the pipeline)
   * @param request What to rotate and where to write it
   */
  LoopPipeline(MediaToolkit &toolkit, LoopRequest request);

  /**
   * @brief Run the complete pipeline.
   * @return Ok, or the first error; no partial output is left behind
   */
  Status run();

  /// Canonical destination path, valid after a successful run()
  const std::string &output_path() const { return target_.destination; }

  /// Name of the step that failed ("probe", "split", ...), or nullptr
  const char *failed_step() const { return failed_step_; }

  const AudioAsset &asset() const { return asset_; }
  const CutDecision &decision() const { return decision_; }
  const TranscodeAttempt &attempt() const { return attempt_; }
};

} // namespace loopify

#endif // LOOPIFY_PIPELINE_HPP
