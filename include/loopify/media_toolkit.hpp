/**
 * @file media_toolkit.hpp
 * @brief Capability interface for the external media engine
 *
 * @details Everything loopify needs from FFmpeg goes through MediaToolkit:
 *
 *          - probe: stream layout and container duration of a file
 *
 *          - run_transcode: one blocking transcoder invocation
 *
 *          The production implementation is FFmpegToolkit
 *          (ffmpeg_executor.hpp). Tests substitute a deterministic fake.
 */

#ifndef LOOPIFY_MEDIA_TOOLKIT_HPP
#define LOOPIFY_MEDIA_TOOLKIT_HPP

#include <string>
#include <vector>

namespace loopify {

/**
 * @struct ProbeReport
 * @brief Raw inspection result, before any interpretation.
 */
struct ProbeReport {
  int audio_streams = 0;     //< Streams whose codec type is audio
  bool has_duration = false; //< Container reported a duration at all
  double duration = 0.0;     //< Seconds; may be NaN or negative as reported
};

/**
 * @class MediaToolkit
 * @brief Blocking access to duration probing and transcoding.
 */
class MediaToolkit {
public:
  virtual ~MediaToolkit() = default;

  /**
   * @brief Inspect a media file.
   * @param path File to inspect
   * @param report Filled on success
   * @param error Collaborator error text on failure
   * @return true if the inspection ran and succeeded
   */
  virtual bool probe(const std::string &path, ProbeReport &report,
                     std::string &error) = 0;

  /**
   * @brief Run the transcoder once.
   * @param args Transcoder arguments, without the program name or the
   *             common logging / overwrite flags
   * @param error Collaborator error text on failure
   * @return true if the transcoder exited successfully
   */
  virtual bool run_transcode(const std::vector<std::string> &args,
                             std::string &error) = 0;
};

} // namespace loopify

#endif // LOOPIFY_MEDIA_TOOLKIT_HPP
