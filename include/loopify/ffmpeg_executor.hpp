/**
 * @file ffmpeg_executor.hpp
 * @brief Production MediaToolkit backed by libavformat and the ffmpeg CLI
 *
 * @details Probing runs in-process through libavformat. Transcoding spawns
 *          the ffmpeg executable (Config::ffmpeg_bin unless one is given)
 *          with:
 *
 *          - -hide_banner -loglevel error -nostdin -y prepended
 *
 *          - stdout and stderr captured and returned as the error text
 */

#ifndef LOOPIFY_FFMPEG_EXECUTOR_HPP
#define LOOPIFY_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "media_toolkit.hpp"

namespace loopify {

class FFmpegToolkit : public MediaToolkit {
public:
  FFmpegToolkit();
  explicit FFmpegToolkit(std::string ffmpeg_bin);

  bool probe(const std::string &path, ProbeReport &report,
             std::string &error) override;

  bool run_transcode(const std::vector<std::string> &args,
                     std::string &error) override;

  const std::string &ffmpeg_bin() const { return ffmpeg_bin_; }

private:
  std::string ffmpeg_bin_;
};

} // namespace loopify

#endif // LOOPIFY_FFMPEG_EXECUTOR_HPP
