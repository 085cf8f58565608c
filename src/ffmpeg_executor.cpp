/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpegToolkit implementation
 */

#include "loopify/ffmpeg_executor.hpp"

#include <memory>
#include <utility>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

#include "loopify/config.hpp"
#include "loopify/logging.hpp"
#include "loopify/system.hpp"

namespace loopify {

namespace {

/// avformat_close_input also frees the context
struct FormatInputCloser {
  void operator()(AVFormatContext *ctx) const {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

std::string av_error_text(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0) {
    return fmt::format("libav error {}", errnum);
  }
  return buf;
}

} // anonymous namespace

FFmpegToolkit::FFmpegToolkit() : FFmpegToolkit(Config::ffmpeg_bin()) {}

FFmpegToolkit::FFmpegToolkit(std::string ffmpeg_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)) {
  /// libav prints demuxer chatter at INFO; errors are reported by us
  av_log_set_level(AV_LOG_ERROR);
}

// **---- Probe ----**

bool FFmpegToolkit::probe(const std::string &path, ProbeReport &report,
                          std::string &error) {
  AVFormatContext *raw_ctx = nullptr;
  int ret = avformat_open_input(&raw_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    /// On failure avformat_open_input frees the context itself
    error = fmt::format("cannot open {}: {}", path, av_error_text(ret));
    return false;
  }
  std::unique_ptr<AVFormatContext, FormatInputCloser> fmt_ctx(raw_ctx);

  /// Reads a few packets so that stream parameters and duration settle
  ret = avformat_find_stream_info(fmt_ctx.get(), nullptr);
  if (ret < 0) {
    error = fmt::format("cannot read stream info of {}: {}", path,
                        av_error_text(ret));
    return false;
  }

  report = ProbeReport{};
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (fmt_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
      ++report.audio_streams;
    }
  }

  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    report.has_duration = true;
    report.duration =
        fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);
  }
  return true;
}

// **---- Transcode ----**

bool FFmpegToolkit::run_transcode(const std::vector<std::string> &args,
                                  std::string &error) {
  std::vector<std::string> argv{ffmpeg_bin_, "-hide_banner",
                                "-loglevel", "error", "-nostdin", "-y"};
  argv.insert(argv.end(), args.begin(), args.end());

  std::string output;
  int status = run_command(argv, output);
  if (status == 0)
    return true;

  error = trim(output);
  if (error.empty()) {
    error = (status < 0)
                ? fmt::format("could not start {}", ffmpeg_bin_)
                : fmt::format("{} exited with status {}",
                              ffmpeg_bin_, status);
  }
  return false;
}

} // namespace loopify
