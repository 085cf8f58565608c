/**
 * @file main.cpp
 * @brief Entry point for the loopify command-line tool
 *
 * @details Parses arguments, runs one LoopPipeline with the FFmpeg-backed
 *          toolkit and prints the resolved output path on stdout.
 *
 * @note Exit status: 0 on success, 1 if the pipeline failed, 2 on a usage
 *       error. Logs and errors go to stderr.
 */

#include <cstdio>
#include <string>

#include <fmt/core.h>

#include "loopify/cli.hpp"
#include "loopify/ffmpeg_executor.hpp"
#include "loopify/logging.hpp"
#include "loopify/pipeline.hpp"

using namespace loopify;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  LoopRequest request;
  std::string error;

  switch (parse_command_line(argc, argv, request, error)) {
  case CliAction::Help:
    fmt::print("{}", usage_text(argv[0]));
    return 0;
  case CliAction::Error:
    LOG_ERROR("{}", error);
    fmt::print(stderr, "{}", usage_text(argv[0]));
    return 2;
  case CliAction::Run:
    break;
  }

  FFmpegToolkit toolkit;
  LoopPipeline pipeline(toolkit, request);
  Status status = pipeline.run();
  if (!status.ok()) {
    const char *step = pipeline.failed_step();
    LOG_ERROR("{} failed ({}): {}", step ? step : "run",
              to_string(status.kind), status.message);
    return 1;
  }

  fmt::print("{}\n", pipeline.output_path());
  std::fflush(stdout);
  return 0;
}
