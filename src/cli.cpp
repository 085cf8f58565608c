/**
 * @file cli.cpp
 * @brief Command-line parsing implementation
 */

#include "loopify/cli.hpp"

#include <cstdlib>
#include <vector>

#include <fmt/core.h>

namespace loopify {

namespace {

/// Whole-string decimal real number, accepting nan/inf spellings
bool parse_real(const std::string &text, double &value) {
  if (text.empty())
    return false;
  /// strtod also takes hexadecimal floats; cut points are decimal only
  std::size_t digits = (text[0] == '+' || text[0] == '-') ? 1 : 0;
  if (text.size() > digits + 1 && text[digits] == '0' &&
      (text[digits + 1] == 'x' || text[digits + 1] == 'X'))
    return false;
  char *end = nullptr;
  double parsed = std::strtod(text.c_str(), &end);
  if (!end || *end != '\0')
    return false;
  value = parsed;
  return true;
}

bool looks_negative_number(const std::string &arg) {
  double ignored;
  return arg.size() > 1 && arg[0] == '-' && parse_real(arg, ignored);
}

} // anonymous namespace

CliAction parse_command_line(int argc, const char *const argv[],
                             LoopRequest &request, std::string &error) {
  std::vector<std::string> positional;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-' || arg == "-" ||
        looks_negative_number(arg)) {
      positional.push_back(arg);
      continue;
    }

    if (arg == "--") {
      options_done = true;
    } else if (arg == "-h" || arg == "--help") {
      return CliAction::Help;
    } else if (arg == "-f" || arg == "--force") {
      request.policy = OverwritePolicy::Force;
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        error = fmt::format("option {} requires a path", arg);
        return CliAction::Error;
      }
      request.output_path = argv[++i];
    } else if (arg.rfind("--output=", 0) == 0) {
      request.output_path = arg.substr(9);
    } else {
      error = fmt::format("unknown option: {}", arg);
      return CliAction::Error;
    }
  }

  if (positional.size() != 2) {
    error = "expected <input_path> and <cut_seconds>";
    return CliAction::Error;
  }

  request.input_path = positional[0];
  if (!parse_real(positional[1], request.cut_seconds)) {
    error = fmt::format("cut_seconds is not a number: {}", positional[1]);
    return CliAction::Error;
  }
  return CliAction::Run;
}

std::string usage_text(const char *program) {
  return fmt::format(
      "Usage: {0} [options] <input_path> <cut_seconds>\n"
      "\n"
      "Rotate an audio file so it loops seamlessly: the audio after\n"
      "cut_seconds plays first, the audio before it plays last.\n"
      "\n"
      "Options:\n"
      "  -o, --output PATH  output file (default: <stem>.loopified<ext>)\n"
      "  -f, --force        allow overwriting an existing file\n"
      "  -h, --help         show this help\n"
      "\n"
      "cut_seconds may be negative to count from the end.\n"
      "\n"
      "Examples:\n"
      "  {0} song.mp3 12.5\n"
      "  {0} in.wav 3.0 -o rotated.wav\n"
      "  {0} track.flac -2.0 --force\n",
      program);
}

} // namespace loopify
