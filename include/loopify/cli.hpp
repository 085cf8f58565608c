/**
 * @file cli.hpp
 * @brief Command-line parsing for the loopify executable
 *
 * @details Usage: loopify [-o PATH] [-f] <input_path> <cut_seconds>
 *
 *          - A negative cut ("-2.5") is taken as a number, not an option
 *
 *          - "--" ends option parsing
 */

#ifndef LOOPIFY_CLI_HPP
#define LOOPIFY_CLI_HPP

#include <string>

#include "pipeline.hpp"

namespace loopify {

enum class CliAction { Run, Help, Error };

/**
 * @brief Parse argv into a LoopRequest.
 * @param error Usage problem when CliAction::Error is returned
 */
CliAction parse_command_line(int argc, const char *const argv[],
                             LoopRequest &request, std::string &error);

/// Full usage / help text
std::string usage_text(const char *program);

} // namespace loopify

#endif // LOOPIFY_CLI_HPP
