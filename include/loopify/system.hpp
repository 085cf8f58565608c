/**
 * @file system.hpp
 * @brief System utilities: process execution, path and time helpers
 *
 * @details Provides:
 *
 *          - Blocking child process execution with captured output
 *
 *          - Home directory expansion for user-supplied paths
 *
 *          - Time formatting utilities
 *
 * @note Process execution uses fork/execvp and is POSIX-specific. Arguments
 *       are passed as a vector, never through a shell, so paths containing
 *       quotes or spaces need no escaping.
 */

#ifndef LOOPIFY_SYSTEM_HPP
#define LOOPIFY_SYSTEM_HPP

#include <string>
#include <vector>

namespace loopify {

// **---- Process Execution ----**

/**
 * @brief Run a program and wait for it to exit.
 *
 * @note argv[0] is looked up through PATH. The child's stdout and stderr are
 *       merged into @p output. There is no timeout: a hung child blocks the
 *       caller.
 *
 * @param argv Program and arguments
 * @param output Receives everything the child wrote (appended)
 * @return Child exit code, 128 + signal if it was killed, -1 if it could not
 *         be started (reason appended to @p output)
 */
int run_command(const std::vector<std::string> &argv, std::string &output);

// **---- Paths ----**

/**
 * @brief Expand a leading "~" or "~/" to $HOME.
 * @return The path unchanged if it does not start with "~" or HOME is unset
 */
std::string expand_user(const std::string &path);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.mmm string.
 * @param seconds Time in seconds
 */
std::string format_time(double seconds);

/// Strip leading and trailing whitespace
std::string trim(const std::string &text);

} // namespace loopify

#endif // LOOPIFY_SYSTEM_HPP
