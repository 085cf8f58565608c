/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - fork/execvp process execution with a capture pipe
 *
 *          - Home directory expansion
 *
 *          - Time formatting utilities
 */

#include "loopify/system.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace loopify {

// **---- Process Execution ----**

int run_command(const std::vector<std::string> &argv, std::string &output) {
  if (argv.empty()) {
    output += "empty command line";
    return -1;
  }

  /// Build the exec argument array before forking
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    output += fmt::format("pipe failed: {}", std::strerror(errno));
    return -1;
  }

  pid_t pid = fork();
  if (pid == -1) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    output += fmt::format("fork failed: {}", std::strerror(err));
    return -1;
  }

  if (pid == 0) {
    /// Child: route stdout and stderr into the pipe, stdin from /dev/null
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());
    /// Only reached if exec failed
    const char msg[] = "exec failed: ";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ignored = write(STDERR_FILENO, c_argv[0], std::strlen(c_argv[0]));
    (void)ignored;
    _exit(127);
  }

  /// Parent: drain the pipe until the child closes it
  close(fds[1]);
  char buf[4096];
  for (;;) {
    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      output.append(buf, static_cast<size_t>(n));
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      output += fmt::format("waitpid failed: {}", std::strerror(errno));
      return -1;
    }
  }

  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// **---- Paths ----**

std::string expand_user(const std::string &path) {
  if (path.empty() || path[0] != '~')
    return path;
  if (path.size() > 1 && path[1] != '/')
    return path; /// ~user form is left alone
  const char *home = std::getenv("HOME");
  if (!home || !*home)
    return path;
  return std::string(home) + path.substr(1);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (!(seconds > 0))
    seconds = 0;
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

std::string trim(const std::string &text) {
  const char *ws = " \t\r\n";
  size_t first = text.find_first_not_of(ws);
  if (first == std::string::npos)
    return {};
  size_t last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

} // namespace loopify
