/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector for aggregating per-phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and go to stderr,
 *       so that stdout carries nothing but the resolved output path.
 */

#ifndef LOOPIFY_LOGGING_HPP
#define LOOPIFY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace loopify {

// **----- LOGGING CONFIGURATION -----**

#ifndef LOOPIFY_ENABLE_LOGGING
#define LOOPIFY_ENABLE_LOGGING 1
#endif

#ifndef LOOPIFY_ENABLE_TIMING
#define LOOPIFY_ENABLE_TIMING 1
#endif

// **----- LOGGING MACROS -----**

#if LOOPIFY_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    if (!loopify::Config::quiet()) {                                           \
      fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);            \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    if (!loopify::Config::quiet()) {                                           \
      fmt::print(stderr, fg(fmt::color::cyan), format_str "\n",                \
                 ##__VA_ARGS__);                                               \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    if (!loopify::Config::quiet()) {                                           \
      fmt::print(stderr, fg(fmt::color::green), format_str "\n",               \
                 ##__VA_ARGS__);                                               \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Process-wide collection of phase timings.
 * @note The pipeline is single-threaded, so no locking is done.
 */
class TimingCollector {
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table on stderr.
   */
  static void print_summary();

  /// Drop entries from a previous run
  static void clear();
};

// **----- TIMING MACROS -----**

#if LOOPIFY_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    loopify::TimingCollector::record(#name,                                    \
                                     static_cast<long>(timer_duration_##name)); \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace loopify

#endif // LOOPIFY_LOGGING_HPP
