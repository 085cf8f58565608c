/**
 * @file logging.cpp
 * @brief Timing collector implementation
 */

#include "loopify/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace loopify {

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  if (entries.empty())
    return;

  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "=============== TIMING SUMMARY ===============\n");
  fmt::print(stderr, "{:<24} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print(stderr, "{:-<24} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print(stderr, "{:<24} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               seconds);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "==============================================\n");
  std::fflush(stderr);
}

void TimingCollector::clear() { entries.clear(); }

} // namespace loopify
