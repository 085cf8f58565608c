/**
 * @file fake_toolkit.hpp
 * @brief Deterministic MediaToolkit for tests
 *
 * @details Models "audio" as raw bytes, one byte per second:
 *
 *          - probe: duration = file size, no audio stream if the file
 *            starts with "NOAUDIO"
 *
 *          - extraction: -ss N keeps bytes [N, end), -t N keeps [0, N)
 *
 *          - concat list / filter concat: output is the inputs' bytes in
 *            order
 *
 *          Every call is recorded and each stage can be told to fail.
 */

#ifndef LOOPIFY_TESTS_FAKE_TOOLKIT_HPP
#define LOOPIFY_TESTS_FAKE_TOOLKIT_HPP

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "loopify/media_toolkit.hpp"

namespace loopify {
namespace testing {

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

class FakeToolkit : public MediaToolkit {
public:
  enum class Call { Probe, Extract, LosslessConcat, ReencodeConcat };

  // Failure injection
  bool probe_fails = false;
  bool omit_duration = false;
  bool override_duration = false;
  double duration_value = 0.0;
  bool split_fails = false;
  bool reject_lossless = false;
  bool reencode_fails = false;
  bool write_garbage_on_failure = false; //< Failing calls leave junk output

  // Recorded
  std::vector<Call> calls;
  std::vector<std::vector<std::string>> transcode_args;
  std::vector<std::string> last_concat_list_entries;

  bool probe(const std::string &path, ProbeReport &report,
             std::string &error) override {
    calls.push_back(Call::Probe);
    if (probe_fails) {
      error = "fake probe: invalid data found when processing input";
      return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      error = "fake probe: no such file";
      return false;
    }
    std::string content = read_file(path);
    report = ProbeReport{};
    report.audio_streams = (content.rfind("NOAUDIO", 0) == 0) ? 0 : 1;
    report.has_duration = !omit_duration;
    report.duration = override_duration
                          ? duration_value
                          : static_cast<double>(content.size());
    return true;
  }

  bool run_transcode(const std::vector<std::string> &args,
                     std::string &error) override {
    transcode_args.push_back(args);
    const std::string &output = args.back();

    if (has(args, "-f") && value_after(args, "-f") == "concat") {
      calls.push_back(Call::LosslessConcat);
      last_concat_list_entries = parse_list(read_file(value_after(args, "-i")));
      if (reject_lossless)
        return fail(output, "fake concat: codec parameters differ", error);
      std::string joined;
      for (const auto &entry : last_concat_list_entries)
        joined += read_file(entry);
      write_file(output, joined);
      return true;
    }

    if (has(args, "-filter_complex")) {
      calls.push_back(Call::ReencodeConcat);
      if (reencode_fails)
        return fail(output, "fake filter: encoder not found", error);
      std::string joined;
      for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "-i")
          joined += read_file(args[i + 1]);
      }
      write_file(output, joined);
      return true;
    }

    calls.push_back(Call::Extract);
    if (split_fails)
      return fail(output, "fake extract: invalid argument", error);
    std::string content = read_file(value_after(args, "-i"));
    if (has(args, "-ss")) {
      size_t from = to_index(value_after(args, "-ss"), content.size());
      write_file(output, content.substr(from));
    } else {
      size_t len = to_index(value_after(args, "-t"), content.size());
      write_file(output, content.substr(0, len));
    }
    return true;
  }

  size_t count(Call c) const {
    size_t n = 0;
    for (Call x : calls)
      n += (x == c) ? 1 : 0;
    return n;
  }

  /// Arguments of the most recent filter-graph join
  std::vector<std::string> last_reencode_args() const {
    for (auto it = transcode_args.rbegin(); it != transcode_args.rend(); ++it)
      if (has(*it, "-filter_complex"))
        return *it;
    return {};
  }

private:
  bool fail(const std::string &output, const char *message,
            std::string &error) {
    if (write_garbage_on_failure)
      write_file(output, "garbage");
    error = message;
    return false;
  }

  static bool has(const std::vector<std::string> &args, const char *flag) {
    for (const auto &a : args)
      if (a == flag)
        return true;
    return false;
  }

  static std::string value_after(const std::vector<std::string> &args,
                                 const char *flag) {
    for (size_t i = 0; i + 1 < args.size(); ++i)
      if (args[i] == flag)
        return args[i + 1];
    return {};
  }

  static size_t to_index(const std::string &seconds, size_t limit) {
    double v = std::round(std::stod(seconds));
    if (v < 0)
      return 0;
    size_t idx = static_cast<size_t>(v);
    return idx > limit ? limit : idx;
  }

  /// Inverse of concat_list_line for each line
  static std::vector<std::string> parse_list(const std::string &text) {
    std::vector<std::string> entries;
    std::istringstream in(text);
    std::string line;
    const std::string prefix = "file '";
    while (std::getline(in, line)) {
      if (line.rfind(prefix, 0) != 0 || line.back() != '\'')
        continue;
      std::string body = line.substr(prefix.size(),
                                     line.size() - prefix.size() - 1);
      std::string unescaped;
      for (size_t i = 0; i < body.size(); ++i) {
        if (body.compare(i, 4, "'\\''") == 0) {
          unescaped += '\'';
          i += 3;
        } else {
          unescaped += body[i];
        }
      }
      entries.push_back(unescaped);
    }
    return entries;
  }
};

} // namespace testing
} // namespace loopify

#endif // LOOPIFY_TESTS_FAKE_TOOLKIT_HPP
