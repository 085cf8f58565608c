/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *
 * @note Values are read once per process. Tests that need different values
 *       use the get_env_* helpers directly.
 */

#ifndef LOOPIFY_CONFIG_HPP
#define LOOPIFY_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace loopify {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/// Transcoder executable, resolved through PATH when not absolute
inline const std::string &ffmpeg_bin() {
  static const std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// libmp3lame VBR quality used by the re-encode fallback (0 = best)
inline const std::string &mp3_quality() {
  static const std::string val = get_env_string("LOOPIFY_MP3_QUALITY", "2");
  return val;
}

/// AAC bitrate used by the re-encode fallback for non-mp3/wav outputs
inline const std::string &aac_bitrate() {
  static const std::string val =
      get_env_string("LOOPIFY_AAC_BITRATE", "192k");
  return val;
}

/**
 * @brief Parent directory for the per-run working directory
 * @note Segments are written here, so it needs room for one full copy of
 *       the source.
 */
inline const std::string &temp_root() {
  static const std::string val = get_env_string("TMPDIR", "/tmp");
  return val;
}

/// Print the phase timing table at the end of a run
inline bool print_timing() {
  static bool val = (get_env_int("LOOPIFY_TIMING", 0) != 0);
  return val;
}

/// Suppress INFO / PHASE / SUCCESS lines (errors and warnings still show)
inline bool quiet() {
  static bool val = (get_env_int("LOOPIFY_QUIET", 0) != 0);
  return val;
}

} // namespace Config
} // namespace loopify

#endif // LOOPIFY_CONFIG_HPP
