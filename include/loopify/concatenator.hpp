/**
 * @file concatenator.hpp
 * @brief Reassembly of tail + head into one stream
 *
 * @details Two strategies, tried in order:
 *
 *          1. Lossless: concat demuxer over an in-memory file list, -c copy.
 *             Works when both segments share container/codec framing.
 *
 *          2. Re-encode: decode both inputs through a concat filter graph
 *             and encode with a codec chosen from the output extension.
 *
 * @attention There is no third strategy. If the re-encode fails the run
 *            fails with JoinFailure.
 */

#ifndef LOOPIFY_CONCATENATOR_HPP
#define LOOPIFY_CONCATENATOR_HPP

#include <string>
#include <vector>

#include "media_toolkit.hpp"
#include "types.hpp"

namespace loopify {

/**
 * @brief One concat demuxer line for @p path.
 * @note Single quotes are escaped by closing the quote, emitting \' and
 *       reopening: it's -> file 'it'\''s'
 */
std::string concat_list_line(const std::string &path);

/// Newline-terminated list of concat_list_line() for each path, in order
std::string build_concat_list(const std::vector<std::string> &paths);

/**
 * @brief Encoder arguments for the re-encode fallback.
 * @param extension Output extension including the dot, any case
 * @return .mp3 -> libmp3lame VBR, .wav -> 16-bit PCM, otherwise AAC
 */
std::vector<std::string> codec_args_for(const std::string &extension);

std::vector<std::string> lossless_concat_args(const std::string &list_path,
                                              const std::string &output);

std::vector<std::string>
reencode_concat_args(const std::string &first, const std::string &second,
                     const std::vector<std::string> &codec_args,
                     const std::string &output);

/**
 * @brief Join segments.tail then segments.head into @p output.
 *
 * @param codec_extension Extension deciding the fallback codec (normally
 *                        the final destination's)
 * @param attempt Receives the strategy that succeeded
 * @return JoinFailure with the fallback's error text if both strategies
 *         fail; any partial @p output is removed in that case
 */
Status join_segments(MediaToolkit &toolkit, const SegmentFiles &segments,
                     const std::string &output,
                     const std::string &codec_extension,
                     TranscodeAttempt &attempt);

} // namespace loopify

#endif // LOOPIFY_CONCATENATOR_HPP
