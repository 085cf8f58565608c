/**
 * @file splitter.hpp
 * @brief Lossless extraction of the tail and head segments
 *
 * @details For a normalized cut offset the source is split into:
 *
 *          - tail = source[cut:]  (plays first in the output)
 *
 *          - head = source[:cut]  (plays last in the output)
 *
 *          Both are stream copies (-c copy): no decode, no re-encode.
 */

#ifndef LOOPIFY_SPLITTER_HPP
#define LOOPIFY_SPLITTER_HPP

#include <string>
#include <vector>

#include "media_toolkit.hpp"
#include "scoped_path.hpp"
#include "types.hpp"

namespace loopify {

/**
 * @brief Format seconds for the transcoder command line.
 * @note Up to 6 decimals, trailing zeros and a trailing '.' stripped,
 *       "0" for zero. 2.5 -> "2.5", 3.0 -> "3".
 */
std::string format_seconds(double value);

/// Arguments extracting [cut, end) of @p source into @p output
std::vector<std::string> tail_extract_args(const std::string &source,
                                           const std::string &cut_text,
                                           const std::string &output);

/// Arguments extracting [0, cut) of @p source into @p output
std::vector<std::string> head_extract_args(const std::string &source,
                                           const std::string &cut_text,
                                           const std::string &output);

/**
 * @brief Materialize tail and head of @p asset inside @p work_dir.
 *
 * @param suffix Extension for the segment files (selects the muxer)
 * @param segments Filled with both paths and ranges on success
 * @return SplitFailure (with the transcoder's message) if either extraction
 *         fails; the tail is extracted first
 */
Status split_segments(MediaToolkit &toolkit, const AudioAsset &asset,
                      double cut, const TempDirectory &work_dir,
                      const std::string &suffix, SegmentFiles &segments);

} // namespace loopify

#endif // LOOPIFY_SPLITTER_HPP
