/**
 * @file duration_probe.hpp
 * @brief Duration discovery for the source asset
 */

#ifndef LOOPIFY_DURATION_PROBE_HPP
#define LOOPIFY_DURATION_PROBE_HPP

#include <string>

#include "media_toolkit.hpp"
#include "types.hpp"

namespace loopify {

/**
 * @brief Turn a raw probe report into a usable duration.
 *
 * @attention Degenerate values are not errors: a NaN or negative duration
 *            becomes 0, which later selects the plain-copy path.
 *
 * @param report Inspection result
 * @param duration Receives seconds, >= 0
 * @return NoAudioStream, InvalidDuration (missing or infinite), or Ok
 */
Status interpret_probe_report(const ProbeReport &report, double &duration);

/**
 * @brief Probe @p path and fill @p asset (path, duration, format hint).
 * @return ProbeFailure if the inspection itself failed, otherwise the result
 *         of interpret_probe_report
 */
Status probe_duration(MediaToolkit &toolkit, const std::string &path,
                      AudioAsset &asset);

} // namespace loopify

#endif // LOOPIFY_DURATION_PROBE_HPP
