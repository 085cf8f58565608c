/**
 * @file output_writer.hpp
 * @brief Destination resolution, overwrite policy and crash-safe commit
 *
 * @details Rules:
 *
 *          - Default destination is <dir>/<stem>.loopified<ext>
 *
 *          - Source and destination are compared as canonical paths, so
 *            "./a.wav", "a.wav" and a symlink to it are the same file
 *
 *          - An existing destination is only replaced with Force. A symlink
 *            destination is replaced itself, never its target, and an
 *            existing directory is never replaced
 *
 *          - When the destination is the source, the result is staged next
 *            to it and renamed over it in one step
 */

#ifndef LOOPIFY_OUTPUT_WRITER_HPP
#define LOOPIFY_OUTPUT_WRITER_HPP

#include <string>

#include "scoped_path.hpp"
#include "types.hpp"

namespace loopify {

/// <dir>/<stem>.loopified<ext> for @p source
std::string default_output_path(const std::string &source);

/**
 * @brief Resolve and validate the destination. No filesystem changes.
 *
 * @param source Existing source file
 * @param requested Destination as given by the user, empty for the default
 * @param policy Refuse or Force
 * @param target Filled on success
 * @return OutputDirMissing, OverwriteRefused (also for a directory), or Ok
 */
Status resolve_output_target(const std::string &source,
                             const std::string &requested,
                             OverwritePolicy policy, OutputTarget &target);

/**
 * @brief Delete an existing destination that is about to be replaced.
 * @note Does nothing when the destination is the source: that file is
 *       replaced by rename instead.
 */
Status clear_destination(const OutputTarget &target);

/**
 * @brief No-op commit: destination becomes a byte copy of the source.
 * @note Staged and renamed when the destination is the source.
 */
Status commit_copy(const OutputTarget &target);

/**
 * @brief Choose where the join step should write.
 *
 * @param staging Receives the staging file when the destination is the
 *                source; left empty otherwise
 * @param work_output Path the join should write to
 */
Status open_work_output(const OutputTarget &target, StagingFile &staging,
                        std::string &work_output);

/**
 * @brief Move a finished work output into place (rename over the source
 *        when staged, nothing to do otherwise).
 */
Status finalize_work_output(const OutputTarget &target, StagingFile &staging);

} // namespace loopify

#endif // LOOPIFY_OUTPUT_WRITER_HPP
