/**
 * @file cut_normalizer.hpp
 * @brief Maps a user cut value onto an in-bounds offset
 */

#ifndef LOOPIFY_CUT_NORMALIZER_HPP
#define LOOPIFY_CUT_NORMALIZER_HPP

#include "types.hpp"

namespace loopify {

/**
 * @brief Floored modulo: result has the sign of @p divisor.
 * @note Requires divisor > 0. The result is in [0, divisor).
 */
double floored_mod(double value, double divisor);

/**
 * @brief Normalize @p raw seconds against @p duration.
 *
 * @details Negative values count from the end (-2 on a 10s asset is 8).
 *          The decision is a no-op when duration <= 0 or the normalized
 *          offset is within CUT_TOLERANCE_SEC of zero.
 *
 * @return InvalidCutSpec if raw is NaN or infinite
 */
Status normalize_cut(double raw, double duration, CutDecision &decision);

} // namespace loopify

#endif // LOOPIFY_CUT_NORMALIZER_HPP
