/**
 * @file cut_normalizer.cpp
 * @brief Cut normalization implementation
 */

#include "loopify/cut_normalizer.hpp"

#include <cmath>

#include <fmt/core.h>

namespace loopify {

double floored_mod(double value, double divisor) {
  double r = std::fmod(value, divisor);
  if (r < 0)
    r += divisor;
  /// -tiny + divisor can round up to divisor itself
  if (r >= divisor)
    r = 0.0;
  return r;
}

Status normalize_cut(double raw, double duration, CutDecision &decision) {
  if (!std::isfinite(raw)) {
    return Status::error(ErrorKind::InvalidCutSpec,
                         fmt::format("cut_seconds must be a finite number, "
                                     "got {}",
                                     raw));
  }

  decision = CutDecision{};
  if (!(duration > 0))
    return Status::success();

  double cut = floored_mod(raw, duration);
  if (std::fabs(cut) <= CUT_TOLERANCE_SEC)
    return Status::success();

  decision.noop = false;
  decision.cut = cut;
  return Status::success();
}

} // namespace loopify
