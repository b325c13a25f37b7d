#pragma once
#include "route_types.hpp"

namespace dr {

// trunk survives only on External; failure survives only without a target
inline RouteOutcome build_outcome(std::optional<RouteTarget> target,
                                  std::optional<NationalNumber> trunk,
                                  std::optional<FailureReason> failure) {
  RouteOutcome out;
  if (!target) {
    out.failure_ = failure ? *failure : FailureReason::InvalidFormat;
    return out;
  }
  if (std::holds_alternative<External>(*target)) {
    out.trunk_ = std::move(trunk);
  }
  out.target_ = std::move(target);
  return out;
}

inline RouteOutcome make_failure(FailureReason reason) {
  return build_outcome(std::nullopt, std::nullopt, reason);
}

inline RouteOutcome make_internal(Extension ext) {
  return build_outcome(RouteTarget{Internal{ext}}, std::nullopt, std::nullopt);
}

inline RouteOutcome make_external(NationalNumber number, std::optional<NationalNumber> trunk) {
  return build_outcome(RouteTarget{External{std::move(number)}}, std::move(trunk), std::nullopt);
}

} // namespace dr
