#pragma once
#include "agi_session.hpp"
#include "route_types.hpp"

namespace dr {

// channel variables read back by the dialplan
constexpr const char* VAR_ROUTE_STATUS = "ROUTE_STATUS";
constexpr const char* VAR_IS_INTERNAL = "IS_INTERNAL_DEST";
constexpr const char* VAR_TARGET_EXT = "TARGET_EXT";
constexpr const char* VAR_OUT_NUMBER = "OUT_NUMBER";
constexpr const char* VAR_DIAL_TRUNK = "DIAL_TRUNK";
constexpr const char* VAR_ROUTE_FAILURE = "ROUTE_FAILURE";

inline void publish_outcome(AgiSession& agi, const RouteOutcome& outcome) {
  agi.set_variable(VAR_ROUTE_STATUS, outcome.success() ? "SUCCESS" : "FAILED");
  agi.set_variable(VAR_IS_INTERNAL, outcome.internal() ? "TRUE" : "FALSE");

  if (auto ext = outcome.extension()) {
    agi.set_variable(VAR_TARGET_EXT, std::to_string(*ext));
  } else if (auto number = outcome.external_number()) {
    agi.set_variable(VAR_OUT_NUMBER, *number);
    if (outcome.trunk()) agi.set_variable(VAR_DIAL_TRUNK, *outcome.trunk());
  } else if (outcome.failure()) {
    agi.set_variable(VAR_ROUTE_FAILURE, to_string(*outcome.failure()));
  }
}

} // namespace dr
