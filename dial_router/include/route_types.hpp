#pragma once
#include "common.hpp"
#include <variant>

namespace dr {

using Extension = uint16_t;

// canonical digit string: 3-digit short code or 11-digit national number
using NationalNumber = std::string;

enum class Direction : uint8_t {
  Inbound,
  Outbound
};

enum class FailureReason : uint8_t {
  InvalidFormat,
  UnknownInboundDestination,
  ShortCodeNotMapped,
  NoTrunkAvailable,
  UnknownDirection
};

// what to do with an external call when the caller has no trunk mapping
enum class TrunkPolicy : uint8_t {
  Optional,
  Required
};

struct Internal {
  Extension ext{0};
};

struct External {
  NationalNumber number;
};

using RouteTarget = std::variant<Internal, External>;

inline const char* to_string(Direction d) {
  switch (d) {
    case Direction::Inbound:  return "inbound";
    case Direction::Outbound: return "outbound";
  }
  return "?";
}

// tag published to the dialplan in ROUTE_FAILURE
inline const char* to_string(FailureReason r) {
  switch (r) {
    case FailureReason::InvalidFormat:             return "INVALID_FORMAT";
    case FailureReason::UnknownInboundDestination: return "UNKNOWN_INBOUND_DESTINATION";
    case FailureReason::ShortCodeNotMapped:        return "SHORT_CODE_NOT_MAPPED";
    case FailureReason::NoTrunkAvailable:          return "NO_TRUNK_AVAILABLE";
    case FailureReason::UnknownDirection:          return "UNKNOWN_DIRECTION";
  }
  return "UNKNOWN";
}

inline const char* to_string(TrunkPolicy p) {
  return p == TrunkPolicy::Required ? "required" : "optional";
}

class RouteOutcome;

// defined in outcome.hpp
inline RouteOutcome build_outcome(std::optional<RouteTarget> target,
                                  std::optional<NationalNumber> trunk,
                                  std::optional<FailureReason> failure);

// Final routing decision. Only build_outcome() creates one, so the flags
// always agree with the target variant.
class RouteOutcome {
public:
  bool success() const { return target_.has_value(); }
  bool internal() const {
    return target_ && std::holds_alternative<Internal>(*target_);
  }

  const std::optional<RouteTarget>& target() const { return target_; }
  const std::optional<NationalNumber>& trunk() const { return trunk_; }
  const std::optional<FailureReason>& failure() const { return failure_; }

  std::optional<Extension> extension() const {
    if (!target_) return std::nullopt;
    if (auto p = std::get_if<Internal>(&*target_)) return p->ext;
    return std::nullopt;
  }

  std::optional<NationalNumber> external_number() const {
    if (!target_) return std::nullopt;
    if (auto p = std::get_if<External>(&*target_)) return p->number;
    return std::nullopt;
  }

  std::string describe() const {
    std::ostringstream os;
    if (!target_) {
      os << "FAILED reason=" << (failure_ ? to_string(*failure_) : "?");
    } else if (auto in = std::get_if<Internal>(&*target_)) {
      os << "INTERNAL ext=" << in->ext;
    } else {
      os << "EXTERNAL number=" << std::get<External>(*target_).number
         << " trunk=" << (trunk_ ? *trunk_ : std::string("-"));
    }
    return os.str();
  }

private:
  friend RouteOutcome build_outcome(std::optional<RouteTarget> target,
                                    std::optional<NationalNumber> trunk,
                                    std::optional<FailureReason> failure);
  RouteOutcome() = default;

  std::optional<RouteTarget> target_;
  std::optional<NationalNumber> trunk_;
  std::optional<FailureReason> failure_;
};

} // namespace dr
