#pragma once
#include "digits.hpp"
#include "normalizer.hpp"
#include "outcome.hpp"
#include "routing_tables.hpp"

namespace dr {

struct CallRequest {
  Direction direction{Direction::Outbound};
  std::string dialed_raw;
  std::optional<Extension> caller_ext;
  NumberFormat format{NumberFormat::Any};
};

class RouteResolver {
public:
  RouteResolver(const RoutingTables& tables, NumberNormalizer normalizer,
                TrunkPolicy policy = TrunkPolicy::Optional)
      : tables_(tables), normalizer_(std::move(normalizer)), policy_(policy) {}

  // tables are held by reference and must outlive the resolver
  RouteResolver(RoutingTables&&, NumberNormalizer, TrunkPolicy = TrunkPolicy::Optional) = delete;

  // Inbound numbers are carrier-canonical already and are looked up as is;
  // outbound numbers must come through the normalizer first.
  RouteOutcome resolve(Direction dir, const NationalNumber& number,
                       std::optional<Extension> caller_ext) const {
    auto ext = tables_.lookup_extension(number);

    if (dir == Direction::Inbound) {
      if (!ext) return make_failure(FailureReason::UnknownInboundDestination);
      return make_internal(*ext);
    }

    if (ext) return make_internal(*ext);
    if (number.size() == SHORT_CODE_LEN) return make_failure(FailureReason::ShortCodeNotMapped);

    std::optional<NationalNumber> trunk;
    if (caller_ext) trunk = tables_.lookup_trunk(*caller_ext);
    if (!trunk && policy_ == TrunkPolicy::Required) {
      return make_failure(FailureReason::NoTrunkAvailable);
    }
    return make_external(number, std::move(trunk));
  }

  // full pipeline: sanitize -> normalize (outbound only) -> resolve
  RouteOutcome route(const CallRequest& req) const {
    auto digits = sanitize(req.dialed_raw);
    if (!digits) {
      log_debug("no digits in '" + req.dialed_raw + "'");
      return make_failure(FailureReason::InvalidFormat);
    }
    if (req.direction == Direction::Inbound) {
      if (digits->size() > NATIONAL_LEN) {
        log_debug("inbound number too long: '" + *digits + "'");
        return make_failure(FailureReason::InvalidFormat);
      }
      return resolve(Direction::Inbound, *digits, req.caller_ext);
    }
    auto number = normalizer_.normalize(*digits, req.format);
    if (!number) {
      log_debug("cannot normalize '" + *digits + "' as " + to_string(req.format));
      return make_failure(FailureReason::InvalidFormat);
    }
    log_debug("normalized " + *digits + " -> " + *number);
    return resolve(Direction::Outbound, *number, req.caller_ext);
  }

private:
  const RoutingTables& tables_;
  NumberNormalizer normalizer_;
  TrunkPolicy policy_;
};

} // namespace dr
