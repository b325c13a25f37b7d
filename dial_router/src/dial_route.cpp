#include "call_request.hpp"
#include "config.hpp"
#include "route_vars.hpp"

using namespace dr;

// AGI entry point: one call per process.
//   exten => _X.,n,AGI(dial_route,${EXTEN},outbound,${CALLERID(num)})
int main() {
  RouterConfig cfg;
  try {
    cfg = load_config_from_env();
  } catch (const std::exception& e) {
    log_err(std::string("config error: ") + e.what());
    return 2;
  }
  set_log_level(cfg.log_level);

  const RoutingTables tables = RoutingTables::builtin();
  const RouteResolver resolver(tables, NumberNormalizer(cfg.city_prefix), cfg.trunk_policy);

  AgiSession agi(std::cin, std::cout);
  try {
    agi.read_environment();
    const auto args = agi.args();
    log_debug("AGI request " + agi.env("agi_request") + " channel " + agi.env("agi_channel"));

    const uint64_t t0 = steady_millis();

    auto req = parse_call_request(args);
    RouteOutcome outcome = make_failure(FailureReason::UnknownDirection);
    if (!req) {
      log_warn("unknown call type '" + (args.size() >= 2 ? args[1] : std::string()) + "'");
    } else {
      outcome = resolver.route(*req);
    }

    const uint64_t t1 = steady_millis();
    log_info((req ? describe(*req) : std::string("unrouted")) + " -> " + outcome.describe() +
             " trunk_policy=" + to_string(cfg.trunk_policy) +
             " latency_ms=" + std::to_string(t1 - t0));

    publish_outcome(agi, outcome);
  } catch (const std::exception& e) {
    log_err(std::string("AGI error: ") + e.what());
    return 1;
  }
  return 0;
}
