#pragma once
#include "resolver.hpp"
#include <limits>

namespace dr {

struct CallType {
  Direction direction;
  NumberFormat format;
};

// "inbound" / "outbound" plus the legacy per-format call types the
// dialplan still passes
inline std::optional<CallType> parse_call_type(const std::string& s) {
  if (s == "inbound")      return CallType{Direction::Inbound, NumberFormat::Any};
  if (s == "outbound")     return CallType{Direction::Outbound, NumberFormat::Any};
  if (s == "old_short")    return CallType{Direction::Outbound, NumberFormat::ShortCode};
  if (s == "city_6")       return CallType{Direction::Outbound, NumberFormat::City6};
  if (s == "federal_plus") return CallType{Direction::Outbound, NumberFormat::FederalPlus};
  if (s == "federal_7")    return CallType{Direction::Outbound, NumberFormat::Federal7};
  if (s == "federal_8")    return CallType{Direction::Outbound, NumberFormat::Federal8};
  return std::nullopt;
}

// pure digits, non-zero, fits an Extension; anything else means "no caller"
inline std::optional<Extension> parse_caller_ext(const std::string& s) {
  if (!all_digits(s) || s.size() > 5) return std::nullopt;
  const unsigned long v = std::stoul(s);
  if (v == 0 || v > std::numeric_limits<Extension>::max()) return std::nullopt;
  return static_cast<Extension>(v);
}

// positional AGI arguments: <dialed> <call type> [caller]
// nullopt when the call type is missing or unknown
inline std::optional<CallRequest> parse_call_request(const std::vector<std::string>& args) {
  if (args.size() < 2) return std::nullopt;
  auto type = parse_call_type(args[1]);
  if (!type) return std::nullopt;

  CallRequest req;
  req.direction = type->direction;
  req.format = type->format;
  req.dialed_raw = args[0];
  if (args.size() >= 3) req.caller_ext = parse_caller_ext(args[2]);
  return req;
}

inline std::string describe(const CallRequest& req) {
  std::ostringstream os;
  os << to_string(req.direction) << " dialed='" << req.dialed_raw << "'";
  if (req.format != NumberFormat::Any) os << " format=" << to_string(req.format);
  os << " caller=";
  if (req.caller_ext) os << *req.caller_ext;
  else os << "-";
  return os.str();
}

} // namespace dr
