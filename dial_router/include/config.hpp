#pragma once
#include "normalizer.hpp"
#include <cstdlib>

namespace dr {

struct RouterConfig {
  TrunkPolicy trunk_policy{TrunkPolicy::Optional};
  std::string city_prefix{DEFAULT_CITY_PREFIX};
  LogLevel log_level{LogLevel::Info};
};

inline TrunkPolicy parse_trunk_policy(const std::string& s) {
  if (s == "optional") return TrunkPolicy::Optional;
  if (s == "required") return TrunkPolicy::Required;
  throw std::invalid_argument("bad trunk policy '" + s + "' (optional|required)");
}

inline LogLevel parse_log_level(const std::string& s) {
  if (s == "debug") return LogLevel::Debug;
  if (s == "info")  return LogLevel::Info;
  if (s == "warn")  return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  throw std::invalid_argument("bad log level '" + s + "' (debug|info|warn|error)");
}

// Lookup is injectable so tests don't have to touch the real environment.
template <typename Getenv>
RouterConfig load_config(Getenv&& get) {
  RouterConfig cfg;
  if (const char* v = get("DIAL_ROUTE_TRUNK_POLICY")) cfg.trunk_policy = parse_trunk_policy(v);
  if (const char* v = get("DIAL_ROUTE_LOG_LEVEL")) cfg.log_level = parse_log_level(v);
  if (const char* v = get("DIAL_ROUTE_CITY_PREFIX")) {
    NumberNormalizer::validate_city_prefix(v);
    cfg.city_prefix = v;
  }
  return cfg;
}

inline RouterConfig load_config_from_env() {
  return load_config([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace dr
