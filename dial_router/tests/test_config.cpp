#include <gtest/gtest.h>
#include "config.hpp"
#include <map>

using namespace dr;

namespace {

RouterConfig load(const std::map<std::string, std::string>& vars) {
  return load_config([&](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  });
}

} // namespace

TEST(ConfigTest, Defaults) {
  const auto cfg = load({});
  EXPECT_EQ(cfg.trunk_policy, TrunkPolicy::Optional);
  EXPECT_EQ(cfg.city_prefix, "73843");
  EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST(ConfigTest, Overrides) {
  const auto cfg = load({{"DIAL_ROUTE_TRUNK_POLICY", "required"},
                         {"DIAL_ROUTE_CITY_PREFIX", "74951"},
                         {"DIAL_ROUTE_LOG_LEVEL", "debug"}});
  EXPECT_EQ(cfg.trunk_policy, TrunkPolicy::Required);
  EXPECT_EQ(cfg.city_prefix, "74951");
  EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(ConfigTest, BadValuesThrow) {
  EXPECT_THROW(load({{"DIAL_ROUTE_TRUNK_POLICY", "sometimes"}}), std::invalid_argument);
  EXPECT_THROW(load({{"DIAL_ROUTE_LOG_LEVEL", "loud"}}), std::invalid_argument);
  EXPECT_THROW(load({{"DIAL_ROUTE_CITY_PREFIX", "7"}}), std::invalid_argument);
}

TEST(ConfigTest, LogLevelThreshold) {
  set_log_level(LogLevel::Warn);
  EXPECT_FALSE(log_enabled(LogLevel::Info));
  EXPECT_TRUE(log_enabled(LogLevel::Error));
  set_log_level(LogLevel::Info);
  EXPECT_TRUE(log_enabled(LogLevel::Info));
  EXPECT_FALSE(log_enabled(LogLevel::Debug));
}
