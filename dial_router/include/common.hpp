#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dr {

enum class LogLevel : int {
  Debug = 0,
  Info  = 1,
  Warn  = 2,
  Error = 3
};

inline std::string now_ts() {
  using namespace std::chrono;
  const auto tp = system_clock::now();
  const auto t = system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64]{};
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return std::string(buf);
}

// process-wide threshold; stdout belongs to AGI so everything goes to stderr
inline LogLevel& log_threshold() {
  static LogLevel g{LogLevel::Info};
  return g;
}

inline void set_log_level(LogLevel lvl) { log_threshold() = lvl; }

inline bool log_enabled(LogLevel lvl) {
  return static_cast<int>(lvl) >= static_cast<int>(log_threshold());
}

inline void log_debug(const std::string& msg) {
  if (!log_enabled(LogLevel::Debug)) return;
  std::cerr << "[" << now_ts() << "] [DBG ] " << msg << "\n";
}
inline void log_info(const std::string& msg) {
  if (!log_enabled(LogLevel::Info)) return;
  std::cerr << "[" << now_ts() << "] [INFO] " << msg << "\n";
}
inline void log_warn(const std::string& msg) {
  if (!log_enabled(LogLevel::Warn)) return;
  std::cerr << "[" << now_ts() << "] [WARN] " << msg << "\n";
}
inline void log_err(const std::string& msg) {
  std::cerr << "[" << now_ts() << "] [ERR ] " << msg << "\n";
}

inline uint64_t steady_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

inline bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

inline bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!is_ascii_digit(c)) return false;
  }
  return true;
}

} // namespace dr
