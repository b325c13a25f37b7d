#pragma once
#include "common.hpp"
#include <cstdlib>

namespace dr {

// AGI reply codes
constexpr int AGI_OK = 200;
constexpr int AGI_INVALID_COMMAND = 510;
constexpr int AGI_DEAD_CHANNEL = 511;
constexpr int AGI_USAGE = 520;

struct AgiReply {
  int code{0};
  long result{0};
  std::string data;   // whatever follows result=<n>, e.g. "(timeout)"
  std::string text;   // raw line, kept for error messages
};

inline std::string trim_newline(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

// wraps a command argument in double quotes, escaping '"' and '\'
inline std::string agi_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n' || c == '\r') continue;
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

inline std::string format_set_variable(const std::string& name, const std::string& value) {
  return "SET VARIABLE " + name + " " + agi_quote(value) + "\n";
}

inline std::string format_verbose(const std::string& msg, int level) {
  return "VERBOSE " + agi_quote(msg) + " " + std::to_string(level) + "\n";
}

// "key: value" from the environment block; false for anything else
inline bool parse_env_line(const std::string& line, std::string& key, std::string& value) {
  auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) return false;
  key = line.substr(0, colon);
  auto v = colon + 1;
  while (v < line.size() && line[v] == ' ') ++v;
  value = line.substr(v);
  return true;
}

// "<code> result=<n> [data]" or "<code> <free text>" for errors
inline std::optional<AgiReply> parse_reply(const std::string& raw) {
  const std::string line = trim_newline(raw);
  if (line.size() < 3) return std::nullopt;
  for (size_t i = 0; i < 3; ++i) {
    if (!is_ascii_digit(line[i])) return std::nullopt;
  }
  if (line.size() > 3 && line[3] != ' ' && line[3] != '-') return std::nullopt;

  AgiReply r;
  r.code = std::atoi(line.substr(0, 3).c_str());
  r.text = line;
  if (r.code != AGI_OK) return r;

  const std::string pat = "result=";
  auto k = line.find(pat, 3);
  if (k == std::string::npos) return std::nullopt;
  auto p = k + pat.size();
  auto e = p;
  if (e < line.size() && line[e] == '-') ++e;
  while (e < line.size() && is_ascii_digit(line[e])) ++e;
  if (e == p || (e == p + 1 && line[p] == '-')) return std::nullopt;
  r.result = std::strtol(line.substr(p, e - p).c_str(), nullptr, 10);
  while (e < line.size() && line[e] == ' ') ++e;
  r.data = line.substr(e);
  return r;
}

} // namespace dr
