#pragma once
#include "common.hpp"

namespace dr {

// Drops every character that is not 0-9. No length check here, the
// normalizer decides which lengths are meaningful.
inline std::optional<std::string> sanitize(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (is_ascii_digit(c)) out.push_back(c);
  }
  if (out.empty()) return std::nullopt;
  return out;
}

} // namespace dr
