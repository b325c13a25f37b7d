#pragma once
#include "route_types.hpp"

namespace dr {

constexpr const char* DEFAULT_CITY_PREFIX = "73843";
constexpr size_t SHORT_CODE_LEN = 3;
constexpr size_t CITY_NUMBER_LEN = 6;
constexpr size_t NATIONAL_LEN = 11;

// Format hint from the legacy call types. A hint only narrows which
// length classes are accepted, the rewrite rules stay the same.
enum class NumberFormat : uint8_t {
  Any,
  ShortCode,    // 3 digits
  City6,        // 6 digits
  FederalPlus,  // 10 or 11 digits
  Federal7,     // 11 digits, leading 7
  Federal8      // 11 digits, leading 8
};

inline const char* to_string(NumberFormat f) {
  switch (f) {
    case NumberFormat::Any:         return "any";
    case NumberFormat::ShortCode:   return "old_short";
    case NumberFormat::City6:       return "city_6";
    case NumberFormat::FederalPlus: return "federal_plus";
    case NumberFormat::Federal7:    return "federal_7";
    case NumberFormat::Federal8:    return "federal_8";
  }
  return "?";
}

class NumberNormalizer {
public:
  explicit NumberNormalizer(std::string city_prefix = DEFAULT_CITY_PREFIX)
      : city_prefix_(std::move(city_prefix)) {
    validate_city_prefix(city_prefix_);
  }

  // prefix + 6-digit city number must make a full national number
  static void validate_city_prefix(const std::string& prefix) {
    if (!all_digits(prefix) || prefix.size() + CITY_NUMBER_LEN != NATIONAL_LEN) {
      throw std::invalid_argument("city prefix must be 5 digits: '" + prefix + "'");
    }
  }

  //   3           -> as is (short code)
  //   6           -> city prefix + digits
  //   10          -> '7' + digits
  //   11, 7xxx    -> as is
  //   11, 8xxx    -> '7' + last 10
  //   otherwise   -> reject
  std::optional<NationalNumber> normalize(const std::string& digits) const {
    if (!all_digits(digits)) return std::nullopt;
    switch (digits.size()) {
      case SHORT_CODE_LEN:
        return digits;
      case CITY_NUMBER_LEN:
        return city_prefix_ + digits;
      case NATIONAL_LEN - 1:
        return "7" + digits;
      case NATIONAL_LEN:
        if (digits[0] == '7') return digits;
        if (digits[0] == '8') return "7" + digits.substr(1);
        return std::nullopt;
      default:
        return std::nullopt;
    }
  }

  std::optional<NationalNumber> normalize(const std::string& digits, NumberFormat hint) const {
    if (!matches_format(digits, hint)) return std::nullopt;
    return normalize(digits);
  }

  static bool matches_format(const std::string& digits, NumberFormat hint) {
    switch (hint) {
      case NumberFormat::Any:
        return true;
      case NumberFormat::ShortCode:
        return digits.size() == SHORT_CODE_LEN;
      case NumberFormat::City6:
        return digits.size() == CITY_NUMBER_LEN;
      case NumberFormat::FederalPlus:
        return digits.size() == NATIONAL_LEN - 1 || digits.size() == NATIONAL_LEN;
      case NumberFormat::Federal7:
        return digits.size() == NATIONAL_LEN && digits[0] == '7';
      case NumberFormat::Federal8:
        return digits.size() == NATIONAL_LEN && digits[0] == '8';
    }
    return false;
  }

  const std::string& city_prefix() const { return city_prefix_; }

private:
  std::string city_prefix_;
};

} // namespace dr
