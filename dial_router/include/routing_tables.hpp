#pragma once
#include "route_types.hpp"
#include <unordered_map>

namespace dr {

using NumberMap = std::unordered_map<NationalNumber, Extension>;
using TrunkMap = std::unordered_map<Extension, NationalNumber>;

// Read-only dial plan data: canonical number / short code -> extension,
// extension -> outbound trunk. Built once, then shared by reference.
class RoutingTables {
public:
  RoutingTables(NumberMap number_to_ext, TrunkMap ext_to_trunk)
      : number_to_ext_(std::move(number_to_ext)), ext_to_trunk_(std::move(ext_to_trunk)) {
    for (const auto& kv : number_to_ext_) {
      if (!all_digits(kv.first)) {
        throw std::invalid_argument("routing table key is not a digit string: '" + kv.first + "'");
      }
    }
    for (const auto& kv : ext_to_trunk_) {
      if (!all_digits(kv.second)) {
        throw std::invalid_argument("trunk for extension " + std::to_string(kv.first) +
                                    " is not a digit string: '" + kv.second + "'");
      }
    }
  }

  // compiled-in PBX plan
  static RoutingTables builtin() {
    NumberMap numbers{
      // DIDs and city lines
      {"79235253998", 501}, {"73843602313", 501},
      {"79235254061", 502}, {"73843601773", 502}, {"73843731773", 502},
      {"79235254150", 503},
      {"79235254132", 504}, {"73843602414", 504},
      {"79235254389", 505},
      {"79235254439", 506}, {"73843601771", 506},
      {"79235254667", 507}, {"73843600912", 507},
      {"79235254706", 508}, {"73843600911", 508}, {"73843731458", 508},
      {"79235255049", 509}, {"73843601331", 509}, {"73843731313", 509},
      {"79235255136", 510}, {"73843601221", 510}, {"73843731500", 510},
      // short codes
      {"104", 501},
      {"135", 502}, {"119", 502},
      {"111", 508},
      {"106", 509},
    };
    TrunkMap trunks{
      {501, "79235253998"},
      {502, "79235254061"},
      {503, "79235254150"},
      {504, "79235254132"},
      {505, "79235254389"},
      {506, "79235254439"},
      {507, "79235254667"},
      {508, "79235254706"},
      {509, "79235255049"},
      {510, "79235255136"},
    };
    return RoutingTables(std::move(numbers), std::move(trunks));
  }

  std::optional<Extension> lookup_extension(const NationalNumber& n) const {
    auto it = number_to_ext_.find(n);
    if (it == number_to_ext_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<NationalNumber> lookup_trunk(Extension ext) const {
    auto it = ext_to_trunk_.find(ext);
    if (it == ext_to_trunk_.end()) return std::nullopt;
    return it->second;
  }

  const NumberMap& numbers() const { return number_to_ext_; }
  const TrunkMap& trunks() const { return ext_to_trunk_; }

private:
  NumberMap number_to_ext_;
  TrunkMap ext_to_trunk_;
};

} // namespace dr
