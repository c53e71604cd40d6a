#pragma once
#include <cstdint>
#include <string>

namespace kraken::schema {

template <uint16_t Version>
struct role_threshold;

template <>
struct role_threshold<1> final {
  std::string name;
  uint64_t threshold{};

  bool operator==(const role_threshold<1>&) const = default;
};

using role_threshold_t = role_threshold<1>;

}  // namespace kraken::schema
