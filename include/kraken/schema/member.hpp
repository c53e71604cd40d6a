#pragma once
#include <kraken/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: member.
// Multisig member: voting weight plus the roles it counts towards.
namespace kraken::schema {

template <uint16_t Version>
struct member;

template <>
struct member<1> final {
  address_t addr{};
  uint64_t weight{};
  std::vector<std::string> roles;

  bool operator==(const member<1>&) const = default;
};

using member_t = member<1>;

}  // namespace kraken::schema
