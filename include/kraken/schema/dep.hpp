#pragma once
#include <kraken/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: dep.
// Package an account is allowed to be called from, pinned at a version.
namespace kraken::schema {

template <uint16_t Version>
struct dep;

template <>
struct dep<1> final {
  std::string name;
  address_t addr{};
  uint64_t version{};

  bool operator==(const dep<1>&) const = default;
};

using dep_t = dep<1>;

template <uint16_t Version>
struct deps_state;

template <>
struct deps_state<1> final {
  std::vector<dep_t> inner;
  bool unverified_allowed{false};
};

using deps_state_t = deps_state<1>;

}  // namespace kraken::schema
