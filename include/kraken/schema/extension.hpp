#pragma once
#include <kraken/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: extension.
// Allow-list entry: a package name and every (address, version) it was
// published under, oldest first.
namespace kraken::schema {

struct extension_release_t final {
  address_t addr{};
  uint64_t version{};
};

template <uint16_t Version>
struct extension;

template <>
struct extension<1> final {
  std::string name;
  std::vector<extension_release_t> history;
};

using extension_t = extension<1>;

}  // namespace kraken::schema
