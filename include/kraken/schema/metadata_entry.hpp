#pragma once
#include <string>

namespace kraken::schema {

template <uint16_t Version>
struct metadata_entry;

template <>
struct metadata_entry<1> final {
  std::string key;
  std::string value;

  bool operator==(const metadata_entry<1>&) const = default;
};

using metadata_entry_t = metadata_entry<1>;

}  // namespace kraken::schema
