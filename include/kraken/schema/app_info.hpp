#pragma once

#include <kraken/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace kraken::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"kraken-accounts"};
  std::string version{"0.1.0"};
  int64_t last_block_height{};
  hash32_t last_block_state_root{};
  uint64_t account_count{};
};

using app_info_t = app_info<1>;

}  // namespace kraken::schema
