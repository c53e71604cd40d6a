#pragma once
#include <kraken/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace kraken::blake3 {

kraken::schema::hash32_t hash(const std::string_view& str);
kraken::schema::hash32_t hash(const kraken::schema::bytes_view_t& bytes);

}  // namespace kraken::blake3
