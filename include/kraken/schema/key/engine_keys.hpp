#pragma once

#include <kraken/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for committed engine state.
namespace kraken::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};

template <typename Encoder, typename T>
kraken::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
kraken::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
kraken::schema::bytes_t make_account_key(
    Encoder& encoder,
    const kraken::schema::address_t& account_id) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, account_id);
}

}  // namespace kraken::schema::key
