#include <blake3.h>
#include <kraken/blake3/hash.hpp>

namespace kraken::blake3 {

kraken::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<kraken::schema::hash32_t>);
  auto output = kraken::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

kraken::schema::hash32_t hash(const kraken::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = kraken::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace kraken::blake3
