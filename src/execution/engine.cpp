#include <kraken/blake3/hash.hpp>
#include <kraken/execution/engine.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <tuple>

namespace kraken::execution {

kraken::schema::hash32_t fold_state_root(const kraken::schema::hash32_t& seed,
                                         const kraken::schema::bytes_t& material,
                                         const int64_t height,
                                         const uint64_t index) {
  auto preimage = kraken::schema::bytes_t{};
  preimage.reserve(seed.size() + material.size() + 16);
  preimage.insert(std::end(preimage), std::begin(seed), std::end(seed));
  preimage.insert(std::end(preimage), std::begin(material), std::end(material));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  preimage.insert(std::end(preimage), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return kraken::blake3::hash(
      kraken::schema::bytes_view_t{preimage.data(), preimage.size()});
}

kraken::schema::hash32_t make_transaction_digest(
    const kraken::schema::hash32_t& chain_id,
    const int64_t height,
    const uint64_t index,
    const kraken::schema::address_t& sender) {
  auto encoder = encoder_t{};
  auto preimage = encoder.encode(std::tuple{chain_id, height, index, sender});
  return kraken::blake3::hash(
      kraken::schema::bytes_view_t{preimage.data(), preimage.size()});
}

kraken::schema::transaction_result_t make_abort_result(
    const kraken::common::abort_error& error,
    const std::string_view codespace) {
  auto result = kraken::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(error.code());
  result.log = std::string{kraken::schema::to_string(error.code())};
  result.info = error.what();
  result.codespace = std::string{codespace};
  return result;
}

kraken::schema::transaction_result_t make_missing_account_result(
    const kraken::schema::address_t& account_id,
    const std::string_view codespace) {
  auto result = kraken::schema::transaction_result_t{};
  result.code =
      static_cast<uint32_t>(kraken::schema::error_code::account_missing);
  result.log = std::string{
      kraken::schema::to_string(kraken::schema::error_code::account_missing)};
  result.info = fmt::format("account {} does not exist",
                            kraken::schema::to_string(account_id));
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace kraken::execution
