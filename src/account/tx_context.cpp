#include <kraken/account/tx_context.hpp>
#include <kraken/blake3/hash.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace kraken::account {

tx_context::tx_context(const kraken::schema::address_t& sender,
                       const kraken::schema::timestamp_milliseconds_t timestamp_ms,
                       const kraken::schema::hash32_t& digest)
    : sender_{sender}, timestamp_ms_{timestamp_ms}, digest_{digest} {}

kraken::schema::object_id_t tx_context::fresh_object_id() {
  auto encoder = kraken::schema::encoding::encoder<
      kraken::schema::encoding::scale_encoder_tag>{};
  const auto preimage = encoder.encode(std::tuple{digest_, ids_created_++});
  return kraken::blake3::hash(kraken::schema::make_bytes_view(preimage));
}

}  // namespace kraken::account
