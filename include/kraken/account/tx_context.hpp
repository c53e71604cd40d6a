#pragma once
#include <kraken/schema/primitives.hpp>
#include <cstdint>

namespace kraken::account {

/// Host supplied context of the running transaction.
class tx_context final {
 public:
  tx_context(const kraken::schema::address_t& sender,
             kraken::schema::timestamp_milliseconds_t timestamp_ms,
             const kraken::schema::hash32_t& digest);

  const kraken::schema::address_t& sender() const { return sender_; }
  kraken::schema::timestamp_milliseconds_t timestamp_ms() const {
    return timestamp_ms_;
  }
  const kraken::schema::hash32_t& digest() const { return digest_; }
  kraken::schema::block_clock clock() const {
    return kraken::schema::block_clock{.timestamp_ms = timestamp_ms_};
  }

  /// BLAKE3(SCALE(digest, counter)) with a per-transaction counter, unique for
  /// every call inside the transaction.
  kraken::schema::object_id_t fresh_object_id();

 private:
  kraken::schema::address_t sender_;
  kraken::schema::timestamp_milliseconds_t timestamp_ms_;
  kraken::schema::hash32_t digest_;
  uint64_t ids_created_{};
};

}  // namespace kraken::account
