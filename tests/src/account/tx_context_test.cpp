#include <gtest/gtest.h>
#include <kraken/account/tx_context.hpp>
#include <kraken/blake3/hash.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/testing/common.hpp>

#include <cstdint>
#include <set>
#include <tuple>

using kraken::account::tx_context;
using kraken::testing::make_address;
using kraken::testing::make_hash;

TEST(tx_context, fresh_ids_are_unique_within_a_transaction) {
  auto ctx = tx_context{make_address(1), 5, make_hash(7)};
  auto seen = std::set<kraken::schema::object_id_t>{};
  for (auto i = 0; i < 16; ++i) {
    EXPECT_TRUE(seen.insert(ctx.fresh_object_id()).second);
  }
}

TEST(tx_context, fresh_ids_follow_digest_and_counter) {
  auto first = tx_context{make_address(1), 5, make_hash(7)};
  auto replay = tx_context{make_address(2), 9, make_hash(7)};
  auto other = tx_context{make_address(1), 5, make_hash(8)};

  const auto id = first.fresh_object_id();
  EXPECT_EQ(replay.fresh_object_id(), id);
  EXPECT_NE(other.fresh_object_id(), id);

  auto encoder = kraken::schema::encoding::encoder<
      kraken::schema::encoding::scale_encoder_tag>{};
  const auto preimage = encoder.encode(std::tuple{make_hash(7), uint64_t{1}});
  EXPECT_EQ(first.fresh_object_id(),
            kraken::blake3::hash(kraken::schema::make_bytes_view(preimage)));
}

TEST(tx_context, clock_reports_transaction_time) {
  const auto ctx = tx_context{make_address(1), 1234, make_hash(7)};
  EXPECT_EQ(ctx.clock().timestamp_ms, 1234u);
  EXPECT_EQ(ctx.sender(), make_address(1));
  EXPECT_EQ(ctx.digest(), make_hash(7));
}
