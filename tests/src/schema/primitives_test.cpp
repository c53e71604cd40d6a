#include <gtest/gtest.h>
#include <kraken/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = kraken::schema::bytes_t(32, 0xAB);
  auto hash = kraken::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = kraken::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(kraken::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(kraken::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = kraken::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = kraken::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = kraken::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(kraken::schema::from_hex(encoded), payload);
  EXPECT_FALSE(kraken::schema::try_from_hex("abc").has_value());
}

TEST(primitives, address_to_string_is_prefixed_hex) {
  auto address = kraken::schema::address_t{};
  address[0] = 0xAB;
  auto text = kraken::schema::to_string(address);
  EXPECT_EQ(text.size(), 66u);
  EXPECT_EQ(text.substr(0, 4), "0xab");
}
