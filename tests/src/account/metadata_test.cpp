#include <gtest/gtest.h>
#include <kraken/account/metadata.hpp>
#include <kraken/testing/common.hpp>

using kraken::schema::error_code;
using kraken::testing::abort_code_of;

TEST(metadata, from_keys_values_keeps_order) {
  auto metadata =
      kraken::account::metadata::from_keys_values({"name", "url"}, {"a", "b"});
  ASSERT_EQ(metadata.length(), 2u);
  EXPECT_EQ(metadata.entries()[0].key, "name");
  EXPECT_EQ(metadata.entries()[1].value, "b");
  EXPECT_EQ(metadata.get("url").value_or(""), "b");
  EXPECT_FALSE(metadata.get("missing").has_value());
}

TEST(metadata, from_keys_values_rejects_bad_input) {
  EXPECT_EQ(abort_code_of([] {
              kraken::account::metadata::from_keys_values({"name"}, {});
            }),
            error_code::metadata_not_same_length);
  EXPECT_EQ(abort_code_of([] {
              kraken::account::metadata::from_keys_values({"name", "name"},
                                                          {"a", "b"});
            }),
            error_code::metadata_key_already_exists);
}
