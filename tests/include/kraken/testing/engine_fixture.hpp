#pragma once

#include <gtest/gtest.h>
#include <kraken/account/extensions.hpp>
#include <kraken/execution/engine.hpp>
#include <kraken/policy/multisig.hpp>
#include <kraken/schema/primitives.hpp>
#include <kraken/storage/rocksdb/storage.hpp>
#include <kraken/testing/account_fixture.hpp>
#include <kraken/testing/common.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace kraken::testing {

using multisig_engine_t =
    kraken::execution::engine<kraken::policy::multisig_policy_tag>;

/// Multisig engine over a fresh RocksDB directory, removed on destruction.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{kraken::storage::make_storage<
            kraken::storage::rocksdb_storage_tag>(db_path_)},
        registry_{make_core_extensions()},
        engine_{encoder_, storage_, make_hash(77)} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  kraken::execution::encoder_t& encoder() { return encoder_; }
  kraken::execution::storage_t& storage() { return storage_; }
  kraken::account::extensions& extensions() { return registry_.first; }
  multisig_engine_t& engine() { return engine_; }

  /// Create a multisig account owned by `sender` and return its id.
  kraken::schema::address_t create_multisig(
      const kraken::schema::address_t& sender,
      const std::string_view name) {
    auto result = engine_.create_account(
        sender, [&](kraken::account::tx_context& ctx) {
          return kraken::policy::multisig::new_account(registry_.first, ctx,
                                                       name);
        });
    EXPECT_TRUE(result.ok()) << result.info;
    return kraken::schema::make_hash32(result.data);
  }

 private:
  std::string db_path_;
  kraken::execution::encoder_t encoder_;
  kraken::execution::storage_t storage_;
  std::pair<kraken::account::extensions, kraken::account::admin_cap> registry_;
  multisig_engine_t engine_;
};

}  // namespace kraken::testing
