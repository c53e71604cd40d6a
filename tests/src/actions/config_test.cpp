#include <gtest/gtest.h>
#include <kraken/account/packages.hpp>
#include <kraken/actions/config.hpp>
#include <kraken/policy/multisig.hpp>
#include <kraken/testing/account_fixture.hpp>
#include <kraken/testing/common.hpp>

#include <string>
#include <tuple>
#include <vector>

using kraken::account::kAccountActionsName;
using kraken::account::kAccountMultisigName;
using kraken::account::kAccountProtocolName;
using kraken::account::make_package_address;
using kraken::schema::error_code;
using kraken::testing::abort_code_of;
using kraken::testing::account_fixture;

namespace config = kraken::actions::config;
namespace multisig = kraken::policy::multisig;

namespace {

kraken::account::executable approve_and_execute(account_fixture& fixture,
                                                const std::string& key) {
  multisig::approve_intent(fixture.account(), key, fixture.sender());
  auto executed = multisig::execute_intent(fixture.account(), key,
                                           account_fixture::clock(0));
  return std::move(std::get<0>(executed));
}

}  // namespace

TEST(config_actions, metadata_intent_replaces_metadata) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  config::request_config_metadata(fixture.auth(), account, fixture.ctx(),
                                  "meta", "rename", {0}, 10, {"name", "url"},
                                  {"vault", "https://example.org"},
                                  multisig::empty_outcome());
  EXPECT_EQ(account.intents().get("meta").role,
            "kraken::actions::config::metadata");

  config::execute_config_metadata(approve_and_execute(fixture, "meta"),
                                  account);
  EXPECT_EQ(account.metadata().get("name").value_or(""), "vault");
  EXPECT_EQ(account.metadata().length(), 2u);
  EXPECT_FALSE(account.intents().contains("meta"));
}

TEST(config_actions, metadata_request_validates_entries) {
  auto fixture = account_fixture{};
  EXPECT_EQ(abort_code_of([&] {
              config::request_config_metadata(
                  fixture.auth(), fixture.account(), fixture.ctx(), "meta", "",
                  {0}, 10, {"name", "name"}, {"a", "b"},
                  multisig::empty_outcome());
            }),
            error_code::metadata_key_already_exists);
  EXPECT_FALSE(fixture.account().intents().contains("meta"));
}

TEST(config_actions, deps_intent_rebuilds_against_extensions) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  const auto names = std::vector<std::string>{
      std::string{kAccountProtocolName}, std::string{kAccountMultisigName},
      std::string{kAccountActionsName}, "Vault"};
  auto addrs = std::vector<kraken::schema::address_t>{
      make_package_address(kAccountProtocolName),
      make_package_address(kAccountMultisigName),
      make_package_address(kAccountActionsName),
      make_package_address("Vault")};

  EXPECT_EQ(abort_code_of([&] {
              config::request_config_deps(
                  fixture.auth(), account, fixture.ctx(), fixture.extensions(),
                  "deps", "", {0}, 10, names, addrs, {1, 1, 1, 1},
                  multisig::empty_outcome());
            }),
            error_code::not_extension);

  fixture.extensions().add(fixture.cap(), "Vault",
                           make_package_address("Vault"), 1);
  config::request_config_deps(fixture.auth(), account, fixture.ctx(),
                              fixture.extensions(), "deps", "", {0}, 10, names,
                              addrs, {1, 1, 1, 1}, multisig::empty_outcome());
  config::execute_config_deps(approve_and_execute(fixture, "deps"), account,
                              fixture.extensions());
  EXPECT_EQ(account.deps().length(), 4u);
  EXPECT_TRUE(account.deps().contains_name("Vault"));
}

TEST(config_actions, toggle_flips_unverified_allowed_once) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  EXPECT_FALSE(account.deps().unverified_allowed());
  config::request_toggle_unverified_allowed(fixture.auth(), account,
                                            fixture.ctx(), "toggle", "", {0},
                                            10, multisig::empty_outcome());
  config::execute_toggle_unverified_allowed(
      approve_and_execute(fixture, "toggle"), account);
  EXPECT_TRUE(account.deps().unverified_allowed());
}

TEST(config_actions, expired_intents_are_drained_by_their_module) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  config::request_config_metadata(fixture.auth(), account, fixture.ctx(),
                                  "meta", "", {0}, 10, {"name"}, {"x"},
                                  multisig::empty_outcome());
  config::request_toggle_unverified_allowed(fixture.auth(), account,
                                            fixture.ctx(), "toggle", "", {0},
                                            10, multisig::empty_outcome());

  auto meta = account.delete_expired_intent("meta", account_fixture::clock(10));
  EXPECT_EQ(abort_code_of([&] { config::delete_config_deps(meta); }),
            error_code::wrong_action_type);
  config::delete_config_metadata(meta);
  kraken::account::destroy_empty(std::move(meta));

  auto toggle =
      account.delete_expired_intent("toggle", account_fixture::clock(10));
  config::delete_toggle_unverified_allowed(toggle);
  kraken::account::destroy_empty(std::move(toggle));
  EXPECT_EQ(account.intents().length(), 0u);
}
