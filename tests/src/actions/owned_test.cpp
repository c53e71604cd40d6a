#include <gtest/gtest.h>
#include <kraken/actions/owned.hpp>
#include <kraken/policy/multisig.hpp>
#include <kraken/testing/account_fixture.hpp>
#include <kraken/testing/common.hpp>

#include <tuple>
#include <vector>

using kraken::schema::error_code;
using kraken::testing::abort_code_of;
using kraken::testing::account_fixture;
using kraken::testing::make_hash;

namespace multisig = kraken::policy::multisig;
namespace owned = kraken::actions::owned;

TEST(owned_actions, request_locks_every_object) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "w", "", {0},
                          10, {make_hash(1), make_hash(2)},
                          multisig::empty_outcome());
  EXPECT_TRUE(account.intents().is_locked(make_hash(1)));
  EXPECT_TRUE(account.intents().is_locked(make_hash(2)));
  EXPECT_EQ(account.intents().get("w").actions.size(), 2u);
}

TEST(owned_actions, second_intent_cannot_claim_locked_object) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "first", "",
                          {0}, 10, {make_hash(1)}, multisig::empty_outcome());
  EXPECT_EQ(abort_code_of([&] {
              owned::request_withdraw(fixture.auth(), account, fixture.ctx(),
                                      "second", "", {0}, 10, {make_hash(1)},
                                      multisig::empty_outcome());
            }),
            error_code::object_already_locked);
}

TEST(owned_actions, withdraw_returns_objects_and_releases_locks) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "w", "", {0},
                          10, {make_hash(1), make_hash(2)},
                          multisig::empty_outcome());
  multisig::approve_intent(account, "w", fixture.sender());

  auto executed =
      multisig::execute_intent(account, "w", account_fixture::clock(0));
  auto& token = std::get<0>(executed);
  auto received = std::vector<kraken::schema::object_id_t>{};
  received.push_back(owned::do_withdraw(token, account));
  received.push_back(owned::do_withdraw(token, account));
  owned::complete_withdraw(std::move(token), account);

  EXPECT_EQ(received, (std::vector<kraken::schema::object_id_t>{
                          make_hash(1), make_hash(2)}));
  EXPECT_FALSE(account.intents().contains("w"));
  EXPECT_TRUE(account.intents().locked().empty());
}

TEST(owned_actions, expired_withdraw_must_be_drained) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "w", "", {0},
                          10, {make_hash(1)}, multisig::empty_outcome());

  auto bag = account.delete_expired_intent("w", account_fixture::clock(10));
  EXPECT_EQ(abort_code_of([&] { kraken::account::destroy_empty(std::move(bag)); }),
            error_code::actions_not_empty);
}

TEST(owned_actions, delete_withdraw_releases_lock_for_reuse) {
  auto fixture = account_fixture{};
  auto& account = fixture.account();
  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "w", "", {0},
                          10, {make_hash(1)}, multisig::empty_outcome());

  auto bag = account.delete_expired_intent("w", account_fixture::clock(10));
  owned::delete_withdraw(bag, account);
  kraken::account::destroy_empty(std::move(bag));
  EXPECT_FALSE(account.intents().is_locked(make_hash(1)));

  owned::request_withdraw(fixture.auth(), account, fixture.ctx(), "w", "", {0},
                          10, {make_hash(1)}, multisig::empty_outcome());
  EXPECT_TRUE(account.intents().is_locked(make_hash(1)));
}
