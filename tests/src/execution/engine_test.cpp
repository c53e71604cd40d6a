#include <gtest/gtest.h>
#include <kraken/actions/owned.hpp>
#include <kraken/execution/engine.hpp>
#include <kraken/policy/multisig.hpp>
#include <kraken/testing/common.hpp>
#include <kraken/testing/engine_fixture.hpp>

#include <tuple>
#include <vector>

using kraken::schema::error_code;
using kraken::testing::engine_fixture;
using kraken::testing::make_address;
using kraken::testing::make_hash;
using kraken::testing::multisig_account_t;

namespace multisig = kraken::policy::multisig;
namespace owned = kraken::actions::owned;

namespace {

kraken::schema::transaction_result_t request_withdraw(
    engine_fixture& fixture,
    const kraken::schema::address_t& account_id,
    const kraken::schema::address_t& sender,
    const std::string& key,
    const std::vector<kraken::schema::object_id_t>& objects) {
  return fixture.engine().transact(
      account_id, sender,
      [&](multisig_account_t& account, kraken::account::tx_context& ctx) {
        owned::request_withdraw(multisig::authenticate(account, ctx.sender()),
                                account, ctx, key, "withdraw", {0}, 1000,
                                objects, multisig::empty_outcome());
      });
}

}  // namespace

TEST(engine, create_account_returns_new_id) {
  auto fixture = engine_fixture{"kraken_engine_create"};
  fixture.engine().begin_block(1, 0);
  const auto id = fixture.create_multisig(make_address(1), "treasury");

  auto account = fixture.engine().find_account(id);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->addr(), id);
  EXPECT_EQ(account->metadata().get("name").value_or(""), "treasury");
  EXPECT_EQ(fixture.engine().info().account_count, 1u);

  // A second account in the same block gets a distinct id.
  const auto other = fixture.create_multisig(make_address(1), "payroll");
  EXPECT_NE(other, id);
}

TEST(engine, create_account_reports_abort) {
  auto fixture = engine_fixture{"kraken_engine_create_abort"};
  fixture.engine().begin_block(1, 0);
  auto empty_registry = kraken::account::extensions::create();
  auto result = fixture.engine().create_account(
      make_address(1), [&](kraken::account::tx_context& ctx) {
        return multisig::new_account(empty_registry.first, ctx, "treasury");
      });
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error(), error_code::not_extension);
  EXPECT_EQ(result.codespace, "kraken.create_account");
  EXPECT_EQ(fixture.engine().info().account_count, 0u);
}

TEST(engine, transact_on_unknown_account_fails) {
  auto fixture = engine_fixture{"kraken_engine_unknown"};
  auto result = fixture.engine().transact(
      make_address(9), make_address(1),
      [](multisig_account_t&, kraken::account::tx_context&) {});
  EXPECT_EQ(result.error(), error_code::account_missing);
  EXPECT_EQ(result.log, "account_missing");
}

TEST(engine, aborted_transaction_leaves_no_partial_state) {
  auto fixture = engine_fixture{"kraken_engine_rollback"};
  fixture.engine().begin_block(1, 0);
  const auto id = fixture.create_multisig(make_address(1), "treasury");

  // Locks the first object, then fails on the duplicate.
  auto result = request_withdraw(fixture, id, make_address(1), "w",
                                 {make_hash(1), make_hash(1)});
  EXPECT_EQ(result.error(), error_code::object_already_locked);
  EXPECT_EQ(result.log, "object_already_locked");

  auto account = fixture.engine().find_account(id);
  ASSERT_TRUE(account.has_value());
  EXPECT_FALSE(account->intents().contains("w"));
  EXPECT_FALSE(account->intents().is_locked(make_hash(1)));
}

TEST(engine, non_member_cannot_propose) {
  auto fixture = engine_fixture{"kraken_engine_non_member"};
  fixture.engine().begin_block(1, 0);
  const auto id = fixture.create_multisig(make_address(1), "treasury");
  auto result =
      request_withdraw(fixture, id, make_address(2), "w", {make_hash(1)});
  EXPECT_EQ(result.error(), error_code::not_member);
}

TEST(engine, withdraw_lifecycle_across_transactions) {
  auto fixture = engine_fixture{"kraken_engine_withdraw"};
  auto& engine = fixture.engine();
  engine.begin_block(1, 0);
  const auto owner = make_address(1);
  const auto id = fixture.create_multisig(owner, "treasury");
  ASSERT_TRUE(request_withdraw(fixture, id, owner, "w", {make_hash(1)}).ok());

  ASSERT_TRUE(engine
                  .transact(id, owner,
                            [](multisig_account_t& account,
                               kraken::account::tx_context& ctx) {
                              multisig::approve_intent(account, "w",
                                                       ctx.sender());
                            })
                  .ok());

  auto received = std::vector<kraken::schema::object_id_t>{};
  engine.begin_block(2, 5);
  auto executed = engine.transact(
      id, owner,
      [&](multisig_account_t& account, kraken::account::tx_context& ctx) {
        auto result = multisig::execute_intent(account, "w", ctx.clock());
        auto& token = std::get<0>(result);
        received.push_back(owned::do_withdraw(token, account));
        owned::complete_withdraw(std::move(token), account);
      });
  ASSERT_TRUE(executed.ok()) << executed.info;
  EXPECT_EQ(received,
            (std::vector<kraken::schema::object_id_t>{make_hash(1)}));

  auto account = engine.find_account(id);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->intents().length(), 0u);
  EXPECT_TRUE(account->intents().locked().empty());
}

TEST(engine, commit_persists_accounts_and_state_root) {
  auto fixture = engine_fixture{"kraken_engine_commit"};
  auto id = kraken::schema::address_t{};
  auto committed = kraken::schema::commit_result_t{};
  {
    auto& engine = fixture.engine();
    engine.begin_block(1, 0);
    id = fixture.create_multisig(make_address(1), "treasury");
    ASSERT_TRUE(
        request_withdraw(fixture, id, make_address(1), "w", {make_hash(4)})
            .ok());
    committed = engine.commit();
    EXPECT_EQ(committed.committed_height, 1);
    EXPECT_EQ(committed.accounts_written, 1u);
    EXPECT_NE(committed.state_root, kraken::schema::make_zero_hash());
  }

  auto reloaded = kraken::testing::multisig_engine_t{
      fixture.encoder(), fixture.storage(), make_hash(77)};
  auto info = reloaded.info();
  EXPECT_EQ(info.last_block_height, 1);
  EXPECT_EQ(info.last_block_state_root, committed.state_root);
  EXPECT_EQ(info.account_count, 1u);

  auto account = reloaded.find_account(id);
  ASSERT_TRUE(account.has_value());
  ASSERT_TRUE(account->intents().contains("w"));
  EXPECT_TRUE(account->intents().is_locked(make_hash(4)));
  EXPECT_EQ(account->metadata().get("name").value_or(""), "treasury");
}

TEST(engine, failed_transactions_do_not_move_state_root) {
  auto fixture = engine_fixture{"kraken_engine_root"};
  auto& engine = fixture.engine();
  engine.begin_block(1, 0);
  const auto id = fixture.create_multisig(make_address(1), "treasury");
  const auto first = engine.commit();

  engine.begin_block(2, 0);
  auto failed =
      request_withdraw(fixture, id, make_address(2), "w", {make_hash(1)});
  EXPECT_FALSE(failed.ok());
  const auto second = engine.commit();
  EXPECT_EQ(second.state_root, first.state_root);
  EXPECT_EQ(second.accounts_written, 0u);

  engine.begin_block(3, 0);
  ASSERT_TRUE(
      request_withdraw(fixture, id, make_address(1), "w", {make_hash(1)}).ok());
  const auto third = engine.commit();
  EXPECT_NE(third.state_root, second.state_root);
  EXPECT_EQ(third.committed_height, 3);
}

TEST(engine, transaction_can_call_back_into_engine) {
  auto fixture = engine_fixture{"kraken_engine_reentrant"};
  auto& engine = fixture.engine();
  engine.begin_block(1, 0);
  const auto owner = make_address(1);
  const auto id = fixture.create_multisig(owner, "treasury");

  auto seen_accounts = uint64_t{};
  auto result = engine.transact(
      id, owner,
      [&](multisig_account_t& account, kraken::account::tx_context&) {
        seen_accounts = engine.info().account_count;
        auto live = engine.find_account(id);
        ASSERT_TRUE(live.has_value());
        EXPECT_EQ(live->addr(), account.addr());
      });
  EXPECT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(seen_accounts, 1u);
}

TEST(engine, nested_transaction_on_same_account_wins) {
  auto fixture = engine_fixture{"kraken_engine_nested"};
  auto& engine = fixture.engine();
  engine.begin_block(1, 0);
  const auto owner = make_address(1);
  const auto id = fixture.create_multisig(owner, "treasury");

  auto inner = kraken::schema::transaction_result_t{};
  auto outer = engine.transact(
      id, owner,
      [&](multisig_account_t& account, kraken::account::tx_context& ctx) {
        owned::request_withdraw(multisig::authenticate(account, ctx.sender()),
                                account, ctx, "outer", "withdraw", {0}, 1000,
                                {make_hash(1)}, multisig::empty_outcome());
        inner = request_withdraw(fixture, id, owner, "inner", {make_hash(2)});
      });
  EXPECT_TRUE(inner.ok()) << inner.info;
  EXPECT_EQ(outer.error(), error_code::account_changed);

  auto account = engine.find_account(id);
  ASSERT_TRUE(account.has_value());
  EXPECT_TRUE(account->intents().contains("inner"));
  EXPECT_FALSE(account->intents().contains("outer"));
  EXPECT_FALSE(account->intents().is_locked(make_hash(1)));
}
