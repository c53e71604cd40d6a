#pragma once

#include <kraken/account/account.hpp>
#include <kraken/account/expired.hpp>
#include <kraken/account/extensions.hpp>
#include <kraken/account/intents.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/policy/multisig.hpp>
#include <kraken/testing/common.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kraken::testing {

struct test_intent final {
  static constexpr std::string_view kTypeName{"kraken::testing::test_intent"};
};

struct other_intent final {
  static constexpr std::string_view kTypeName{"kraken::testing::other_intent"};
};

struct test_action final {
  static constexpr std::string_view kTypeName{"kraken::testing::test_action"};

  uint64_t value{};
};

struct other_action final {
  static constexpr std::string_view kTypeName{"kraken::testing::other_action"};

  uint64_t value{};
};

using multisig_account_t = kraken::policy::multisig::account_t;
using intent_t = multisig_account_t::intent_t;

inline std::pair<kraken::account::extensions, kraken::account::admin_cap>
make_core_extensions() {
  auto registry = kraken::account::extensions::create();
  registry.first.init_core_deps(
      registry.second,
      {kraken::account::make_package_address(
           kraken::account::kAccountProtocolName),
       kraken::account::make_package_address(
           kraken::account::kAccountMultisigName),
       kraken::account::make_package_address(
           kraken::account::kAccountActionsName)});
  return registry;
}

/// Multisig account whose only member is `sender()`, weight 1, global
/// threshold 1, plus the extensions registry it was built against.
class account_fixture final {
 public:
  explicit account_fixture(const uint8_t seed = 1)
      : registry_{make_core_extensions()},
        ctx_{make_address(seed), 0, make_hash(static_cast<uint8_t>(100 + seed))},
        account_{kraken::policy::multisig::new_account(registry_.first, ctx_,
                                                       "treasury")} {}

  const kraken::schema::address_t& sender() const { return ctx_.sender(); }
  kraken::account::extensions& extensions() { return registry_.first; }
  const kraken::account::admin_cap& cap() const { return registry_.second; }
  kraken::account::tx_context& ctx() { return ctx_; }
  multisig_account_t& account() { return account_; }

  kraken::account::auth_t auth() const {
    return kraken::policy::multisig::authenticate(account_, ctx_.sender());
  }

  void set_time(const kraken::schema::timestamp_milliseconds_t ms) {
    ctx_ = kraken::account::tx_context{ctx_.sender(), ms, ctx_.digest()};
  }

  static kraken::schema::block_clock clock(
      const kraken::schema::timestamp_milliseconds_t ms) {
    return kraken::schema::block_clock{.timestamp_ms = ms};
  }

  intent_t make_intent(
      std::string key,
      std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
      const kraken::schema::timestamp_milliseconds_t expiration_time) {
    return account_.create_intent(
        auth(), std::move(key), "test intent", std::move(execution_times),
        expiration_time, "test", kraken::policy::multisig::empty_outcome(),
        kraken::account::account_actions_version(), test_intent{}, ctx_);
  }

  /// Add an intent carrying one `test_action` per value, approved by
  /// `sender()`.
  void propose(std::string key,
               std::vector<kraken::schema::timestamp_milliseconds_t> times,
               const kraken::schema::timestamp_milliseconds_t expiration_time,
               const std::vector<uint64_t>& values) {
    auto intent = make_intent(key, std::move(times), expiration_time);
    for (auto value : values) {
      kraken::account::add_action(intent, test_action{.value = value},
                                  test_intent{});
    }
    account_.add_intent(std::move(intent),
                        kraken::account::account_actions_version(),
                        test_intent{});
    kraken::policy::multisig::approve_intent(account_, key, sender());
  }

  static void drain(kraken::account::expired& bag) {
    while (!bag.empty()) {
      bag.remove_action<test_action>();
    }
  }

 private:
  std::pair<kraken::account::extensions, kraken::account::admin_cap> registry_;
  kraken::account::tx_context ctx_;
  multisig_account_t account_;
};

}  // namespace kraken::testing
