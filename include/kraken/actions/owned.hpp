#pragma once
#include <kraken/account/account.hpp>
#include <kraken/account/auth.hpp>
#include <kraken/account/executable.hpp>
#include <kraken/account/expired.hpp>
#include <kraken/account/intents.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Withdrawal of objects owned by the account. Requesting locks every object
// so no other pending intent can claim it; the lock is released when the
// intent is drained, after execution or expiry.
namespace kraken::actions::owned {

struct withdraw_intent final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::owned::withdraw_intent"};
};

struct withdraw_action final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::owned::withdraw_action"};

  kraken::schema::object_id_t object_id{};
};

template <typename PolicyTag>
void request_withdraw(
    const kraken::account::auth_t& auth,
    kraken::account::account<PolicyTag>& account,
    kraken::account::tx_context& ctx,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    const std::vector<kraken::schema::object_id_t>& object_ids,
    typename kraken::account::account<PolicyTag>::outcome_t outcome) {
  const auto version = kraken::account::account_protocol_version();
  auto intent = account.create_intent(
      auth, std::move(key), std::move(description), std::move(execution_times),
      expiration_time, "withdraw", std::move(outcome), version,
      withdraw_intent{}, ctx);
  for (const auto& id : object_ids) {
    account.lock_object(intent, id, version, withdraw_intent{});
    kraken::account::add_action(intent, withdraw_action{.object_id = id},
                                withdraw_intent{});
  }
  account.add_intent(std::move(intent), version, withdraw_intent{});
}

/// Process the next withdrawal and return the object the host must hand
/// over.
template <typename PolicyTag>
kraken::schema::object_id_t do_withdraw(
    kraken::account::executable& token,
    kraken::account::account<PolicyTag>& account) {
  auto action = account.template process_action<withdraw_action>(
      token, kraken::account::account_protocol_version(), withdraw_intent{});
  spdlog::debug("Withdrawing object {} from account {}",
                kraken::schema::to_string(action.object_id),
                kraken::schema::to_string(account.addr()));
  return action.object_id;
}

/// Pop one withdrawal from a drained intent and release its lock.
template <typename PolicyTag>
void delete_withdraw(kraken::account::expired& bag,
                     kraken::account::account<PolicyTag>& account) {
  auto action = bag.remove_action<withdraw_action>();
  account.unlock_object(bag, action.object_id,
                        kraken::account::account_protocol_version());
}

/// Confirm a fully processed withdraw intent and release its locks once the
/// intent leaves the registry.
template <typename PolicyTag>
void complete_withdraw(kraken::account::executable token,
                       kraken::account::account<PolicyTag>& account) {
  auto bag = account.confirm_execution(
      std::move(token), kraken::account::account_protocol_version(),
      withdraw_intent{});
  if (!bag) {
    return;
  }
  while (!bag->empty()) {
    delete_withdraw(*bag, account);
  }
  kraken::account::destroy_empty(std::move(*bag));
}

}  // namespace kraken::actions::owned
