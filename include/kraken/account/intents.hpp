#pragma once
#include <kraken/account/expired.hpp>
#include <kraken/account/issuer.hpp>
#include <kraken/account/witness.hpp>
#include <kraken/common/error.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/schema/intent_state.hpp>
#include <kraken/schema/primitives.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kraken::account {

/// Build an intent that is not yet visible in any registry. Execution times
/// must be present and strictly ascending.
template <typename Outcome>
kraken::schema::intent_state<Outcome> new_intent(
    kraken::schema::issuer_t issuer,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    std::string role,
    Outcome outcome,
    const kraken::schema::address_t& creator,
    const kraken::schema::timestamp_milliseconds_t creation_time) {
  using kraken::schema::error_code;
  if (execution_times.empty()) {
    kraken::common::fail(
        error_code::no_execution_time,
        fmt::format("intent '{}' has no execution time", key));
  }
  for (std::size_t i = 1; i < execution_times.size(); ++i) {
    if (execution_times[i - 1] >= execution_times[i]) {
      kraken::common::fail(
          error_code::execution_times_not_ascending,
          fmt::format("intent '{}' execution time {} is not after {}", key,
                      execution_times[i], execution_times[i - 1]));
    }
  }

  return kraken::schema::intent_state<Outcome>{
      .issuer = std::move(issuer),
      .key = std::move(key),
      .description = std::move(description),
      .creator = creator,
      .creation_time = creation_time,
      .execution_times = std::move(execution_times),
      .expiration_time = expiration_time,
      .role = std::move(role),
      .actions = {},
      .outcome = std::move(outcome)};
}

/// Append an action at the next index. Only the witness that issued the
/// intent may add to it.
template <typename Outcome, typename Action, typename Witness>
void add_action(kraken::schema::intent_state<Outcome>& intent,
                const Action& action,
                const Witness& witness) {
  assert_is_intent(intent.issuer, witness);
  auto encoder = kraken::schema::encoding::encoder<
      kraken::schema::encoding::scale_encoder_tag>{};
  intent.actions.push_back(kraken::schema::action_t{
      .type = std::string{type_name<Action>()},
      .payload = encoder.encode(action)});
}

/// Remove and return the earliest scheduled time.
template <typename Outcome>
kraken::schema::timestamp_milliseconds_t pop_front_execution_time(
    kraken::schema::intent_state<Outcome>& intent) {
  if (intent.execution_times.empty()) {
    kraken::common::fail(
        kraken::schema::error_code::no_execution_time,
        fmt::format("intent '{}' has no execution time left", intent.key));
  }
  auto front = intent.execution_times.front();
  intent.execution_times.erase(std::begin(intent.execution_times));
  return front;
}

/// Live intents of one account and the objects they hold locked.
///
/// Only guarantees key uniqueness, append-only actions and lock exclusivity.
/// Time based gating belongs to the account.
template <typename Outcome>
class intents final {
 public:
  using intent_t = kraken::schema::intent_state<Outcome>;
  using state_t = kraken::schema::intents_state<Outcome>;

  intents() = default;
  explicit intents(state_t state) : state_{std::move(state)} {}

  const state_t& state() const { return state_; }
  uint64_t length() const { return state_.inner.size(); }
  const std::vector<kraken::schema::object_id_t>& locked() const {
    return state_.locked;
  }

  bool contains(const std::string_view key) const {
    return find(key) != std::end(state_.inner);
  }

  const intent_t& get(const std::string_view key) const {
    auto it = find(key);
    if (it == std::end(state_.inner)) {
      not_found(key);
    }
    return *it;
  }

  intent_t& get_mut(const std::string_view key) {
    auto it = find(key);
    if (it == std::end(state_.inner)) {
      not_found(key);
    }
    return *it;
  }

  void add_intent(intent_t intent) {
    if (contains(intent.key)) {
      kraken::common::fail(
          kraken::schema::error_code::key_already_exists,
          fmt::format("intent '{}' already exists", intent.key));
    }
    state_.inner.push_back(std::move(intent));
  }

  expired destroy(const std::string_view key) {
    auto it = find(key);
    if (it == std::end(state_.inner)) {
      not_found(key);
    }
    auto intent = std::move(*it);
    state_.inner.erase(it);
    return expired{std::move(intent.key), std::move(intent.issuer),
                   std::move(intent.actions)};
  }

  bool is_locked(const kraken::schema::object_id_t& id) const {
    return std::binary_search(std::begin(state_.locked),
                              std::end(state_.locked), id);
  }

  void lock(const kraken::schema::object_id_t& id) {
    auto it = std::lower_bound(std::begin(state_.locked),
                               std::end(state_.locked), id);
    if (it != std::end(state_.locked) && *it == id) {
      kraken::common::fail(
          kraken::schema::error_code::object_already_locked,
          fmt::format("object {} is already locked",
                      kraken::schema::to_string(id)));
    }
    state_.locked.insert(it, id);
    spdlog::debug("Locked object {}", kraken::schema::to_string(id));
  }

  void unlock(const kraken::schema::object_id_t& id) {
    auto it = std::lower_bound(std::begin(state_.locked),
                               std::end(state_.locked), id);
    if (it == std::end(state_.locked) || *it != id) {
      kraken::common::fail(kraken::schema::error_code::object_not_locked,
                           fmt::format("object {} is not locked",
                                       kraken::schema::to_string(id)));
    }
    state_.locked.erase(it);
    spdlog::debug("Unlocked object {}", kraken::schema::to_string(id));
  }

 private:
  auto find(const std::string_view key) const {
    return std::find_if(
        std::begin(state_.inner), std::end(state_.inner),
        [&](const intent_t& intent) { return intent.key == key; });
  }

  auto find(const std::string_view key) {
    return std::find_if(
        std::begin(state_.inner), std::end(state_.inner),
        [&](const intent_t& intent) { return intent.key == key; });
  }

  [[noreturn]] static void not_found(const std::string_view key) {
    kraken::common::fail(kraken::schema::error_code::intent_not_found,
                         fmt::format("intent '{}' not found", key));
  }

  state_t state_;
};

}  // namespace kraken::account
