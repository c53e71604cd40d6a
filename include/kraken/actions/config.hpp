#pragma once
#include <kraken/account/account.hpp>
#include <kraken/account/auth.hpp>
#include <kraken/account/deps.hpp>
#include <kraken/account/executable.hpp>
#include <kraken/account/expired.hpp>
#include <kraken/account/extensions.hpp>
#include <kraken/account/intents.hpp>
#include <kraken/account/metadata.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Intents that reconfigure the account itself: metadata, deps and whether
// unverified deps are accepted. Each comes with request_*, execute_* and
// delete_*; execute_* also drains the intent once its last occurrence ran.
namespace kraken::actions::config {

struct config_metadata_intent final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::config_metadata_intent"};
};

struct config_deps_intent final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::config_deps_intent"};
};

struct toggle_unverified_allowed_intent final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::toggle_unverified_allowed_intent"};
};

struct config_metadata_action final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::config_metadata_action"};

  std::vector<std::string> keys;
  std::vector<std::string> values;
};

struct config_deps_action final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::config_deps_action"};

  std::vector<std::string> names;
  std::vector<kraken::schema::address_t> addrs;
  std::vector<uint64_t> versions;
};

/// Flag value the account ends up with, captured when requested so the
/// intent flips it exactly once.
struct toggle_unverified_allowed_action final {
  static constexpr std::string_view kTypeName{
      "kraken::actions::config::toggle_unverified_allowed_action"};

  bool unverified_allowed{};
};

// metadata

template <typename PolicyTag>
void request_config_metadata(
    const kraken::account::auth_t& auth,
    kraken::account::account<PolicyTag>& account,
    kraken::account::tx_context& ctx,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    std::vector<std::string> keys,
    std::vector<std::string> values,
    typename kraken::account::account<PolicyTag>::outcome_t outcome) {
  // Rejects mismatched or duplicate keys up front.
  kraken::account::metadata::from_keys_values(keys, values);

  const auto version = kraken::account::account_protocol_version();
  auto intent = account.create_intent(
      auth, std::move(key), std::move(description), std::move(execution_times),
      expiration_time, "metadata", std::move(outcome), version,
      config_metadata_intent{}, ctx);
  kraken::account::add_action(
      intent,
      config_metadata_action{.keys = std::move(keys),
                             .values = std::move(values)},
      config_metadata_intent{});
  account.add_intent(std::move(intent), version, config_metadata_intent{});
}

inline void delete_config_metadata(kraken::account::expired& bag) {
  bag.remove_action<config_metadata_action>();
}

template <typename PolicyTag>
void execute_config_metadata(kraken::account::executable token,
                             kraken::account::account<PolicyTag>& account) {
  const auto version = kraken::account::account_protocol_version();
  auto action = account.template process_action<config_metadata_action>(
      token, version, config_metadata_intent{});
  account.metadata_mut(version) =
      kraken::account::metadata::from_keys_values(action.keys, action.values);
  spdlog::info("Replaced metadata of account {} ({} entries)",
               kraken::schema::to_string(account.addr()), action.keys.size());

  auto bag = account.confirm_execution(std::move(token), version,
                                       config_metadata_intent{});
  if (bag) {
    delete_config_metadata(*bag);
    kraken::account::destroy_empty(std::move(*bag));
  }
}

// deps

template <typename PolicyTag>
void request_config_deps(
    const kraken::account::auth_t& auth,
    kraken::account::account<PolicyTag>& account,
    kraken::account::tx_context& ctx,
    const kraken::account::extensions& extensions,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    std::vector<std::string> names,
    std::vector<kraken::schema::address_t> addrs,
    std::vector<uint64_t> versions,
    typename kraken::account::account<PolicyTag>::outcome_t outcome) {
  kraken::account::deps::create(extensions,
                                account.deps().unverified_allowed(), names,
                                addrs, versions);

  const auto version = kraken::account::account_protocol_version();
  auto intent = account.create_intent(
      auth, std::move(key), std::move(description), std::move(execution_times),
      expiration_time, "deps", std::move(outcome), version,
      config_deps_intent{}, ctx);
  kraken::account::add_action(
      intent,
      config_deps_action{.names = std::move(names),
                         .addrs = std::move(addrs),
                         .versions = std::move(versions)},
      config_deps_intent{});
  account.add_intent(std::move(intent), version, config_deps_intent{});
}

inline void delete_config_deps(kraken::account::expired& bag) {
  bag.remove_action<config_deps_action>();
}

/// The extensions registry may have changed since the request, entries are
/// checked against it again.
template <typename PolicyTag>
void execute_config_deps(kraken::account::executable token,
                         kraken::account::account<PolicyTag>& account,
                         const kraken::account::extensions& extensions) {
  const auto version = kraken::account::account_protocol_version();
  auto action = account.template process_action<config_deps_action>(
      token, version, config_deps_intent{});
  auto& deps = account.deps_mut(version);
  deps = kraken::account::deps::create(extensions, deps.unverified_allowed(),
                                       action.names, action.addrs,
                                       action.versions);
  spdlog::info("Replaced deps of account {} ({} entries)",
               kraken::schema::to_string(account.addr()), deps.length());

  auto bag = account.confirm_execution(std::move(token), version,
                                       config_deps_intent{});
  if (bag) {
    delete_config_deps(*bag);
    kraken::account::destroy_empty(std::move(*bag));
  }
}

// unverified deps

template <typename PolicyTag>
void request_toggle_unverified_allowed(
    const kraken::account::auth_t& auth,
    kraken::account::account<PolicyTag>& account,
    kraken::account::tx_context& ctx,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    typename kraken::account::account<PolicyTag>::outcome_t outcome) {
  const auto version = kraken::account::account_protocol_version();
  auto intent = account.create_intent(
      auth, std::move(key), std::move(description), std::move(execution_times),
      expiration_time, "toggle_unverified_allowed", std::move(outcome),
      version, toggle_unverified_allowed_intent{}, ctx);
  kraken::account::add_action(
      intent,
      toggle_unverified_allowed_action{
          .unverified_allowed = !account.deps().unverified_allowed()},
      toggle_unverified_allowed_intent{});
  account.add_intent(std::move(intent), version,
                     toggle_unverified_allowed_intent{});
}

inline void delete_toggle_unverified_allowed(kraken::account::expired& bag) {
  bag.remove_action<toggle_unverified_allowed_action>();
}

template <typename PolicyTag>
void execute_toggle_unverified_allowed(
    kraken::account::executable token,
    kraken::account::account<PolicyTag>& account) {
  const auto version = kraken::account::account_protocol_version();
  auto action =
      account.template process_action<toggle_unverified_allowed_action>(
          token, version, toggle_unverified_allowed_intent{});
  auto& deps = account.deps_mut(version);
  if (deps.unverified_allowed() != action.unverified_allowed) {
    deps.toggle_unverified_allowed();
  }

  auto bag = account.confirm_execution(std::move(token), version,
                                       toggle_unverified_allowed_intent{});
  if (bag) {
    delete_toggle_unverified_allowed(*bag);
    kraken::account::destroy_empty(std::move(*bag));
  }
}

}  // namespace kraken::actions::config
