#pragma once
#include <kraken/account/account.hpp>
#include <kraken/account/auth.hpp>
#include <kraken/account/executable.hpp>
#include <kraken/account/expired.hpp>
#include <kraken/account/extensions.hpp>
#include <kraken/account/policy.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/schema/approvals.hpp>
#include <kraken/schema/member.hpp>
#include <kraken/schema/multisig_config.hpp>
#include <kraken/schema/primitives.hpp>
#include <kraken/schema/role_threshold.hpp>

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace kraken::policy {

struct multisig_policy_tag {};

}  // namespace kraken::policy

namespace kraken::account {

template <>
struct policy<kraken::policy::multisig_policy_tag> final {
  using config_t = kraken::schema::multisig_config_t;
  using outcome_t = kraken::schema::approvals_t;

  static constexpr std::string_view kModuleName{"kraken::policy::multisig"};

  /// Approved when the global threshold is met, or when the intent role has a
  /// threshold and the approving role holders meet it.
  static bool validate(const outcome_t& outcome,
                       const config_t& config,
                       std::string_view role);

  /// Fails with `not_member` unless the sender is listed in the config.
  static auth_t authenticate(
      const account<kraken::policy::multisig_policy_tag>& account,
      const kraken::schema::address_t& sender);
};

}  // namespace kraken::account

// Weighted multisig, the reference policy shipped with the framework.
namespace kraken::policy::multisig {

using account_t = kraken::account::account<multisig_policy_tag>;

struct config_witness final {
  static constexpr std::string_view kTypeName{
      "kraken::policy::multisig::config_witness"};
};

struct config_multisig_intent final {
  static constexpr std::string_view kTypeName{
      "kraken::policy::multisig::config_multisig_intent"};
};

/// Replaces members and thresholds of the account.
struct config_multisig_action final {
  static constexpr std::string_view kTypeName{
      "kraken::policy::multisig::config_multisig_action"};

  kraken::schema::multisig_config_t config;
};

/// Account whose creator is the sole member with weight 1 and a global
/// threshold of 1. Deps are the latest core extensions.
account_t new_account(const kraken::account::extensions& extensions,
                      kraken::account::tx_context& ctx,
                      std::string_view name);

kraken::account::auth_t authenticate(const account_t& account,
                                     const kraken::schema::address_t& sender);

kraken::schema::approvals_t empty_outcome();

void approve_intent(account_t& account,
                    std::string_view key,
                    const kraken::schema::address_t& sender);

void disapprove_intent(account_t& account,
                       std::string_view key,
                       const kraken::schema::address_t& sender);

std::tuple<kraken::account::executable, kraken::schema::approvals_t>
execute_intent(account_t& account,
               std::string_view key,
               const kraken::schema::block_clock& clock);

/// Fails unless every threshold is set and reachable and members are unique.
void verify_rules(const kraken::schema::multisig_config_t& config);

const kraken::schema::member_t* find_member(
    const kraken::schema::multisig_config_t& config,
    const kraken::schema::address_t& addr);

void request_config_multisig(
    const kraken::account::auth_t& auth,
    account_t& account,
    kraken::account::tx_context& ctx,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    kraken::schema::timestamp_milliseconds_t expiration_time,
    const std::vector<kraken::schema::address_t>& addrs,
    const std::vector<uint64_t>& weights,
    const std::vector<std::vector<std::string>>& roles,
    uint64_t global,
    const std::vector<std::string>& role_names,
    const std::vector<uint64_t>& role_thresholds);

void execute_config_multisig(kraken::account::executable token,
                             account_t& account);

void delete_config_multisig(kraken::account::expired& bag);

}  // namespace kraken::policy::multisig
