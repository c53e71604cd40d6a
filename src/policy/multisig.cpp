#include <kraken/account/deps.hpp>
#include <kraken/account/metadata.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/common/error.hpp>
#include <kraken/policy/multisig.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>
#include <vector>

using kraken::schema::error_code;

namespace kraken::account {

bool policy<kraken::policy::multisig_policy_tag>::validate(
    const outcome_t& outcome,
    const config_t& config,
    const std::string_view role) {
  if (outcome.total_weight >= config.global) {
    return true;
  }
  auto it = std::find_if(std::begin(config.roles), std::end(config.roles),
                         [&](const kraken::schema::role_threshold_t& r) {
                           return r.name == role;
                         });
  return it != std::end(config.roles) && outcome.role_weight >= it->threshold;
}

auth_t policy<kraken::policy::multisig_policy_tag>::authenticate(
    const account<kraken::policy::multisig_policy_tag>& account,
    const kraken::schema::address_t& sender) {
  if (kraken::policy::multisig::find_member(account.config(), sender) ==
      nullptr) {
    kraken::common::fail(error_code::not_member,
                         fmt::format("{} is not a member of {}",
                                     kraken::schema::to_string(sender),
                                     kraken::schema::to_string(account.addr())));
  }
  return auth_t{account.addr()};
}

}  // namespace kraken::account

namespace kraken::policy::multisig {

namespace {

bool has_role(const kraken::schema::member_t& member,
              const std::string_view role) {
  return std::find(std::begin(member.roles), std::end(member.roles), role) !=
         std::end(member.roles);
}

const kraken::schema::member_t& get_member(
    const kraken::schema::multisig_config_t& config,
    const kraken::schema::address_t& addr) {
  const auto* member = find_member(config, addr);
  if (member == nullptr) {
    kraken::common::fail(error_code::not_member,
                         fmt::format("{} is not a member",
                                     kraken::schema::to_string(addr)));
  }
  return *member;
}

std::vector<kraken::schema::approval_t>::iterator find_approval(
    kraken::schema::approvals_t& outcome,
    const kraken::schema::address_t& addr) {
  return std::find_if(std::begin(outcome.approved), std::end(outcome.approved),
                      [&](const kraken::schema::approval_t& a) {
                        return a.addr == addr;
                      });
}

}  // namespace

account_t new_account(const kraken::account::extensions& extensions,
                      kraken::account::tx_context& ctx,
                      const std::string_view name) {
  auto config = kraken::schema::multisig_config_t{
      .members = {kraken::schema::member_t{
          .addr = ctx.sender(), .weight = 1, .roles = {}}},
      .global = 1,
      .roles = {}};
  auto deps = kraken::account::deps::create_latest_extensions(
      extensions,
      {std::string{kraken::account::kAccountProtocolName},
       std::string{kraken::account::kAccountMultisigName},
       std::string{kraken::account::kAccountActionsName}});
  auto metadata = kraken::account::metadata::from_keys_values(
      {"name"}, {std::string{name}});
  return account_t::create(ctx, std::move(config), std::move(deps),
                           std::move(metadata),
                           kraken::account::account_multisig_version(),
                           config_witness{});
}

kraken::account::auth_t authenticate(const account_t& account,
                                     const kraken::schema::address_t& sender) {
  return kraken::account::policy<multisig_policy_tag>::authenticate(account,
                                                                   sender);
}

kraken::schema::approvals_t empty_outcome() {
  return kraken::schema::approvals_t{};
}

void approve_intent(account_t& account,
                    const std::string_view key,
                    const kraken::schema::address_t& sender) {
  const auto& member = get_member(account.config(), sender);
  const auto& role = account.intents().get(key).role;
  const auto weight = member.weight;
  const auto counts_for_role = has_role(member, role);

  auto& outcome = account.outcome_mut(
      key, kraken::account::account_multisig_version(), config_witness{});
  if (find_approval(outcome, sender) != std::end(outcome.approved)) {
    kraken::common::fail(
        error_code::already_approved,
        fmt::format("{} already approved intent '{}'",
                    kraken::schema::to_string(sender), key));
  }
  outcome.approved.push_back(kraken::schema::approval_t{
      .addr = sender,
      .weight = weight,
      .role_weight = counts_for_role ? weight : 0});
  outcome.total_weight += weight;
  outcome.role_weight += outcome.approved.back().role_weight;
  spdlog::info("{} approved intent '{}' ({} total weight)",
               kraken::schema::to_string(sender), key, outcome.total_weight);
}

void disapprove_intent(account_t& account,
                       const std::string_view key,
                       const kraken::schema::address_t& sender) {
  get_member(account.config(), sender);

  auto& outcome = account.outcome_mut(
      key, kraken::account::account_multisig_version(), config_witness{});
  auto it = find_approval(outcome, sender);
  if (it == std::end(outcome.approved)) {
    kraken::common::fail(
        error_code::not_approved,
        fmt::format("{} has not approved intent '{}'",
                    kraken::schema::to_string(sender), key));
  }
  // Weights may have changed since the approval; take back what it added.
  outcome.total_weight -= it->weight;
  outcome.role_weight -= it->role_weight;
  outcome.approved.erase(it);
  spdlog::info("{} withdrew approval of intent '{}'",
               kraken::schema::to_string(sender), key);
}

std::tuple<kraken::account::executable, kraken::schema::approvals_t>
execute_intent(account_t& account,
               const std::string_view key,
               const kraken::schema::block_clock& clock) {
  return account.execute_intent(key, clock,
                                kraken::account::account_multisig_version());
}

const kraken::schema::member_t* find_member(
    const kraken::schema::multisig_config_t& config,
    const kraken::schema::address_t& addr) {
  auto it = std::find_if(
      std::begin(config.members), std::end(config.members),
      [&](const kraken::schema::member_t& m) { return m.addr == addr; });
  return it == std::end(config.members) ? nullptr : &*it;
}

void verify_rules(const kraken::schema::multisig_config_t& config) {
  auto seen = std::set<kraken::schema::address_t>{};
  auto total_weight = uint64_t{};
  for (const auto& member : config.members) {
    if (!seen.insert(member.addr).second) {
      kraken::common::fail(
          error_code::duplicate_member,
          fmt::format("member {} is listed twice",
                      kraken::schema::to_string(member.addr)));
    }
    total_weight += member.weight;
    for (const auto& role : member.roles) {
      auto known = std::any_of(
          std::begin(config.roles), std::end(config.roles),
          [&](const kraken::schema::role_threshold_t& r) {
            return r.name == role;
          });
      if (!known) {
        kraken::common::fail(
            error_code::role_not_added,
            fmt::format("member {} holds role '{}' without a threshold",
                        kraken::schema::to_string(member.addr), role));
      }
    }
  }

  if (config.global == 0) {
    kraken::common::fail(error_code::threshold_null,
                         "global threshold must be positive");
  }
  if (config.global > total_weight) {
    kraken::common::fail(
        error_code::threshold_too_high,
        fmt::format("global threshold {} exceeds total weight {}",
                    config.global, total_weight));
  }

  for (const auto& role : config.roles) {
    if (role.threshold == 0) {
      kraken::common::fail(
          error_code::threshold_null,
          fmt::format("threshold of role '{}' must be positive", role.name));
    }
    auto role_weight = uint64_t{};
    for (const auto& member : config.members) {
      if (has_role(member, role.name)) {
        role_weight += member.weight;
      }
    }
    if (role.threshold > role_weight) {
      kraken::common::fail(
          error_code::threshold_too_high,
          fmt::format("threshold {} of role '{}' exceeds its weight {}",
                      role.threshold, role.name, role_weight));
    }
  }
}

void request_config_multisig(
    const kraken::account::auth_t& auth,
    account_t& account,
    kraken::account::tx_context& ctx,
    std::string key,
    std::string description,
    std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
    const kraken::schema::timestamp_milliseconds_t expiration_time,
    const std::vector<kraken::schema::address_t>& addrs,
    const std::vector<uint64_t>& weights,
    const std::vector<std::vector<std::string>>& roles,
    const uint64_t global,
    const std::vector<std::string>& role_names,
    const std::vector<uint64_t>& role_thresholds) {
  if (addrs.size() != weights.size() || addrs.size() != roles.size()) {
    kraken::common::fail(
        error_code::members_not_same_length,
        fmt::format("{} member addresses, {} weights, {} role lists",
                    addrs.size(), weights.size(), roles.size()));
  }
  if (role_names.size() != role_thresholds.size()) {
    kraken::common::fail(
        error_code::roles_not_same_length,
        fmt::format("{} role names for {} thresholds", role_names.size(),
                    role_thresholds.size()));
  }

  auto action = config_multisig_action{};
  action.config.global = global;
  for (std::size_t i = 0; i < addrs.size(); ++i) {
    action.config.members.push_back(kraken::schema::member_t{
        .addr = addrs[i], .weight = weights[i], .roles = roles[i]});
  }
  for (std::size_t i = 0; i < role_names.size(); ++i) {
    action.config.roles.push_back(kraken::schema::role_threshold_t{
        .name = role_names[i], .threshold = role_thresholds[i]});
  }
  verify_rules(action.config);

  auto intent = account.create_intent(
      auth, std::move(key), std::move(description), std::move(execution_times),
      expiration_time, "config", empty_outcome(),
      kraken::account::account_multisig_version(), config_multisig_intent{},
      ctx);
  kraken::account::add_action(intent, action, config_multisig_intent{});
  account.add_intent(std::move(intent),
                     kraken::account::account_multisig_version(),
                     config_multisig_intent{});
}

void execute_config_multisig(kraken::account::executable token,
                             account_t& account) {
  const auto version = kraken::account::account_multisig_version();
  auto action = account.process_action<config_multisig_action>(
      token, version, config_multisig_intent{});
  // Members may have changed since the request.
  verify_rules(action.config);
  account.config_mut(version, config_witness{}) = std::move(action.config);
  spdlog::info("Reconfigured multisig {} ({} member(s), global {})",
               kraken::schema::to_string(account.addr()),
               account.config().members.size(), account.config().global);

  auto bag =
      account.confirm_execution(std::move(token), version,
                                config_multisig_intent{});
  if (bag) {
    delete_config_multisig(*bag);
    kraken::account::destroy_empty(std::move(*bag));
  }
}

void delete_config_multisig(kraken::account::expired& bag) {
  bag.remove_action<config_multisig_action>();
}

}  // namespace kraken::policy::multisig
