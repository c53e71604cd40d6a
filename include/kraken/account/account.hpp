#pragma once
#include <kraken/account/auth.hpp>
#include <kraken/account/deps.hpp>
#include <kraken/account/executable.hpp>
#include <kraken/account/expired.hpp>
#include <kraken/account/intents.hpp>
#include <kraken/account/issuer.hpp>
#include <kraken/account/metadata.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/account/policy.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/account/witness.hpp>
#include <kraken/common/error.hpp>
#include <kraken/schema/account_state.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/schema/primitives.hpp>
#include <kraken/schema/version_witness.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace kraken::account {

/// Smart account: deps, policy config, metadata and the intents registry.
///
/// Every mutating entry point takes the version witness of the calling
/// package and checks it against the deps. Intent bound entry points also take
/// the intent witness and check it against the issuer. Aborts leave the
/// account in whatever state it reached, so callers run transactions on a
/// copy (see `execution::engine`).
template <typename PolicyTag>
class account final {
 public:
  using policy_t = kraken::account::policy<PolicyTag>;
  using config_t = typename policy_t::config_t;
  using outcome_t = typename policy_t::outcome_t;
  using intent_t = kraken::schema::intent_state<outcome_t>;
  using state_t = kraken::schema::account_state<config_t, outcome_t>;

  template <typename ConfigWitness>
  static account create(tx_context& ctx,
                        config_t config,
                        kraken::account::deps deps,
                        kraken::account::metadata metadata,
                        const kraken::schema::version_witness_t& version,
                        const ConfigWitness& witness) {
    deps.check(version);
    assert_config_witness(witness);
    auto result = account{};
    result.id_ = ctx.fresh_object_id();
    result.config_ = std::move(config);
    result.deps_ = std::move(deps);
    result.metadata_ = std::move(metadata);
    spdlog::info("Created account {} for {}",
                 kraken::schema::to_string(result.id_),
                 kraken::schema::to_string(ctx.sender()));
    return result;
  }

  /// Rebuild an account from its persisted layout.
  static account restore(state_t state) {
    auto result = account{};
    result.id_ = state.id;
    result.metadata_ = kraken::account::metadata{std::move(state.metadata)};
    result.deps_ = kraken::account::deps{std::move(state.deps)};
    result.intents_ =
        kraken::account::intents<outcome_t>{std::move(state.intents)};
    result.config_ = std::move(state.config);
    return result;
  }

  state_t state() const {
    return state_t{.id = id_,
                   .metadata = metadata_.entries(),
                   .deps = deps_.state(),
                   .intents = intents_.state(),
                   .config = config_};
  }

  const kraken::schema::address_t& addr() const { return id_; }
  const config_t& config() const { return config_; }
  const kraken::account::deps& deps() const { return deps_; }
  const kraken::account::metadata& metadata() const { return metadata_; }
  const kraken::account::intents<outcome_t>& intents() const {
    return intents_;
  }

  void verify(const auth_t& auth) const {
    if (auth.account_addr() != id_) {
      kraken::common::fail(
          kraken::schema::error_code::wrong_account,
          fmt::format("auth was issued for account {}, not {}",
                      kraken::schema::to_string(auth.account_addr()),
                      kraken::schema::to_string(id_)));
    }
  }

  /// Build an intent owned by this account. It only becomes visible once
  /// actions are attached and it is passed to `add_intent`.
  template <typename IntentWitness>
  intent_t create_intent(
      const auth_t& auth,
      std::string key,
      std::string description,
      std::vector<kraken::schema::timestamp_milliseconds_t> execution_times,
      const kraken::schema::timestamp_milliseconds_t expiration_time,
      const std::string_view role_name,
      outcome_t outcome,
      const kraken::schema::version_witness_t& version,
      const IntentWitness& witness,
      const tx_context& ctx) const {
    verify(auth);
    deps_.check(version);
    auto issuer = make_issuer(id_, key, witness);
    return new_intent<outcome_t>(
        std::move(issuer), std::move(key), std::move(description),
        std::move(execution_times), expiration_time,
        make_role<IntentWitness>(role_name), std::move(outcome), ctx.sender(),
        ctx.timestamp_ms());
  }

  template <typename IntentWitness>
  void add_intent(intent_t intent,
                  const kraken::schema::version_witness_t& version,
                  const IntentWitness& witness) {
    deps_.check(version);
    assert_is_account(intent.issuer, id_);
    assert_is_intent(intent.issuer, witness);
    const auto key = intent.key;
    const auto action_count = intent.actions.size();
    intents_.add_intent(std::move(intent));
    spdlog::info("Added intent '{}' with {} action(s) to account {}", key,
                 action_count, kraken::schema::to_string(id_));
  }

  template <typename ConfigWitness>
  outcome_t& outcome_mut(const std::string_view key,
                         const kraken::schema::version_witness_t& version,
                         const ConfigWitness& witness) {
    deps_.check(version);
    assert_config_witness(witness);
    return intents_.get_mut(key).outcome;
  }

  template <typename ConfigWitness>
  config_t& config_mut(const kraken::schema::version_witness_t& version,
                       const ConfigWitness& witness) {
    deps_.check(version);
    assert_config_witness(witness);
    return config_;
  }

  /// Restricted to the protocol package itself.
  kraken::account::metadata& metadata_mut(
      const kraken::schema::version_witness_t& version) {
    assert_protocol(version);
    return metadata_;
  }

  /// Restricted to the protocol package itself.
  kraken::account::deps& deps_mut(
      const kraken::schema::version_witness_t& version) {
    assert_protocol(version);
    return deps_;
  }

  /// Pop the next scheduled time and hand out the token to process the
  /// intent actions, along with the outcome it was approved with.
  std::tuple<executable, outcome_t> execute_intent(
      const std::string_view key,
      const kraken::schema::block_clock& clock,
      const kraken::schema::version_witness_t& version) {
    deps_.check(version);
    auto& intent = intents_.get_mut(key);
    if (!intent.execution_times.empty() &&
        clock.timestamp_ms < intent.execution_times.front()) {
      kraken::common::fail(
          kraken::schema::error_code::cant_be_executed_yet,
          fmt::format("intent '{}' is due at {}, now is {}", key,
                      intent.execution_times.front(), clock.timestamp_ms));
    }
    pop_front_execution_time(intent);
    if (!policy_t::validate(intent.outcome, config_, intent.role)) {
      kraken::common::fail(
          kraken::schema::error_code::threshold_not_reached,
          fmt::format("intent '{}' is not approved for role '{}'", key,
                      intent.role));
    }
    spdlog::info("Executing intent '{}' of account {}", key,
                 kraken::schema::to_string(id_));
    return {executable{intent.issuer}, intent.outcome};
  }

  /// Decode the action at the token index and advance the token.
  template <typename Action, typename IntentWitness>
  Action process_action(executable& token,
                        const kraken::schema::version_witness_t& version,
                        const IntentWitness& witness) const {
    deps_.check(version);
    assert_is_account(token.issuer(), id_);
    assert_is_intent(token.issuer(), witness);
    const auto& intent = intents_.get(token.issuer().intent_key);
    const auto idx = token.action_idx();
    if (idx >= intent.actions.size()) {
      kraken::common::fail(
          kraken::schema::error_code::no_more_actions,
          fmt::format("intent '{}' has {} action(s), index {} requested",
                      intent.key, intent.actions.size(), idx));
    }
    const auto& action = intent.actions[idx];
    if (action.type != type_name<Action>()) {
      kraken::common::fail(
          kraken::schema::error_code::wrong_action_type,
          fmt::format("action {} of intent '{}' is {}, not {}", idx,
                      intent.key, action.type, type_name<Action>()));
    }
    auto encoder = kraken::schema::encoding::encoder<
        kraken::schema::encoding::scale_encoder_tag>{};
    auto decoded = encoder.decode<Action>(kraken::schema::bytes_view_t{
        action.payload.data(), action.payload.size()});
    token.next_action();
    spdlog::debug("Processed action {} ({}) of intent '{}'", idx, action.type,
                  intent.key);
    return decoded;
  }

  /// Retire the token once every action was processed. When no execution
  /// time is left the intent leaves the registry and its actions come back
  /// for cleanup.
  template <typename IntentWitness>
  std::optional<expired> confirm_execution(
      executable token,
      const kraken::schema::version_witness_t& version,
      const IntentWitness& witness) {
    deps_.check(version);
    assert_is_account(token.issuer(), id_);
    assert_is_intent(token.issuer(), witness);
    const auto& key = token.issuer().intent_key;
    const auto& intent = intents_.get(key);
    if (token.action_idx() != intent.actions.size()) {
      kraken::common::fail(
          kraken::schema::error_code::actions_remaining,
          fmt::format("intent '{}' processed {} of {} action(s)", key,
                      token.action_idx(), intent.actions.size()));
    }
    token.retire();
    if (!intent.execution_times.empty()) {
      spdlog::info("Intent '{}' re-armed for {}", key,
                   intent.execution_times.front());
      return std::nullopt;
    }
    spdlog::info("Intent '{}' fully executed", key);
    return intents_.destroy(key);
  }

  /// Remove an intent whose expiration time has passed.
  expired delete_expired_intent(const std::string_view key,
                                const kraken::schema::block_clock& clock) {
    const auto& intent = intents_.get(key);
    if (clock.timestamp_ms < intent.expiration_time) {
      kraken::common::fail(
          kraken::schema::error_code::hasnt_expired,
          fmt::format("intent '{}' expires at {}, now is {}", key,
                      intent.expiration_time, clock.timestamp_ms));
    }
    spdlog::info("Deleting expired intent '{}' of account {}", key,
                 kraken::schema::to_string(id_));
    return intents_.destroy(key);
  }

  /// Remove an intent whose execution times are used up, e.g. after its last
  /// execution was rejected by the policy. A pending intent only leaves
  /// through execution or expiry.
  expired destroy_empty_intent(
      const std::string_view key,
      const kraken::schema::version_witness_t& version) {
    deps_.check(version);
    const auto& intent = intents_.get(key);
    if (!intent.execution_times.empty()) {
      kraken::common::fail(
          kraken::schema::error_code::cant_be_removed_yet,
          fmt::format("intent '{}' still has {} execution time(s)", key,
                      intent.execution_times.size()));
    }
    spdlog::info("Destroying empty intent '{}' of account {}", key,
                 kraken::schema::to_string(id_));
    return intents_.destroy(key);
  }

  /// Reserve an object for a pending intent of this account.
  template <typename IntentWitness>
  void lock_object(const intent_t& intent,
                   const kraken::schema::object_id_t& id,
                   const kraken::schema::version_witness_t& version,
                   const IntentWitness& witness) {
    deps_.check(version);
    assert_is_account(intent.issuer, id_);
    assert_is_intent(intent.issuer, witness);
    intents_.lock(id);
  }

  /// Release an object reserved by an intent that left the registry.
  void unlock_object(const expired& bag,
                     const kraken::schema::object_id_t& id,
                     const kraken::schema::version_witness_t& version) {
    deps_.check(version);
    assert_is_account(bag.issuer(), id_);
    intents_.unlock(id);
  }

 private:
  account() = default;

  template <typename ConfigWitness>
  static void assert_config_witness(const ConfigWitness&) {
    if (module_of(type_name<ConfigWitness>()) != policy_t::kModuleName) {
      kraken::common::fail(
          kraken::schema::error_code::wrong_witness,
          fmt::format("{} cannot modify config of {} accounts",
                      type_name<ConfigWitness>(), policy_t::kModuleName));
    }
  }

  void assert_protocol(const kraken::schema::version_witness_t& version) const {
    deps_.check(version);
    if (version.package_addr !=
        make_package_address(kAccountProtocolName)) {
      kraken::common::fail(
          kraken::schema::error_code::not_dep,
          fmt::format("package {} is not AccountProtocol",
                      kraken::schema::to_string(version.package_addr)));
    }
  }

  kraken::schema::address_t id_{};
  kraken::account::metadata metadata_;
  kraken::account::deps deps_;
  kraken::account::intents<outcome_t> intents_;
  config_t config_{};
};

}  // namespace kraken::account
