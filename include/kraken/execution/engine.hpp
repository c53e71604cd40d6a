#pragma once

#include <kraken/account/account.hpp>
#include <kraken/account/tx_context.hpp>
#include <kraken/common/error.hpp>
#include <kraken/schema/app_info.hpp>
#include <kraken/schema/commit_result.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/schema/key/engine_keys.hpp>
#include <kraken/schema/primitives.hpp>
#include <kraken/schema/transaction_result.hpp>
#include <kraken/storage/rocksdb/storage.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

namespace kraken::execution {

using encoder_t = kraken::schema::encoding::encoder<
    kraken::schema::encoding::scale_encoder_tag>;
using storage_t =
    kraken::storage::storage<kraken::storage::rocksdb_storage_tag>;

/// Next state root: BLAKE3(seed || material || SCALE(height, index)).
kraken::schema::hash32_t fold_state_root(const kraken::schema::hash32_t& seed,
                                         const kraken::schema::bytes_t& material,
                                         int64_t height,
                                         uint64_t index);

/// Digest of the `index`-th transaction of a block, seeds its fresh ids.
kraken::schema::hash32_t make_transaction_digest(
    const kraken::schema::hash32_t& chain_id,
    int64_t height,
    uint64_t index,
    const kraken::schema::address_t& sender);

kraken::schema::transaction_result_t make_abort_result(
    const kraken::common::abort_error& error,
    std::string_view codespace);

kraken::schema::transaction_result_t make_missing_account_result(
    const kraken::schema::address_t& account_id,
    std::string_view codespace);

/// Host side of the framework: owns the live accounts of one policy, the
/// block clock and the durable store.
///
/// Every transaction runs against a copy of the target account and the copy
/// replaces the live account only when the transaction returns normally, so
/// an abort never leaves partial state behind. Accounts touched since the last
/// commit are written out together with the new height and state root.
///
/// Transaction functions run without the engine lock held and may call back
/// into the engine. A transaction whose account was replaced by another one
/// in the meantime fails with `account_changed`.
template <typename PolicyTag>
class engine final {
 public:
  using account_t = kraken::account::account<PolicyTag>;
  using state_t = typename account_t::state_t;
  using create_fn_t = std::function<account_t(kraken::account::tx_context&)>;
  using transaction_fn_t =
      std::function<void(account_t&, kraken::account::tx_context&)>;

  /// Construct the engine and reload whatever was committed to `storage`.
  ///
  /// `chain_id` seeds transaction digests, hence every fresh object id.
  engine(encoder_t& encoder,
         storage_t& storage,
         const kraken::schema::hash32_t& chain_id)
      : encoder_{encoder}, storage_{storage}, chain_id_{chain_id} {
    auto lock = std::scoped_lock{mutex_};
    load_persisted_state();
    spdlog::info("Execution engine ready at height {} with {} account(s)",
                 last_committed_height_, accounts_.size());
  }

  /// Move the clock. Transactions until the next call run at this height and
  /// time.
  void begin_block(const int64_t height,
                   const kraken::schema::timestamp_milliseconds_t timestamp_ms) {
    auto lock = std::scoped_lock{mutex_};
    current_height_ = height;
    current_time_ms_ = timestamp_ms;
    tx_index_ = 0;
    spdlog::debug("Begin block {} at {}", height, timestamp_ms);
  }

  /// Run an account constructor. On success `data` holds the new account id.
  kraken::schema::transaction_result_t create_account(
      const kraken::schema::address_t& sender,
      const create_fn_t& fn) {
    auto lock = std::unique_lock{mutex_};
    auto [ctx, index] = next_context(sender);
    lock.unlock();

    auto result = kraken::schema::transaction_result_t{};
    try {
      auto created = fn(ctx);
      const auto id = created.addr();
      lock.lock();
      if (accounts_.contains(id)) {
        kraken::common::fail(kraken::schema::error_code::invalid_transaction,
                             "account id already in use");
      }
      accounts_.insert_or_assign(id, std::move(created));
      mark_applied(id, index);
      result.data = kraken::schema::bytes_t{std::begin(id), std::end(id)};
    } catch (const kraken::common::abort_error& error) {
      spdlog::warn("create_account by {} aborted: {}",
                   kraken::schema::to_string(sender), error.what());
      return make_abort_result(error, "kraken.create_account");
    }
    return result;
  }

  /// Run `fn` against account `account_id` all-or-nothing.
  kraken::schema::transaction_result_t transact(
      const kraken::schema::address_t& account_id,
      const kraken::schema::address_t& sender,
      const transaction_fn_t& fn) {
    auto lock = std::unique_lock{mutex_};
    auto it = accounts_.find(account_id);
    if (it == std::end(accounts_)) {
      spdlog::warn("Transaction for unknown account {}",
                   kraken::schema::to_string(account_id));
      return make_missing_account_result(account_id, "kraken.transact");
    }
    auto [ctx, index] = next_context(sender);
    auto working = it->second;
    const auto revision = revisions_[account_id];
    lock.unlock();

    try {
      fn(working, ctx);
      lock.lock();
      if (revisions_[account_id] != revision) {
        kraken::common::fail(
            kraken::schema::error_code::account_changed,
            fmt::format("account {} changed while the transaction ran",
                        kraken::schema::to_string(account_id)));
      }
    } catch (const kraken::common::abort_error& error) {
      spdlog::warn("Transaction by {} on account {} aborted: {}",
                   kraken::schema::to_string(sender),
                   kraken::schema::to_string(account_id), error.what());
      return make_abort_result(error, "kraken.transact");
    }
    accounts_.insert_or_assign(account_id, std::move(working));
    mark_applied(account_id, index);
    return kraken::schema::transaction_result_t{};
  }

  /// Persist every account touched since the last commit along with the
  /// block height and state root, in one write.
  kraken::schema::commit_result_t commit() {
    auto lock = std::scoped_lock{mutex_};
    auto entries = std::vector<kraken::storage::key_value_entry_t>{};
    entries.reserve(dirty_.size());
    for (const auto& id : dirty_) {
      const auto& account = accounts_.at(id);
      entries.push_back(kraken::storage::key_value_entry_t{
          kraken::schema::key::make_account_key(encoder_, id),
          encoder_.encode(account.state())});
    }

    last_committed_height_ = current_height_;
    last_committed_state_root_ = pending_state_root_;
    storage_.commit(
        kraken::storage::committed_state{
            .height = last_committed_height_,
            .state_root = last_committed_state_root_},
        entries);
    spdlog::info("Committed height {} ({} account(s) written)",
                 last_committed_height_, entries.size());

    auto result = kraken::schema::commit_result_t{};
    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    result.accounts_written = entries.size();
    dirty_.clear();
    return result;
  }

  kraken::schema::app_info_t info() const {
    auto lock = std::scoped_lock{mutex_};
    auto result = kraken::schema::app_info_t{};
    result.last_block_height = last_committed_height_;
    result.last_block_state_root = last_committed_state_root_;
    result.account_count = accounts_.size();
    return result;
  }

  /// Copy of the live account, including uncommitted changes.
  std::optional<account_t> find_account(
      const kraken::schema::address_t& id) const {
    auto lock = std::scoped_lock{mutex_};
    auto it = accounts_.find(id);
    if (it == std::end(accounts_)) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  /// Context of the next transaction in the block and its index. The index is
  /// reserved here so transactions running side by side never share ids.
  std::pair<kraken::account::tx_context, uint64_t> next_context(
      const kraken::schema::address_t& sender) {
    const auto index = tx_index_++;
    return {kraken::account::tx_context{
                sender, current_time_ms_,
                make_transaction_digest(chain_id_, current_height_, index,
                                        sender)},
            index};
  }

  /// Fold the post-state of the account into the pending state root.
  void mark_applied(const kraken::schema::address_t& id, const uint64_t index) {
    dirty_.insert(id);
    ++revisions_[id];
    pending_state_root_ =
        fold_state_root(pending_state_root_,
                        encoder_.encode(accounts_.at(id).state()),
                        current_height_, index);
  }

  void load_persisted_state() {
    spdlog::debug("Loading persisted engine state");
    if (auto committed = storage_.load_committed_state()) {
      last_committed_height_ = committed->height;
      last_committed_state_root_ = committed->state_root;
      current_height_ = committed->height;
    }
    pending_state_root_ = last_committed_state_root_;

    auto prefix = kraken::schema::key::make_prefix_key(
        encoder_, kraken::schema::key::kAccountKeyPrefix);
    for (const auto& [key, value] :
         storage_.list_by_prefix(kraken::schema::make_bytes_view(prefix))) {
      auto state = encoder_.template decode<state_t>(
          kraken::schema::make_bytes_view(value));
      auto id = state.id;
      accounts_.insert_or_assign(id, account_t::restore(std::move(state)));
    }
  }

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  kraken::schema::hash32_t chain_id_;
  std::map<kraken::schema::address_t, account_t> accounts_;
  std::set<kraken::schema::address_t> dirty_;
  std::map<kraken::schema::address_t, uint64_t> revisions_;
  int64_t last_committed_height_{};
  kraken::schema::hash32_t last_committed_state_root_{};
  kraken::schema::hash32_t pending_state_root_{};
  int64_t current_height_{};
  kraken::schema::timestamp_milliseconds_t current_time_ms_{};
  uint64_t tx_index_{};
};

}  // namespace kraken::execution
