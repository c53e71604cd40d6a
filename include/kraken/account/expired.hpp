#pragma once
#include <kraken/account/witness.hpp>
#include <kraken/common/error.hpp>
#include <kraken/schema/action.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/schema/issuer.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace kraken::account {

/// Leftover actions of an intent that left the registry.
///
/// Each action module pops and disposes of its own actions with
/// `remove_action`; `destroy_empty` then retires the bag. Dropping a bag that
/// still holds actions outside of exception unwinding is fatal, so no payload
/// (a lock on an object for instance) is ever discarded silently.
class expired final {
 public:
  expired(std::string key,
          kraken::schema::issuer_t issuer,
          std::vector<kraken::schema::action_t> actions);

  expired(const expired&) = delete;
  expired& operator=(const expired&) = delete;
  expired(expired&& other) noexcept;
  expired& operator=(expired&&) = delete;
  ~expired();

  const std::string& key() const { return key_; }
  const kraken::schema::issuer_t& issuer() const { return issuer_; }
  uint64_t start_index() const { return start_index_; }
  uint64_t remaining() const { return actions_.size() - start_index_; }
  bool empty() const { return remaining() == 0; }

  /// Type name of the next action to pop, empty when drained.
  std::string_view peek_type() const;

  /// Pop the next action, which must be an `Action`.
  template <typename Action>
  Action remove_action();

  friend void destroy_empty(expired bag);

 private:
  const kraken::schema::action_t& front(std::string_view expected_type) const;

  std::string key_;
  kraken::schema::issuer_t issuer_;
  uint64_t start_index_{};
  std::vector<kraken::schema::action_t> actions_;
  bool live_{true};
  int uncaught_at_creation_{};
};

/// Retire a drained bag; fails with `actions_not_empty` otherwise.
void destroy_empty(expired bag);

template <typename Action>
Action expired::remove_action() {
  const auto& action = front(type_name<Action>());
  auto encoder = kraken::schema::encoding::encoder<
      kraken::schema::encoding::scale_encoder_tag>{};
  auto decoded = encoder.decode<Action>(kraken::schema::bytes_view_t{
      action.payload.data(), action.payload.size()});
  ++start_index_;
  return decoded;
}

}  // namespace kraken::account
