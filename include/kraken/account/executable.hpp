#pragma once
#include <kraken/schema/issuer.hpp>
#include <cstdint>

namespace kraken::account {

template <typename PolicyTag>
class account;

/// Single use proof that an intent passed its policy and is due.
///
/// Only `account::execute_intent` creates one, only
/// `account::confirm_execution` retires it. It cannot be copied, and dropping a
/// live token outside of exception unwinding is a fatal programming error:
/// every action must be visited exactly once inside one transaction.
class executable final {
 public:
  executable(const executable&) = delete;
  executable& operator=(const executable&) = delete;
  executable(executable&& other) noexcept;
  executable& operator=(executable&&) = delete;
  ~executable();

  const kraken::schema::issuer_t& issuer() const { return issuer_; }

  /// Index of the next action to process.
  uint64_t action_idx() const { return action_idx_; }

  /// Return the current index and advance by one. Bounds are checked when the
  /// token is confirmed, not here.
  uint64_t next_action() { return action_idx_++; }

 private:
  template <typename PolicyTag>
  friend class account;

  explicit executable(kraken::schema::issuer_t issuer);

  void retire() { live_ = false; }

  kraken::schema::issuer_t issuer_;
  uint64_t action_idx_{};
  bool live_{true};
  int uncaught_at_creation_{};
};

}  // namespace kraken::account
