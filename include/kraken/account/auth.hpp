#pragma once
#include <kraken/schema/primitives.hpp>

namespace kraken::account {

template <typename Tag>
struct policy;

/// Proof handed out by a policy's `authenticate` that the sender is
/// recognised by the account config. Consumed by `create_intent`.
///
/// Only a `policy` specialization can construct one.
class auth_t final {
 public:
  const kraken::schema::address_t& account_addr() const {
    return account_addr_;
  }

 private:
  template <typename Tag>
  friend struct policy;

  explicit auth_t(const kraken::schema::address_t& account_addr)
      : account_addr_{account_addr} {}

  kraken::schema::address_t account_addr_;
};

}  // namespace kraken::account
