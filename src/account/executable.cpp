#include <kraken/account/executable.hpp>
#include <kraken/common/critical.hpp>

#include <exception>
#include <utility>

namespace kraken::account {

executable::executable(kraken::schema::issuer_t issuer)
    : issuer_{std::move(issuer)},
      uncaught_at_creation_{std::uncaught_exceptions()} {}

executable::executable(executable&& other) noexcept
    : issuer_{std::move(other.issuer_)},
      action_idx_{other.action_idx_},
      live_{other.live_},
      uncaught_at_creation_{other.uncaught_at_creation_} {
  other.live_ = false;
}

executable::~executable() {
  // An abort unwinding through the transaction rolls everything back, the
  // token going with it is expected.
  if (live_ && std::uncaught_exceptions() <= uncaught_at_creation_) {
    kraken::common::critical(
        "executable for intent '{}' of account {} dropped at action {} "
        "without confirm_execution",
        issuer_.intent_key, kraken::schema::to_string(issuer_.account_addr),
        action_idx_);
  }
}

}  // namespace kraken::account
