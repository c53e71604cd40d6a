#include <kraken/account/expired.hpp>
#include <kraken/common/critical.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

using kraken::schema::error_code;

namespace kraken::account {

expired::expired(std::string key,
                 kraken::schema::issuer_t issuer,
                 std::vector<kraken::schema::action_t> actions)
    : key_{std::move(key)},
      issuer_{std::move(issuer)},
      actions_{std::move(actions)},
      uncaught_at_creation_{std::uncaught_exceptions()} {}

expired::expired(expired&& other) noexcept
    : key_{std::move(other.key_)},
      issuer_{std::move(other.issuer_)},
      start_index_{other.start_index_},
      actions_{std::move(other.actions_)},
      live_{other.live_},
      uncaught_at_creation_{other.uncaught_at_creation_} {
  other.live_ = false;
}

expired::~expired() {
  if (live_ && std::uncaught_exceptions() <= uncaught_at_creation_) {
    kraken::common::critical(
        "expired bag for intent '{}' of account {} dropped with {} action(s) "
        "left and no destroy_empty",
        key_, kraken::schema::to_string(issuer_.account_addr),
        remaining());
  }
}

std::string_view expired::peek_type() const {
  if (empty()) {
    return {};
  }
  return actions_[start_index_].type;
}

const kraken::schema::action_t& expired::front(
    const std::string_view expected_type) const {
  if (empty()) {
    kraken::common::fail(
        error_code::no_more_actions,
        fmt::format("expired intent '{}' has no actions left", key_));
  }
  const auto& action = actions_[start_index_];
  if (action.type != expected_type) {
    kraken::common::fail(
        error_code::wrong_action_type,
        fmt::format("expired intent '{}' action {} is {}, not {}", key_,
                    start_index_, action.type, expected_type));
  }
  return action;
}

void destroy_empty(expired bag) {
  if (!bag.empty()) {
    kraken::common::fail(
        error_code::actions_not_empty,
        fmt::format("expired intent '{}' still holds {} action(s)", bag.key_,
                    bag.remaining()));
  }
  bag.live_ = false;
  spdlog::debug("Destroyed drained bag for intent '{}'", bag.key_);
}

}  // namespace kraken::account
