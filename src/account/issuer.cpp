#include <kraken/account/issuer.hpp>

#include <fmt/format.h>

using kraken::schema::error_code;

namespace kraken::account {

void assert_is_account(const kraken::schema::issuer_t& issuer,
                       const kraken::schema::address_t& account_addr) {
  if (issuer.account_addr != account_addr) {
    kraken::common::fail(
        error_code::wrong_account,
        fmt::format("intent '{}' belongs to account {}, not {}",
                    issuer.intent_key,
                    kraken::schema::to_string(issuer.account_addr),
                    kraken::schema::to_string(account_addr)));
  }
}

void assert_is_intent(const kraken::schema::issuer_t& issuer,
                      const std::string_view witness_type) {
  if (issuer.intent_type != witness_type) {
    kraken::common::fail(
        error_code::wrong_witness,
        fmt::format("intent '{}' was issued by {}, not {}", issuer.intent_key,
                    issuer.intent_type, witness_type));
  }
}

}  // namespace kraken::account
