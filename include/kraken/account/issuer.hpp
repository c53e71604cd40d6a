#pragma once
#include <kraken/account/witness.hpp>
#include <kraken/common/error.hpp>
#include <kraken/schema/issuer.hpp>
#include <string>
#include <string_view>

namespace kraken::account {

template <typename Witness>
kraken::schema::issuer_t make_issuer(const kraken::schema::address_t& account_addr,
                                     const std::string_view intent_key,
                                     const Witness&) {
  return kraken::schema::issuer_t{
      .account_addr = account_addr,
      .intent_key = std::string{intent_key},
      .intent_type = std::string{type_name<Witness>()}};
}

void assert_is_account(const kraken::schema::issuer_t& issuer,
                       const kraken::schema::address_t& account_addr);

void assert_is_intent(const kraken::schema::issuer_t& issuer,
                      std::string_view witness_type);

template <typename Witness>
void assert_is_intent(const kraken::schema::issuer_t& issuer, const Witness&) {
  assert_is_intent(issuer, type_name<Witness>());
}

}  // namespace kraken::account
