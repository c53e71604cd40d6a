#pragma once
#include <kraken/schema/primitives.hpp>
#include <string>

// Schema type: issuer.
// Provenance of an intent: the account it lives in, its key and the type name
// of the witness that created it. Copied into the executable and the expired
// bag untouched.
namespace kraken::schema {

template <uint16_t Version>
struct issuer;

template <>
struct issuer<1> final {
  address_t account_addr{};
  std::string intent_key;
  std::string intent_type;

  bool operator==(const issuer<1>&) const = default;
};

using issuer_t = issuer<1>;

}  // namespace kraken::schema
