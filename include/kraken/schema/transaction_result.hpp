#pragma once

#include <kraken/schema/error_code.hpp>
#include <kraken/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: transaction result.
// Outcome of one engine transaction. `code` is 0 on success, otherwise the
// raw `error_code` the transaction aborted with.
namespace kraken::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  // Set by operations that create something, e.g. the new account id.
  bytes_t data;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using transaction_result_t = transaction_result<1>;

}  // namespace kraken::schema
