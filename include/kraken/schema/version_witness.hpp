#pragma once
#include <kraken/schema/primitives.hpp>

namespace kraken::schema {

/// Identifies the package calling into an account; checked against the
/// account deps before any mutation.
struct version_witness_t final {
  address_t package_addr{};
  uint64_t version{};
};

}  // namespace kraken::schema
