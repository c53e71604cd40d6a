#pragma once
#include <kraken/schema/approval.hpp>
#include <kraken/schema/primitives.hpp>
#include <vector>

// Schema type: approvals.
// Outcome tracked on every intent of a multisig account. Totals always equal
// the sums over `approved`.
namespace kraken::schema {

template <uint16_t Version>
struct approvals;

template <>
struct approvals<1> final {
  uint64_t total_weight{};
  uint64_t role_weight{};
  std::vector<approval_t> approved;
};

using approvals_t = approvals<1>;

}  // namespace kraken::schema
