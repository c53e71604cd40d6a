#pragma once
#include <kraken/schema/primitives.hpp>

// Schema type: approval.
// One member's approval of an intent and the weight it added at the time.
namespace kraken::schema {

template <uint16_t Version>
struct approval;

template <>
struct approval<1> final {
  address_t addr{};
  uint64_t weight{};
  uint64_t role_weight{};

  bool operator==(const approval<1>&) const = default;
};

using approval_t = approval<1>;

}  // namespace kraken::schema
