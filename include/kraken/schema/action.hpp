#pragma once
#include <kraken/schema/primitives.hpp>
#include <string>

// Schema type: action.
// One opaque entry of an intent. `type` is the payload type name registered by
// the owning module; `payload` holds the encoded payload. The core never looks
// inside `payload`.
namespace kraken::schema {

template <uint16_t Version>
struct action;

template <>
struct action<1> final {
  std::string type;
  bytes_t payload;
};

using action_t = action<1>;

}  // namespace kraken::schema
