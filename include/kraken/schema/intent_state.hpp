#pragma once
#include <kraken/schema/action.hpp>
#include <kraken/schema/issuer.hpp>
#include <kraken/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: intent state.
// Proposed batch of actions with its schedule and the policy specific approval
// tracking state (`Outcome`).
namespace kraken::schema {

template <typename Outcome>
struct intent_state final {
  uint16_t version{1};
  issuer_t issuer;
  std::string key;
  std::string description;
  address_t creator{};
  timestamp_milliseconds_t creation_time{};
  std::vector<timestamp_milliseconds_t> execution_times;
  timestamp_milliseconds_t expiration_time{};
  std::string role;
  std::vector<action_t> actions;
  Outcome outcome{};
};

template <typename Outcome>
struct intents_state final {
  uint16_t version{1};
  std::vector<intent_state<Outcome>> inner;
  // Kept sorted.
  std::vector<object_id_t> locked;
};

}  // namespace kraken::schema
