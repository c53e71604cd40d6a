#pragma once
#include <kraken/schema/dep.hpp>
#include <kraken/schema/intent_state.hpp>
#include <kraken/schema/metadata_entry.hpp>
#include <kraken/schema/primitives.hpp>
#include <vector>

// Schema type: account state.
// Persisted layout of an account: deps, policy config, metadata and the
// intents registry with its lock set.
namespace kraken::schema {

template <typename Config, typename Outcome>
struct account_state final {
  uint16_t version{1};
  address_t id{};
  std::vector<metadata_entry_t> metadata;
  deps_state_t deps;
  intents_state<Outcome> intents;
  Config config{};
};

}  // namespace kraken::schema
