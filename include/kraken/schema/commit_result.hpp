#pragma once

#include <kraken/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Height and state root made durable by a commit, plus how many accounts were
// written.
namespace kraken::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
  uint64_t accounts_written{};
};

using commit_result_t = commit_result<1>;

}  // namespace kraken::schema
