#pragma once
#include <kraken/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace kraken::storage {

using key_value_entry_t =
    std::pair<kraken::schema::bytes_t, kraken::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  kraken::schema::hash32_t state_root{};
};

/// Durable store of the engine: account records plus the last committed
/// checkpoint. Only ever written through `commit`.
template <typename Library>
struct storage {
  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the committed checkpoint together with already encoded entries
  /// in one atomic write.
  void commit(const committed_state& state,
              const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const kraken::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace kraken::storage
