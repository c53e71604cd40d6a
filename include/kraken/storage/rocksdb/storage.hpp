#pragma once
#include <rocksdb/db.h>
#include <kraken/schema/primitives.hpp>
#include <kraken/storage/storage.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace kraken::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<committed_state> load_committed_state() const;
  void commit(const committed_state& state,
              const std::vector<key_value_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const kraken::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace kraken::storage
