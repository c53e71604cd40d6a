#pragma once
#include <kraken/schema/metadata_entry.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kraken::account {

/// Ordered key/value list attached to an account, e.g. its display name.
class metadata final {
 public:
  static metadata from_keys_values(const std::vector<std::string>& keys,
                                   const std::vector<std::string>& values);

  metadata() = default;
  explicit metadata(std::vector<kraken::schema::metadata_entry_t> entries);

  std::optional<std::string_view> get(std::string_view key) const;
  uint64_t length() const { return entries_.size(); }
  const std::vector<kraken::schema::metadata_entry_t>& entries() const {
    return entries_;
  }

 private:
  std::vector<kraken::schema::metadata_entry_t> entries_;
};

}  // namespace kraken::account
