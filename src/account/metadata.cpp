#include <kraken/account/metadata.hpp>
#include <kraken/common/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

using kraken::schema::error_code;

namespace kraken::account {

metadata metadata::from_keys_values(const std::vector<std::string>& keys,
                                    const std::vector<std::string>& values) {
  if (keys.size() != values.size()) {
    kraken::common::fail(
        error_code::metadata_not_same_length,
        fmt::format("{} metadata keys for {} values", keys.size(),
                    values.size()));
  }
  auto result = metadata{};
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (result.get(keys[i])) {
      kraken::common::fail(
          error_code::metadata_key_already_exists,
          fmt::format("metadata key '{}' is listed twice", keys[i]));
    }
    result.entries_.push_back(
        kraken::schema::metadata_entry_t{.key = keys[i], .value = values[i]});
  }
  return result;
}

metadata::metadata(std::vector<kraken::schema::metadata_entry_t> entries)
    : entries_{std::move(entries)} {}

std::optional<std::string_view> metadata::get(const std::string_view key) const {
  auto it = std::find_if(std::begin(entries_), std::end(entries_),
                         [&](const kraken::schema::metadata_entry_t& entry) {
                           return entry.key == key;
                         });
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return std::string_view{it->value};
}

}  // namespace kraken::account
