#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace kraken::schema {

/// Stable names of an enum, as they appear in logs and transaction results.
/// Specialized next to the enum with a `kMappings` array of
/// `std::pair<std::string_view, Enum>`.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<std::string_view> name_of(const Enum value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// True when every value in the table has exactly one name.
template <typename Enum>
constexpr bool names_are_unique() {
  const auto& mappings = enum_names<Enum>::kMappings;
  for (std::size_t i = 0; i < mappings.size(); ++i) {
    for (std::size_t j = i + 1; j < mappings.size(); ++j) {
      if (mappings[i].first == mappings[j].first ||
          mappings[i].second == mappings[j].second) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace kraken::schema
