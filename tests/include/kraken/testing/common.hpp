#pragma once

#include <kraken/common/error.hpp>
#include <kraken/schema/error_code.hpp>
#include <kraken/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace kraken::testing {

inline kraken::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = kraken::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline kraken::schema::address_t make_address(const uint8_t seed) {
  auto addr = kraken::schema::address_t{};
  addr[0] = seed;
  return addr;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Code `fn` aborted with, or `ok` when it returned normally.
template <typename Fn>
kraken::schema::error_code abort_code_of(Fn&& fn) {
  try {
    fn();
  } catch (const kraken::common::abort_error& error) {
    return error.code();
  }
  return kraken::schema::error_code::ok;
}

}  // namespace kraken::testing
