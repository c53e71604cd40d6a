#pragma once
#include <kraken/schema/primitives.hpp>
#include <optional>
#include <span>

namespace kraken::schema::encoding {

// Build time selection of the binary codec. Every persisted record and every
// action payload stored inside an intent goes through one of these; the
// library behind it is chosen by tag, hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  kraken::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, kraken::schema::bytes_t& out);

  template <typename T>
  T decode(const kraken::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const kraken::schema::bytes_view_t& bytes);
};

}  // namespace kraken::schema::encoding
