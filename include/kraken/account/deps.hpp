#pragma once
#include <kraken/account/extensions.hpp>
#include <kraken/schema/dep.hpp>
#include <kraken/schema/primitives.hpp>
#include <kraken/schema/version_witness.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kraken::account {

/// Packages an account accepts calls from. `AccountProtocol` is always the
/// first entry.
class deps final {
 public:
  /// Validate and build a deps list. Unless `unverified_allowed` is set,
  /// every entry must be a release recorded in `extensions`.
  static deps create(const extensions& extensions,
                     bool unverified_allowed,
                     const std::vector<std::string>& names,
                     const std::vector<kraken::schema::address_t>& addrs,
                     const std::vector<uint64_t>& versions);

  /// Same as `create` with the latest release of each named extension.
  static deps create_latest_extensions(const extensions& extensions,
                                       const std::vector<std::string>& names);

  deps() = default;
  explicit deps(kraken::schema::deps_state_t state);

  /// Fails with `not_dep` unless the calling package is listed at that
  /// version.
  void check(const kraken::schema::version_witness_t& version) const;

  std::optional<kraken::schema::dep_t> get_by_name(std::string_view name) const;
  std::optional<kraken::schema::dep_t> get_by_addr(
      const kraken::schema::address_t& addr) const;
  bool contains_name(std::string_view name) const;
  bool contains_addr(const kraken::schema::address_t& addr) const;

  uint64_t length() const { return state_.inner.size(); }
  bool unverified_allowed() const { return state_.unverified_allowed; }
  void toggle_unverified_allowed();

  const kraken::schema::deps_state_t& state() const { return state_; }

 private:
  kraken::schema::deps_state_t state_;
};

}  // namespace kraken::account
