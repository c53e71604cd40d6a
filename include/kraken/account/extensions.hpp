#pragma once
#include <kraken/schema/extension.hpp>
#include <kraken/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace kraken::account {

class extensions;

/// Capability to curate the allow-list; handed out once by
/// `extensions::create`.
class admin_cap final {
 public:
  admin_cap(const admin_cap&) = delete;
  admin_cap& operator=(const admin_cap&) = delete;
  admin_cap(admin_cap&&) noexcept = default;
  admin_cap& operator=(admin_cap&&) noexcept = default;

 private:
  friend class extensions;
  admin_cap() = default;
};

/// Curated allow-list of packages accounts may depend on, with every release
/// of each package. Entry 0 is always `AccountProtocol` once initialised.
class extensions final {
 public:
  static std::pair<extensions, admin_cap> create();

  /// Register the framework packages at version 1: AccountProtocol,
  /// AccountMultisig and AccountActions, in that order.
  void init_core_deps(const admin_cap& cap,
                      const std::vector<kraken::schema::address_t>& addrs);

  void add(const admin_cap& cap,
           std::string_view name,
           const kraken::schema::address_t& addr,
           uint64_t version);

  /// Publish a new release of an existing package.
  void update(const admin_cap& cap,
              std::string_view name,
              const kraken::schema::address_t& addr,
              uint64_t version);

  void remove(const admin_cap& cap, std::string_view name);

  bool is_extension(std::string_view name,
                    const kraken::schema::address_t& addr,
                    uint64_t version) const;

  std::optional<kraken::schema::extension_release_t> get_latest_for_name(
      std::string_view name) const;

  uint64_t length() const { return inner_.size(); }
  const std::vector<kraken::schema::extension_t>& inner() const {
    return inner_;
  }

 private:
  extensions() = default;

  bool contains_addr(const kraken::schema::address_t& addr) const;

  std::vector<kraken::schema::extension_t> inner_;
};

}  // namespace kraken::account
