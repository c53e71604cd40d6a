#include <kraken/account/extensions.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/common/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using kraken::schema::error_code;

namespace kraken::account {

namespace {

auto find_name(const std::vector<kraken::schema::extension_t>& inner,
               const std::string_view name) {
  return std::find_if(
      std::begin(inner), std::end(inner),
      [&](const kraken::schema::extension_t& ext) { return ext.name == name; });
}

}  // namespace

std::pair<extensions, admin_cap> extensions::create() {
  return {extensions{}, admin_cap{}};
}

void extensions::init_core_deps(
    const admin_cap& cap,
    const std::vector<kraken::schema::address_t>& addrs) {
  kraken::common::ensure(addrs.size() == 3, error_code::deps_not_same_length,
                         "core deps expect three package addresses");
  add(cap, kAccountProtocolName, addrs[0], 1);
  add(cap, kAccountMultisigName, addrs[1], 1);
  add(cap, kAccountActionsName, addrs[2], 1);
}

void extensions::add(const admin_cap&,
                     const std::string_view name,
                     const kraken::schema::address_t& addr,
                     const uint64_t version) {
  if (find_name(inner_, name) != std::end(inner_)) {
    kraken::common::fail(error_code::extension_already_exists,
                         fmt::format("extension '{}' already exists", name));
  }
  if (contains_addr(addr)) {
    kraken::common::fail(
        error_code::extension_already_exists,
        fmt::format("address {} already belongs to an extension",
                    kraken::schema::to_string(addr)));
  }
  inner_.push_back(kraken::schema::extension_t{
      .name = std::string{name},
      .history = {kraken::schema::extension_release_t{.addr = addr,
                                                      .version = version}}});
  spdlog::info("Added extension '{}' v{} at {}", name, version,
               kraken::schema::to_string(addr));
}

void extensions::update(const admin_cap&,
                        const std::string_view name,
                        const kraken::schema::address_t& addr,
                        const uint64_t version) {
  auto it = std::find_if(
      std::begin(inner_), std::end(inner_),
      [&](const kraken::schema::extension_t& ext) { return ext.name == name; });
  if (it == std::end(inner_)) {
    kraken::common::fail(error_code::extension_not_found,
                         fmt::format("extension '{}' not found", name));
  }
  if (contains_addr(addr)) {
    kraken::common::fail(
        error_code::extension_already_exists,
        fmt::format("address {} already belongs to an extension",
                    kraken::schema::to_string(addr)));
  }
  if (version <= it->history.back().version) {
    kraken::common::fail(
        error_code::version_not_increasing,
        fmt::format("extension '{}' is at v{}, cannot publish v{}", name,
                    it->history.back().version, version));
  }
  it->history.push_back(
      kraken::schema::extension_release_t{.addr = addr, .version = version});
  spdlog::info("Updated extension '{}' to v{} at {}", name, version,
               kraken::schema::to_string(addr));
}

void extensions::remove(const admin_cap&, const std::string_view name) {
  auto it = std::find_if(
      std::begin(inner_), std::end(inner_),
      [&](const kraken::schema::extension_t& ext) { return ext.name == name; });
  if (it == std::end(inner_)) {
    kraken::common::fail(error_code::extension_not_found,
                         fmt::format("extension '{}' not found", name));
  }
  if (it->name == kAccountProtocolName) {
    kraken::common::fail(error_code::cannot_remove_account_protocol,
                         "AccountProtocol cannot be removed");
  }
  inner_.erase(it);
  spdlog::info("Removed extension '{}'", name);
}

bool extensions::is_extension(const std::string_view name,
                              const kraken::schema::address_t& addr,
                              const uint64_t version) const {
  auto it = find_name(inner_, name);
  if (it == std::end(inner_)) {
    return false;
  }
  return std::any_of(std::begin(it->history), std::end(it->history),
                     [&](const kraken::schema::extension_release_t& release) {
                       return release.addr == addr &&
                              release.version == version;
                     });
}

std::optional<kraken::schema::extension_release_t>
extensions::get_latest_for_name(const std::string_view name) const {
  auto it = find_name(inner_, name);
  if (it == std::end(inner_)) {
    return std::nullopt;
  }
  return it->history.back();
}

bool extensions::contains_addr(const kraken::schema::address_t& addr) const {
  return std::any_of(
      std::begin(inner_), std::end(inner_),
      [&](const kraken::schema::extension_t& ext) {
        return std::any_of(
            std::begin(ext.history), std::end(ext.history),
            [&](const kraken::schema::extension_release_t& release) {
              return release.addr == addr;
            });
      });
}

}  // namespace kraken::account
