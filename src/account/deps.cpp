#include <kraken/account/deps.hpp>
#include <kraken/account/packages.hpp>
#include <kraken/common/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

using kraken::schema::error_code;

namespace kraken::account {

deps deps::create(const extensions& extensions,
                  const bool unverified_allowed,
                  const std::vector<std::string>& names,
                  const std::vector<kraken::schema::address_t>& addrs,
                  const std::vector<uint64_t>& versions) {
  if (names.size() != addrs.size() || names.size() != versions.size()) {
    kraken::common::fail(
        error_code::deps_not_same_length,
        fmt::format("deps lists differ in length: {} names, {} addresses, {} "
                    "versions",
                    names.size(), addrs.size(), versions.size()));
  }
  if (names.empty() || names.front() != kAccountProtocolName) {
    kraken::common::fail(error_code::account_protocol_missing,
                         "AccountProtocol must be the first dep");
  }

  auto result = deps{};
  result.state_.unverified_allowed = unverified_allowed;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (result.contains_name(names[i]) || result.contains_addr(addrs[i])) {
      kraken::common::fail(
          error_code::dep_already_exists,
          fmt::format("dep '{}' at {} is listed twice", names[i],
                      kraken::schema::to_string(addrs[i])));
    }
    // The core must always be a vetted release.
    const auto must_be_extension =
        !unverified_allowed || names[i] == kAccountProtocolName;
    if (must_be_extension &&
        !extensions.is_extension(names[i], addrs[i], versions[i])) {
      kraken::common::fail(
          error_code::not_extension,
          fmt::format("'{}' v{} at {} is not an extension", names[i],
                      versions[i], kraken::schema::to_string(addrs[i])));
    }
    result.state_.inner.push_back(kraken::schema::dep_t{
        .name = names[i], .addr = addrs[i], .version = versions[i]});
  }
  return result;
}

deps deps::create_latest_extensions(const extensions& extensions,
                                    const std::vector<std::string>& names) {
  auto addrs = std::vector<kraken::schema::address_t>{};
  auto versions = std::vector<uint64_t>{};
  for (const auto& name : names) {
    auto latest = extensions.get_latest_for_name(name);
    if (!latest) {
      kraken::common::fail(error_code::not_extension,
                           fmt::format("'{}' is not an extension", name));
    }
    addrs.push_back(latest->addr);
    versions.push_back(latest->version);
  }
  return create(extensions, false, names, addrs, versions);
}

deps::deps(kraken::schema::deps_state_t state) : state_{std::move(state)} {}

void deps::check(const kraken::schema::version_witness_t& version) const {
  auto dep = get_by_addr(version.package_addr);
  if (!dep || dep->version != version.version) {
    kraken::common::fail(
        error_code::not_dep,
        fmt::format("package {} v{} is not a dep of this account",
                    kraken::schema::to_string(version.package_addr),
                    version.version));
  }
}

std::optional<kraken::schema::dep_t> deps::get_by_name(
    const std::string_view name) const {
  auto it = std::find_if(
      std::begin(state_.inner), std::end(state_.inner),
      [&](const kraken::schema::dep_t& dep) { return dep.name == name; });
  if (it == std::end(state_.inner)) {
    return std::nullopt;
  }
  return *it;
}

std::optional<kraken::schema::dep_t> deps::get_by_addr(
    const kraken::schema::address_t& addr) const {
  auto it = std::find_if(
      std::begin(state_.inner), std::end(state_.inner),
      [&](const kraken::schema::dep_t& dep) { return dep.addr == addr; });
  if (it == std::end(state_.inner)) {
    return std::nullopt;
  }
  return *it;
}

bool deps::contains_name(const std::string_view name) const {
  return get_by_name(name).has_value();
}

bool deps::contains_addr(const kraken::schema::address_t& addr) const {
  return get_by_addr(addr).has_value();
}

void deps::toggle_unverified_allowed() {
  state_.unverified_allowed = !state_.unverified_allowed;
  spdlog::info("Unverified deps {}",
               state_.unverified_allowed ? "allowed" : "disallowed");
}

}  // namespace kraken::account
