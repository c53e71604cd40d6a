#pragma once
#include <kraken/schema/primitives.hpp>
#include <kraken/schema/version_witness.hpp>
#include <cstdint>
#include <string_view>

// Packages shipped with the framework. `AccountProtocol` is the core and must
// sit first in every deps list.
namespace kraken::account {

inline constexpr std::string_view kAccountProtocolName{"AccountProtocol"};
inline constexpr std::string_view kAccountMultisigName{"AccountMultisig"};
inline constexpr std::string_view kAccountActionsName{"AccountActions"};
inline constexpr uint64_t kCurrentVersion{1};

/// BLAKE3 of the package name.
kraken::schema::address_t make_package_address(std::string_view name);

kraken::schema::version_witness_t account_protocol_version();
kraken::schema::version_witness_t account_multisig_version();
kraken::schema::version_witness_t account_actions_version();

}  // namespace kraken::account
