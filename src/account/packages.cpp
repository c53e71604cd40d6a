#include <kraken/account/packages.hpp>
#include <kraken/blake3/hash.hpp>

namespace kraken::account {

kraken::schema::address_t make_package_address(const std::string_view name) {
  return kraken::blake3::hash(name);
}

kraken::schema::version_witness_t account_protocol_version() {
  return {.package_addr = make_package_address(kAccountProtocolName),
          .version = kCurrentVersion};
}

kraken::schema::version_witness_t account_multisig_version() {
  return {.package_addr = make_package_address(kAccountMultisigName),
          .version = kCurrentVersion};
}

kraken::schema::version_witness_t account_actions_version() {
  return {.package_addr = make_package_address(kAccountActionsName),
          .version = kCurrentVersion};
}

}  // namespace kraken::account
