#pragma once
#include <kraken/schema/member.hpp>
#include <kraken/schema/role_threshold.hpp>
#include <vector>

// Schema type: multisig config.
// Policy state of a multisig account. An intent passes when the approving
// weight reaches `global`, or when the weight of approving members holding
// the intent role reaches that role's threshold.
namespace kraken::schema {

template <uint16_t Version>
struct multisig_config;

template <>
struct multisig_config<1> final {
  uint16_t version{1};
  std::vector<member_t> members;
  uint64_t global{};
  std::vector<role_threshold_t> roles;
};

using multisig_config_t = multisig_config<1>;

}  // namespace kraken::schema
