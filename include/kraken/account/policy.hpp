#pragma once
#include <string_view>

namespace kraken::account {

/// Approval policy selected by tag. A specialization provides:
///  - `config_t`: policy state stored on the account,
///  - `outcome_t`: approval tracking state stored on every intent,
///  - `kModuleName`: module whose witnesses may mutate config and outcomes,
///  - `static bool validate(const outcome_t&, const config_t&,
///                          std::string_view role)`,
///  - `static auth_t authenticate(const account<Tag>&, const address_t&)`,
///    the only way to obtain an `auth_t`.
template <typename Tag>
struct policy;

}  // namespace kraken::account
