#pragma once
#include <string>
#include <string_view>

// Witnesses are empty tag types exposing `kTypeName`, the fully qualified name
// of the module that owns them plus the tag itself, e.g.
// "kraken::actions::owned::withdraw_intent". Presenting the tag proves the
// caller is that module.
namespace kraken::account {

template <typename Witness>
constexpr std::string_view type_name() {
  return Witness::kTypeName;
}

template <typename Witness>
constexpr std::string_view type_name(const Witness&) {
  return Witness::kTypeName;
}

/// Everything before the last "::", or the whole name when unqualified.
constexpr std::string_view module_of(const std::string_view name) {
  const auto pos = name.rfind("::");
  if (pos == std::string_view::npos) {
    return name;
  }
  return name.substr(0, pos);
}

/// Role an intent is routed to for approval: the witness module plus a name
/// chosen by the proposer.
template <typename Witness>
std::string make_role(const std::string_view role_name) {
  auto role = std::string{module_of(type_name<Witness>())};
  role.append("::");
  role.append(role_name);
  return role;
}

}  // namespace kraken::account
