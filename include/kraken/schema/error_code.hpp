#pragma once

#include <kraken/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Abort codes raised by the account core, the reference policy, the bundled
// action modules and the execution engine. Values are grouped by category
// in blocks of ten and are persisted in transaction results, so they never
// get renumbered.
namespace kraken::schema {

enum class error_code : uint32_t {
  ok = 0,
  // provenance
  wrong_account = 1,
  wrong_witness = 2,
  // temporal
  cant_be_executed_yet = 10,
  hasnt_expired = 11,
  execution_times_not_ascending = 12,
  no_execution_time = 13,
  // registry state
  key_already_exists = 20,
  intent_not_found = 21,
  object_already_locked = 22,
  object_not_locked = 23,
  actions_not_empty = 24,
  cant_be_removed_yet = 25,
  actions_remaining = 26,
  wrong_action_type = 27,
  no_more_actions = 28,
  // policy
  threshold_not_reached = 30,
  not_member = 31,
  already_approved = 32,
  not_approved = 33,
  members_not_same_length = 34,
  roles_not_same_length = 35,
  threshold_too_high = 36,
  threshold_null = 37,
  role_not_added = 38,
  duplicate_member = 39,
  // dependencies
  not_dep = 40,
  not_extension = 41,
  dep_already_exists = 42,
  account_protocol_missing = 43,
  deps_not_same_length = 44,
  // extensions
  extension_already_exists = 50,
  extension_not_found = 51,
  cannot_remove_account_protocol = 52,
  version_not_increasing = 53,
  // metadata
  metadata_not_same_length = 60,
  metadata_key_already_exists = 61,
  // engine
  account_missing = 70,
  invalid_transaction = 71,
  account_changed = 72,
};

enum class error_category : uint8_t {
  none = 0,
  provenance = 1,
  temporal = 2,
  state = 3,
  policy = 4,
  dependency = 5,
  extension = 6,
  metadata = 7,
  engine = 8
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"wrong_account",
                                            error_code::wrong_account},
    std::pair<std::string_view, error_code>{"wrong_witness",
                                            error_code::wrong_witness},
    std::pair<std::string_view, error_code>{"cant_be_executed_yet",
                                            error_code::cant_be_executed_yet},
    std::pair<std::string_view, error_code>{"hasnt_expired",
                                            error_code::hasnt_expired},
    std::pair<std::string_view, error_code>{
        "execution_times_not_ascending",
        error_code::execution_times_not_ascending},
    std::pair<std::string_view, error_code>{"no_execution_time",
                                            error_code::no_execution_time},
    std::pair<std::string_view, error_code>{"key_already_exists",
                                            error_code::key_already_exists},
    std::pair<std::string_view, error_code>{"intent_not_found",
                                            error_code::intent_not_found},
    std::pair<std::string_view, error_code>{"object_already_locked",
                                            error_code::object_already_locked},
    std::pair<std::string_view, error_code>{"object_not_locked",
                                            error_code::object_not_locked},
    std::pair<std::string_view, error_code>{"actions_not_empty",
                                            error_code::actions_not_empty},
    std::pair<std::string_view, error_code>{"cant_be_removed_yet",
                                            error_code::cant_be_removed_yet},
    std::pair<std::string_view, error_code>{"actions_remaining",
                                            error_code::actions_remaining},
    std::pair<std::string_view, error_code>{"wrong_action_type",
                                            error_code::wrong_action_type},
    std::pair<std::string_view, error_code>{"no_more_actions",
                                            error_code::no_more_actions},
    std::pair<std::string_view, error_code>{"threshold_not_reached",
                                            error_code::threshold_not_reached},
    std::pair<std::string_view, error_code>{"not_member",
                                            error_code::not_member},
    std::pair<std::string_view, error_code>{"already_approved",
                                            error_code::already_approved},
    std::pair<std::string_view, error_code>{"not_approved",
                                            error_code::not_approved},
    std::pair<std::string_view, error_code>{
        "members_not_same_length", error_code::members_not_same_length},
    std::pair<std::string_view, error_code>{"roles_not_same_length",
                                            error_code::roles_not_same_length},
    std::pair<std::string_view, error_code>{"threshold_too_high",
                                            error_code::threshold_too_high},
    std::pair<std::string_view, error_code>{"threshold_null",
                                            error_code::threshold_null},
    std::pair<std::string_view, error_code>{"role_not_added",
                                            error_code::role_not_added},
    std::pair<std::string_view, error_code>{"duplicate_member",
                                            error_code::duplicate_member},
    std::pair<std::string_view, error_code>{"not_dep", error_code::not_dep},
    std::pair<std::string_view, error_code>{"not_extension",
                                            error_code::not_extension},
    std::pair<std::string_view, error_code>{"dep_already_exists",
                                            error_code::dep_already_exists},
    std::pair<std::string_view, error_code>{
        "account_protocol_missing", error_code::account_protocol_missing},
    std::pair<std::string_view, error_code>{"deps_not_same_length",
                                            error_code::deps_not_same_length},
    std::pair<std::string_view, error_code>{
        "extension_already_exists", error_code::extension_already_exists},
    std::pair<std::string_view, error_code>{"extension_not_found",
                                            error_code::extension_not_found},
    std::pair<std::string_view, error_code>{
        "cannot_remove_account_protocol",
        error_code::cannot_remove_account_protocol},
    std::pair<std::string_view, error_code>{
        "version_not_increasing", error_code::version_not_increasing},
    std::pair<std::string_view, error_code>{
        "metadata_not_same_length", error_code::metadata_not_same_length},
    std::pair<std::string_view, error_code>{
        "metadata_key_already_exists",
        error_code::metadata_key_already_exists},
    std::pair<std::string_view, error_code>{"account_missing",
                                            error_code::account_missing},
    std::pair<std::string_view, error_code>{"invalid_transaction",
                                            error_code::invalid_transaction},
    std::pair<std::string_view, error_code>{"account_changed",
                                            error_code::account_changed}};

template <>
struct enum_names<error_code> final {
  static constexpr const auto& kMappings = kErrorCodeMappings;
};

static_assert(names_are_unique<error_code>());

inline constexpr std::string_view to_string(const error_code value) {
  return name_of(value).value_or("unknown");
}

inline constexpr error_category category_of(const error_code value) {
  const auto raw = static_cast<uint32_t>(value);
  if (raw == 0) {
    return error_category::none;
  }
  if (raw < 10) {
    return error_category::provenance;
  }
  switch (raw / 10) {
    case 1:
      return error_category::temporal;
    case 2:
      return error_category::state;
    case 3:
      return error_category::policy;
    case 4:
      return error_category::dependency;
    case 5:
      return error_category::extension;
    case 6:
      return error_category::metadata;
    default:
      return error_category::engine;
  }
}

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category>{"none", error_category::none},
    std::pair<std::string_view, error_category>{"provenance",
                                                error_category::provenance},
    std::pair<std::string_view, error_category>{"temporal",
                                                error_category::temporal},
    std::pair<std::string_view, error_category>{"state",
                                                error_category::state},
    std::pair<std::string_view, error_category>{"policy",
                                                error_category::policy},
    std::pair<std::string_view, error_category>{"dependency",
                                                error_category::dependency},
    std::pair<std::string_view, error_category>{"extension",
                                                error_category::extension},
    std::pair<std::string_view, error_category>{"metadata",
                                                error_category::metadata},
    std::pair<std::string_view, error_category>{"engine",
                                                error_category::engine}};

template <>
struct enum_names<error_category> final {
  static constexpr const auto& kMappings = kErrorCategoryMappings;
};

static_assert(names_are_unique<error_category>());

inline constexpr std::string_view to_string(const error_category value) {
  return name_of(value).value_or("unknown");
}

}  // namespace kraken::schema
