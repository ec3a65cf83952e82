#pragma once

#include <distributor/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: account role.
// Settlement workflow: position of an account in the fixed six-entry list.
// The enumerator value is the account index.
namespace distributor::schema {

enum class account_role_t : uint8_t {
  payer = 0,
  treasury = 1,
  team = 2,
  first_referrer = 3,
  second_referrer = 4,
  system_program = 5
};

inline constexpr auto kSettlementAccountCount = std::size_t{6};

inline constexpr auto kAccountRoleMappings = std::array{
    std::pair<std::string_view, account_role_t>{"payer",
                                                account_role_t::payer},
    std::pair<std::string_view, account_role_t>{"treasury",
                                                account_role_t::treasury},
    std::pair<std::string_view, account_role_t>{"team", account_role_t::team},
    std::pair<std::string_view, account_role_t>{
        "first_referrer", account_role_t::first_referrer},
    std::pair<std::string_view, account_role_t>{
        "second_referrer", account_role_t::second_referrer},
    std::pair<std::string_view, account_role_t>{
        "system_program", account_role_t::system_program},
};

template <>
inline std::optional<account_role_t> try_from_string<account_role_t>(
    const std::string_view value) {
  return from_string(value, kAccountRoleMappings);
}

inline constexpr std::string_view to_string(const account_role_t value) {
  return to_string(value, kAccountRoleMappings).value_or("unknown");
}

inline constexpr std::size_t index_of(const account_role_t value) {
  return static_cast<std::size_t>(value);
}

}  // namespace distributor::schema
