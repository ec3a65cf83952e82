#pragma once

#include <distributor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace distributor::schema {

enum class settlement_error_code : uint32_t {
  invalid_payload_length = 1,
  invalid_account_count = 10,
  payer_not_signer = 11,
  account_not_writable = 12,
  treasury_mismatch = 13,
  team_mismatch = 14,
  system_program_mismatch = 15,
  arithmetic_overflow = 20,
  insufficient_balance = 30,
  invalid_transfer_destination = 31,
};

inline constexpr auto kDecodeCodespace = std::string_view{"distributor.decode"};
inline constexpr auto kAccountsCodespace =
    std::string_view{"distributor.accounts"};
inline constexpr auto kAllocateCodespace =
    std::string_view{"distributor.allocate"};
inline constexpr auto kTransferCodespace =
    std::string_view{"distributor.transfer"};

inline constexpr auto kSettlementErrorCodeMappings = std::array{
    std::pair<std::string_view, settlement_error_code>{
        "invalid_payload_length", settlement_error_code::invalid_payload_length},
    std::pair<std::string_view, settlement_error_code>{
        "invalid_account_count", settlement_error_code::invalid_account_count},
    std::pair<std::string_view, settlement_error_code>{
        "payer_not_signer", settlement_error_code::payer_not_signer},
    std::pair<std::string_view, settlement_error_code>{
        "account_not_writable", settlement_error_code::account_not_writable},
    std::pair<std::string_view, settlement_error_code>{
        "treasury_mismatch", settlement_error_code::treasury_mismatch},
    std::pair<std::string_view, settlement_error_code>{
        "team_mismatch", settlement_error_code::team_mismatch},
    std::pair<std::string_view, settlement_error_code>{
        "system_program_mismatch",
        settlement_error_code::system_program_mismatch},
    std::pair<std::string_view, settlement_error_code>{
        "arithmetic_overflow", settlement_error_code::arithmetic_overflow},
    std::pair<std::string_view, settlement_error_code>{
        "insufficient_balance", settlement_error_code::insufficient_balance},
    std::pair<std::string_view, settlement_error_code>{
        "invalid_transfer_destination",
        settlement_error_code::invalid_transfer_destination},
};

inline constexpr std::string_view to_string(const settlement_error_code value) {
  return to_string(value, kSettlementErrorCodeMappings).value_or("unknown");
}

/// Codespace a failure is reported under; groups codes by pipeline stage.
inline constexpr std::string_view codespace_of(
    const settlement_error_code value) {
  const auto code = static_cast<uint32_t>(value);
  if (code < 10) {
    return kDecodeCodespace;
  }
  if (code < 20) {
    return kAccountsCodespace;
  }
  if (code < 30) {
    return kAllocateCodespace;
  }
  return kTransferCodespace;
}

}  // namespace distributor::schema
