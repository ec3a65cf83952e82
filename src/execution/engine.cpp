#include <distributor/allocation/allocate.hpp>
#include <distributor/common/critical.hpp>
#include <distributor/execution/engine.hpp>
#include <distributor/schema/encoding/scale/payment_request.hpp>

#include <spdlog/spdlog.h>
#include <utility>

using namespace distributor::schema;

namespace {

settlement_result_t make_error_result(const settlement_error_code code,
                                      std::string info) {
  auto result = settlement_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace_of(code)};
  spdlog::warn("Rejected instruction: {} ({})", result.log, result.info);
  return result;
}

settlement_result_t make_transfer_error_result(
    const distributor::ledger::apply_result& applied) {
  switch (applied.status) {
    case distributor::ledger::apply_status::insufficient_balance:
      return make_error_result(settlement_error_code::insufficient_balance,
                               applied.detail);
    case distributor::ledger::apply_status::invalid_destination:
      return make_error_result(
          settlement_error_code::invalid_transfer_destination, applied.detail);
    case distributor::ledger::apply_status::balance_overflow: {
      // Reported as arithmetic overflow, but under the stage that hit it.
      auto result = make_error_result(
          settlement_error_code::arithmetic_overflow, applied.detail);
      result.codespace = std::string{kTransferCodespace};
      return result;
    }
    case distributor::ledger::apply_status::applied:
      break;
  }
  distributor::common::critical("ledger reported success as a failure");
}

}  // namespace

namespace distributor::execution {

engine::engine(encoding::scale_encoder_t& encoder,
               distributor::ledger::memory_ledger_t& ledger,
               distributor::config::distribution_config_t config)
    : encoder_{encoder}, ledger_{ledger}, config_{std::move(config)} {
  auto error = std::string{};
  if (!distributor::config::validate_config(config_, error)) {
    distributor::common::critical("invalid distribution config: {}", error);
  }
  spdlog::info(
      "Settlement engine ready: treasury {} team {} caps {}/{}",
      to_base58(config_.treasury), to_base58(config_.team),
      config_.first_referrer_cap, config_.second_referrer_cap);
}

settlement_result_t engine::process_instruction(
    const bytes_view_t& data,
    std::span<const account_meta_t> accounts) {
  auto error = std::string{};
  auto request = encoding::scale::decode(encoder_, data, error);
  if (!request) {
    return make_error_result(settlement_error_code::invalid_payload_length,
                             error);
  }

  auto code = settlement_error_code::invalid_account_count;
  auto decoded = decode_account_list(config_, *request, accounts, code, error);
  if (!decoded) {
    return make_error_result(code, error);
  }

  auto allocation = distributor::allocation::allocate(
      request->gross_amount, decoded->referrers.first.has_value(),
      decoded->referrers.second.has_value(), config_.first_referrer_cap,
      config_.second_referrer_cap, error);
  if (!allocation) {
    return make_error_result(settlement_error_code::arithmetic_overflow, error);
  }

  auto transfers = plan_transfers(*decoded, *allocation);
  auto applied = ledger_.apply(transfers);
  if (!applied.ok()) {
    return make_transfer_error_result(applied);
  }

  spdlog::info(
      "Settled {} from {}: treasury {} team {} first {} second {}",
      request->gross_amount, to_base58(decoded->payer), allocation->treasury,
      allocation->team, allocation->first, allocation->second);

  auto result = settlement_result_t{};
  result.code = 0;
  result.log = "settled";
  result.info = std::to_string(transfers.size()) + " transfer(s) applied";
  result.allocation = *allocation;
  result.transfers = std::move(transfers);
  return result;
}

const distributor::config::distribution_config_t& engine::config() const {
  return config_;
}

std::vector<transfer_t> plan_transfers(const settlement_accounts_t& accounts,
                                       const allocation_t& allocation) {
  auto transfers = std::vector<transfer_t>{};
  auto push = [&](const address_t& to, const amount_t amount,
                  const account_role_t role) {
    if (amount == 0) {
      return;
    }
    transfers.push_back(transfer_t{
        .from = accounts.payer, .to = to, .amount = amount, .role = role});
  };
  push(accounts.treasury, allocation.treasury, account_role_t::treasury);
  push(accounts.team, allocation.team, account_role_t::team);
  if (accounts.referrers.first) {
    push(*accounts.referrers.first, allocation.first,
         account_role_t::first_referrer);
  }
  if (accounts.referrers.second) {
    push(*accounts.referrers.second, allocation.second,
         account_role_t::second_referrer);
  }
  return transfers;
}

}  // namespace distributor::execution
