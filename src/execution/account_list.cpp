#include <distributor/execution/account_list.hpp>
#include <distributor/schema/account_role.hpp>

#include <spdlog/spdlog.h>
#include <array>

using namespace distributor::schema;

namespace {

constexpr auto kReceivingRoles =
    std::array{account_role_t::treasury, account_role_t::team,
               account_role_t::first_referrer, account_role_t::second_referrer};

std::optional<address_t> lift_referrer_slot(const account_meta_t& slot,
                                            const address_t& payer,
                                            const bool present,
                                            const account_role_t role) {
  if (present) {
    return slot.address;
  }
  if (slot.address != payer) {
    spdlog::debug("Ignoring {} slot {}: flag not set", to_string(role),
                  to_base58(slot.address));
  }
  return std::nullopt;
}

}  // namespace

namespace distributor::execution {

std::vector<account_meta_t> make_account_list(
    const distributor::config::distribution_config_t& config,
    const address_t& payer,
    const referral_chain_t& referrers) {
  auto accounts = std::vector<account_meta_t>{};
  accounts.reserve(kSettlementAccountCount);
  accounts.push_back(
      account_meta_t{.address = payer, .is_signer = true, .is_writable = true});
  accounts.push_back(account_meta_t{
      .address = config.treasury, .is_signer = false, .is_writable = true});
  accounts.push_back(account_meta_t{
      .address = config.team, .is_signer = false, .is_writable = true});
  accounts.push_back(account_meta_t{.address = referrers.first.value_or(payer),
                                    .is_signer = false,
                                    .is_writable = true});
  accounts.push_back(account_meta_t{.address = referrers.second.value_or(payer),
                                    .is_signer = false,
                                    .is_writable = true});
  accounts.push_back(account_meta_t{.address = config.system_program,
                                    .is_signer = false,
                                    .is_writable = false});
  return accounts;
}

std::optional<settlement_accounts_t> decode_account_list(
    const distributor::config::distribution_config_t& config,
    const payment_request_t& request,
    std::span<const account_meta_t> accounts,
    settlement_error_code& code,
    std::string& error) {
  if (accounts.size() != kSettlementAccountCount) {
    code = settlement_error_code::invalid_account_count;
    error = "expected " + std::to_string(kSettlementAccountCount) +
            " accounts, got " + std::to_string(accounts.size());
    return std::nullopt;
  }

  const auto& payer = accounts[index_of(account_role_t::payer)];
  if (!payer.is_signer) {
    code = settlement_error_code::payer_not_signer;
    error = "payer " + to_base58(payer.address) + " did not sign";
    return std::nullopt;
  }
  if (!payer.is_writable) {
    code = settlement_error_code::account_not_writable;
    error = "payer account is not writable";
    return std::nullopt;
  }
  for (const auto role : kReceivingRoles) {
    if (!accounts[index_of(role)].is_writable) {
      code = settlement_error_code::account_not_writable;
      error = std::string{to_string(role)} + " account is not writable";
      return std::nullopt;
    }
  }

  const auto& treasury = accounts[index_of(account_role_t::treasury)];
  if (treasury.address != config.treasury) {
    code = settlement_error_code::treasury_mismatch;
    error = "treasury account " + to_base58(treasury.address) +
            " does not match configured " + to_base58(config.treasury);
    return std::nullopt;
  }
  const auto& team = accounts[index_of(account_role_t::team)];
  if (team.address != config.team) {
    code = settlement_error_code::team_mismatch;
    error = "team account " + to_base58(team.address) +
            " does not match configured " + to_base58(config.team);
    return std::nullopt;
  }
  const auto& system_program =
      accounts[index_of(account_role_t::system_program)];
  if (system_program.address != config.system_program) {
    code = settlement_error_code::system_program_mismatch;
    error = "system program account " + to_base58(system_program.address) +
            " does not match configured " + to_base58(config.system_program);
    return std::nullopt;
  }

  auto decoded = settlement_accounts_t{};
  decoded.payer = payer.address;
  decoded.treasury = treasury.address;
  decoded.team = team.address;
  decoded.system_program = system_program.address;
  decoded.referrers.first = lift_referrer_slot(
      accounts[index_of(account_role_t::first_referrer)], payer.address,
      request.has_first_referrer, account_role_t::first_referrer);
  decoded.referrers.second = lift_referrer_slot(
      accounts[index_of(account_role_t::second_referrer)], payer.address,
      request.has_second_referrer, account_role_t::second_referrer);
  return decoded;
}

}  // namespace distributor::execution
