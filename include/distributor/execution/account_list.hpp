#pragma once

#include <distributor/config/distribution_config.hpp>
#include <distributor/schema/account_meta.hpp>
#include <distributor/schema/payment_request.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/referral_chain.hpp>
#include <distributor/schema/settlement_error_code.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace distributor::execution {

/// Typed view of a validated six-entry account list.
struct settlement_accounts_t final {
  distributor::schema::address_t payer{};
  distributor::schema::address_t treasury{};
  distributor::schema::address_t team{};
  distributor::schema::referral_chain_t referrers;
  distributor::schema::address_t system_program{};
};

/// Assemble the ordered account list for one payment.
///
/// Absent referrers are filled with the payer's address. Both referrer slots
/// are writable whether or not they hold a real referrer.
std::vector<distributor::schema::account_meta_t> make_account_list(
    const distributor::config::distribution_config_t& config,
    const distributor::schema::address_t& payer,
    const distributor::schema::referral_chain_t& referrers);

/// Validate a positional account list against the configured shape and
/// lift the referrer slots into a referral chain using the request flags.
///
/// A slot whose flag is false is ignored, whatever address it holds. On
/// failure `code` and `error` describe the first violated rule.
std::optional<settlement_accounts_t> decode_account_list(
    const distributor::config::distribution_config_t& config,
    const distributor::schema::payment_request_t& request,
    std::span<const distributor::schema::account_meta_t> accounts,
    distributor::schema::settlement_error_code& code,
    std::string& error);

}  // namespace distributor::execution
