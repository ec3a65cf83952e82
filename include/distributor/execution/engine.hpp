#pragma once

#include <distributor/config/distribution_config.hpp>
#include <distributor/execution/account_list.hpp>
#include <distributor/ledger/memory/ledger.hpp>
#include <distributor/schema/account_meta.hpp>
#include <distributor/schema/allocation.hpp>
#include <distributor/schema/encoding/scale/encoder.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/settlement_result.hpp>
#include <distributor/schema/transfer.hpp>

#include <span>
#include <vector>

namespace distributor::execution {

/// Settlement program: turns one payment instruction into an atomic batch of
/// ledger transfers.
///
/// The engine holds no state between invocations. Every call either commits
/// the full allocation or leaves the ledger untouched and reports a single
/// failure code.
class engine final {
 public:
  /// Construct against an encoder and ledger owned by the caller.
  ///
  /// `config` is validated here; an invalid config is fatal.
  explicit engine(
      distributor::schema::encoding::encoder<
          distributor::schema::encoding::scale_encoder_tag>& encoder,
      distributor::ledger::ledger<distributor::ledger::memory_ledger_tag>&
          ledger,
      distributor::config::distribution_config_t config);

  /// Decode, validate, allocate and transfer.
  ///
  /// `data` is the 10-byte payment payload and `accounts` the six-entry
  /// positional account list.
  distributor::schema::settlement_result_t process_instruction(
      const distributor::schema::bytes_view_t& data,
      std::span<const distributor::schema::account_meta_t> accounts);

  const distributor::config::distribution_config_t& config() const;

 private:
  distributor::schema::encoding::encoder<
      distributor::schema::encoding::scale_encoder_tag>& encoder_;
  distributor::ledger::ledger<distributor::ledger::memory_ledger_tag>& ledger_;
  distributor::config::distribution_config_t config_;
};

/// Payer-funded transfers for every nonzero share of `allocation`, in
/// treasury, team, first referrer, second referrer order.
std::vector<distributor::schema::transfer_t> plan_transfers(
    const settlement_accounts_t& accounts,
    const distributor::schema::allocation_t& allocation);

}  // namespace distributor::execution
