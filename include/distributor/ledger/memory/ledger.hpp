#pragma once
#include <distributor/ledger/ledger.hpp>
#include <distributor/schema/primitives.hpp>
#include <mutex>
#include <set>

namespace distributor::ledger {

struct memory_ledger_tag {};

/// In-process ledger. Accounts in the frozen set can never be credited;
/// the system program is frozen from construction.
template <>
struct ledger<memory_ledger_tag> final {
  explicit ledger(const distributor::schema::address_t& system_program =
                      distributor::schema::make_zero_address());

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  distributor::schema::amount_t balance(
      const distributor::schema::address_t& address) const;
  void deposit(const distributor::schema::address_t& address,
               distributor::schema::amount_t amount);
  apply_result apply(const std::vector<distributor::schema::transfer_t>& batch);
  balances_t balances() const;

  /// Mark an account as unable to receive transfers.
  void freeze(const distributor::schema::address_t& address);

 private:
  distributor::schema::amount_t balance_locked(
      const distributor::schema::address_t& address) const;

  mutable std::mutex mutex_;
  balances_t balances_;
  std::set<distributor::schema::address_t> frozen_;
};

using memory_ledger_t = ledger<memory_ledger_tag>;

}  // namespace distributor::ledger
