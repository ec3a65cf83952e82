#pragma once
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/transfer.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace distributor::ledger {

enum class apply_status : uint8_t {
  applied = 0,
  insufficient_balance = 1,
  invalid_destination = 2,
  balance_overflow = 3,
};

/// Outcome of submitting one transfer batch.
struct apply_result final {
  apply_status status{apply_status::applied};
  std::string detail;

  bool ok() const { return status == apply_status::applied; }
};

using balances_t =
    std::map<distributor::schema::address_t, distributor::schema::amount_t>;

/// Host balance store the settlement engine transfers against.
template <typename Backend>
struct ledger {
  /// Current balance of `address`; zero for an account never seen.
  distributor::schema::amount_t balance(
      const distributor::schema::address_t& address) const;

  /// Credit an account outside of any settlement (funding, fixtures).
  void deposit(const distributor::schema::address_t& address,
               distributor::schema::amount_t amount);

  /// Apply every transfer in order, or none of them.
  ///
  /// Balance checks and mutation happen under one lock, so no other batch
  /// can observe or interleave with a partially applied one.
  apply_result apply(const std::vector<distributor::schema::transfer_t>& batch);

  /// Copy of every known balance.
  balances_t balances() const;
};

}  // namespace distributor::ledger
