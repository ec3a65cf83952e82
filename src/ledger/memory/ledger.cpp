#include <distributor/common/critical.hpp>
#include <distributor/ledger/memory/ledger.hpp>

#include <spdlog/spdlog.h>
#include <limits>

using namespace distributor::schema;

namespace distributor::ledger {

ledger<memory_ledger_tag>::ledger(const address_t& system_program) {
  frozen_.insert(system_program);
}

amount_t ledger<memory_ledger_tag>::balance(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return balance_locked(address);
}

void ledger<memory_ledger_tag>::deposit(const address_t& address,
                                        const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  auto& balance = balances_[address];
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    distributor::common::critical("deposit overflows account balance");
  }
  balance += amount;
}

apply_result ledger<memory_ledger_tag>::apply(
    const std::vector<transfer_t>& batch) {
  auto lock = std::scoped_lock{mutex_};

  // Stage touched accounts; balances_ is only written once the whole batch
  // has been accepted.
  auto staged = balances_t{};
  auto staged_balance = [&](const address_t& address) -> amount_t& {
    auto [it, inserted] = staged.try_emplace(address, amount_t{});
    if (inserted) {
      it->second = balance_locked(address);
    }
    return it->second;
  };

  for (const auto& transfer : batch) {
    if (transfer.amount == 0) {
      continue;
    }
    if (frozen_.contains(transfer.to)) {
      return apply_result{.status = apply_status::invalid_destination,
                          .detail = "account " + to_base58(transfer.to) +
                                    " cannot receive transfers"};
    }
    auto& from = staged_balance(transfer.from);
    if (from < transfer.amount) {
      return apply_result{.status = apply_status::insufficient_balance,
                          .detail = "account " + to_base58(transfer.from) +
                                    " cannot cover " +
                                    std::to_string(transfer.amount)};
    }
    from -= transfer.amount;
    auto& to = staged_balance(transfer.to);
    if (to > std::numeric_limits<amount_t>::max() - transfer.amount) {
      return apply_result{.status = apply_status::balance_overflow,
                          .detail = "account " + to_base58(transfer.to) +
                                    " balance would overflow"};
    }
    to += transfer.amount;
  }

  for (const auto& [address, balance] : staged) {
    balances_[address] = balance;
  }
  spdlog::debug("Ledger applied batch touching {} account(s)", staged.size());
  return apply_result{};
}

balances_t ledger<memory_ledger_tag>::balances() const {
  auto lock = std::scoped_lock{mutex_};
  return balances_;
}

void ledger<memory_ledger_tag>::freeze(const address_t& address) {
  auto lock = std::scoped_lock{mutex_};
  frozen_.insert(address);
}

amount_t ledger<memory_ledger_tag>::balance_locked(
    const address_t& address) const {
  auto it = balances_.find(address);
  if (it == std::end(balances_)) {
    return 0;
  }
  return it->second;
}

}  // namespace distributor::ledger
