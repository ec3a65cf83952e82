#pragma once
#include <distributor/schema/account_role.hpp>
#include <distributor/schema/primitives.hpp>

// Schema type: transfer.
// Settlement workflow: one native balance movement requested from the host
// ledger. `role` records which account slot received it.
namespace distributor::schema {

struct transfer_t final {
  address_t from{};
  address_t to{};
  amount_t amount{};
  account_role_t role{account_role_t::treasury};

  bool operator==(const transfer_t&) const = default;
};

}  // namespace distributor::schema
