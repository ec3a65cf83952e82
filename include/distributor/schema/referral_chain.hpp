#pragma once
#include <distributor/schema/primitives.hpp>

#include <optional>

// Schema type: referral chain.
// Settlement workflow: typed view of the two referrer slots. Absent tiers are
// std::nullopt; the payer-as-placeholder convention never leaks past the
// account list boundary.
namespace distributor::schema {

struct referral_chain_t final {
  std::optional<address_t> first;
  std::optional<address_t> second;

  bool operator==(const referral_chain_t&) const = default;
};

}  // namespace distributor::schema
