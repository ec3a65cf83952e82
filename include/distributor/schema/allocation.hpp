#pragma once
#include <distributor/schema/primitives.hpp>

#include <cstdint>

// Schema type: allocation.
// Settlement workflow: exact per-party split of one gross amount.
// treasury + team + first + second always equals the gross amount.
namespace distributor::schema {

template <uint16_t Version>
struct allocation;

template <>
struct allocation<1> final {
  uint16_t version{1};
  amount_t treasury{};
  amount_t team{};
  amount_t first{};
  amount_t second{};

  bool operator==(const allocation<1>&) const = default;
};

using allocation_t = allocation<1>;

}  // namespace distributor::schema
