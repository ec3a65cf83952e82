#pragma once

#include <distributor/schema/allocation.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/settlement_error_code.hpp>
#include <distributor/schema/transfer.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace distributor::schema {

template <uint16_t Version>
struct settlement_result;

/// Outcome of one settlement invocation. `code == 0` means every transfer
/// was committed; any other code means nothing was applied.
template <>
struct settlement_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<allocation_t> allocation;
  std::vector<transfer_t> transfers;

  bool ok() const { return code == 0; }
};

using settlement_result_t = settlement_result<1>;

}  // namespace distributor::schema
