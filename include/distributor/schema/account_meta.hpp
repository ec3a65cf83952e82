#pragma once
#include <distributor/schema/primitives.hpp>

// Schema type: account meta.
// Settlement workflow: one positional entry of an instruction's account list
// together with the privileges the caller grants it.
namespace distributor::schema {

struct account_meta_t final {
  address_t address{};
  bool is_signer{};
  bool is_writable{};

  bool operator==(const account_meta_t&) const = default;
};

}  // namespace distributor::schema
