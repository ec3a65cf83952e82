#pragma once
#include <distributor/schema/account_meta.hpp>
#include <distributor/schema/primitives.hpp>

#include <vector>

// Schema type: instruction.
// Settlement workflow: what the builder hands to a caller for signing and
// broadcast: target program, ordered account list and raw payload.
namespace distributor::schema {

struct instruction_t final {
  address_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

}  // namespace distributor::schema
