#pragma once
#include <distributor/schema/primitives.hpp>

#include <cstddef>

// Schema type: payment request.
// Settlement workflow: the entire decoded instruction payload. Referrer
// addresses travel positionally in the account list, never here.
namespace distributor::schema {

/// Fixed wire size: u64 gross amount followed by two flag bytes.
inline constexpr auto kPaymentRequestSize = std::size_t{10};

struct payment_request_t final {
  amount_t gross_amount{};
  bool has_first_referrer{};
  bool has_second_referrer{};

  bool operator==(const payment_request_t&) const = default;
};

}  // namespace distributor::schema
