#pragma once
#include <distributor/schema/encoding/scale/encoder.hpp>
#include <distributor/schema/payment_request.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

// Wire layout (10 bytes, fixed):
//   [0, 8)  gross amount, unsigned little-endian
//   [8]     has_first_referrer, 0 = false, nonzero = true
//   [9]     has_second_referrer, 0 = false, nonzero = true
namespace distributor::schema::encoding::scale {

using payment_request_wire_t = std::tuple<uint64_t, uint8_t, uint8_t>;

/// Encode to the 10-byte payload. Flags are written as 0 or 1.
distributor::schema::bytes_t encode(scale_encoder_t& encoder,
                                    const payment_request_t& request);

/// Decode the 10-byte payload. Any other length fails and `error` says why.
std::optional<payment_request_t> decode(
    scale_encoder_t& encoder,
    const distributor::schema::bytes_view_t& bytes,
    std::string& error);

}  // namespace distributor::schema::encoding::scale
