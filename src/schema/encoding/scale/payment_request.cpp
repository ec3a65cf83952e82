#include <distributor/schema/encoding/scale/payment_request.hpp>

#include <string>

using namespace distributor::schema;

namespace distributor::schema::encoding::scale {

bytes_t encode(scale_encoder_t& encoder, const payment_request_t& request) {
  return encoder.encode(payment_request_wire_t{
      request.gross_amount,
      static_cast<uint8_t>(request.has_first_referrer ? 1 : 0),
      static_cast<uint8_t>(request.has_second_referrer ? 1 : 0)});
}

std::optional<payment_request_t> decode(scale_encoder_t& encoder,
                                        const bytes_view_t& bytes,
                                        std::string& error) {
  if (bytes.size() != kPaymentRequestSize) {
    error = "expected " + std::to_string(kPaymentRequestSize) +
            " payload bytes, got " + std::to_string(bytes.size());
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<payment_request_wire_t>(bytes);
  if (!decoded.has_value()) {
    error = "malformed payment request payload";
    return std::nullopt;
  }
  auto [gross_amount, first_flag, second_flag] = *decoded;
  return payment_request_t{.gross_amount = gross_amount,
                           .has_first_referrer = first_flag != 0,
                           .has_second_referrer = second_flag != 0};
}

}  // namespace distributor::schema::encoding::scale
