#pragma once

#include <distributor/config/distribution_config.hpp>
#include <distributor/referral/lookup.hpp>
#include <distributor/schema/encoding/scale/encoder.hpp>
#include <distributor/schema/instruction.hpp>
#include <distributor/schema/payment_request.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/referral_chain.hpp>

#include <optional>
#include <string>
#include <vector>

namespace distributor::builder {

struct build_request_t final {
  /// Decimal whole units, e.g. "1.5".
  std::string gross_whole_units;
  std::optional<std::string> referral_code;
  distributor::schema::address_t payer{};
  /// Skip the lookup and use these referrers as given.
  std::optional<distributor::schema::referral_chain_t> referrers;
};

struct build_output_t final {
  distributor::schema::instruction_t instruction;
  distributor::schema::payment_request_t request;
  distributor::schema::referral_chain_t referrers;
  std::vector<std::string> warnings;
};

/// Encode the payload and account list for one payment against a resolved
/// referral chain. Presence flags follow the chain.
distributor::schema::instruction_t make_instruction(
    distributor::schema::encoding::scale_encoder_t& encoder,
    const distributor::config::distribution_config_t& config,
    const distributor::schema::address_t& payer,
    distributor::schema::amount_t gross_amount,
    const distributor::schema::referral_chain_t& referrers);

/// Client-side assembly of settlement instructions.
class instruction_builder final {
 public:
  /// `lookup` may be empty, in which case a referral code only produces a
  /// warning. `second_tier_lookup` serves the referrer-of-referrer step and
  /// defaults to `lookup`.
  instruction_builder(
      distributor::schema::encoding::scale_encoder_t& encoder,
      distributor::config::distribution_config_t config,
      distributor::referral::referral_lookup_t lookup = {},
      distributor::referral::referral_lookup_t second_tier_lookup = {});

  /// Convert the amount, resolve referrers and encode the instruction.
  ///
  /// Only an unusable amount fails the build; `error` then starts with
  /// `arithmetic_overflow` for out-of-range values. Referral failures are
  /// returned in `build_output_t::warnings`.
  std::optional<build_output_t> build(const build_request_t& request,
                                      std::string& error);

 private:
  distributor::schema::encoding::scale_encoder_t& encoder_;
  distributor::config::distribution_config_t config_;
  distributor::referral::referral_lookup_t lookup_;
  distributor::referral::referral_lookup_t second_tier_lookup_;
};

}  // namespace distributor::builder
