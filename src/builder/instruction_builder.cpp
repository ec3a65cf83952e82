#include <distributor/builder/instruction_builder.hpp>
#include <distributor/builder/units.hpp>
#include <distributor/execution/account_list.hpp>
#include <distributor/schema/encoding/scale/payment_request.hpp>
#include <distributor/schema/settlement_error_code.hpp>

#include <spdlog/spdlog.h>
#include <utility>

using namespace distributor::schema;

namespace distributor::builder {

instruction_t make_instruction(encoding::scale_encoder_t& encoder,
                               const distributor::config::distribution_config_t& config,
                               const address_t& payer,
                               const amount_t gross_amount,
                               const referral_chain_t& referrers) {
  auto request = payment_request_t{
      .gross_amount = gross_amount,
      .has_first_referrer = referrers.first.has_value(),
      .has_second_referrer = referrers.second.has_value()};

  auto instruction = instruction_t{};
  instruction.program_id = config.program_id;
  instruction.accounts =
      distributor::execution::make_account_list(config, payer, referrers);
  instruction.data = encoding::scale::encode(encoder, request);
  return instruction;
}

instruction_builder::instruction_builder(
    encoding::scale_encoder_t& encoder,
    distributor::config::distribution_config_t config,
    distributor::referral::referral_lookup_t lookup,
    distributor::referral::referral_lookup_t second_tier_lookup)
    : encoder_{encoder},
      config_{std::move(config)},
      lookup_{std::move(lookup)},
      second_tier_lookup_{std::move(second_tier_lookup)} {}

std::optional<build_output_t> instruction_builder::build(
    const build_request_t& request,
    std::string& error) {
  auto reason = amount_parse_error::malformed;
  auto gross = to_subunits(request.gross_whole_units, reason, error);
  if (!gross) {
    if (reason == amount_parse_error::overflow) {
      error = std::string{to_string(settlement_error_code::arithmetic_overflow)} +
              ": " + error;
    }
    return std::nullopt;
  }

  auto output = build_output_t{};
  if (request.referrers) {
    output.referrers = *request.referrers;
  } else if (request.referral_code && !request.referral_code->empty()) {
    auto resolution = distributor::referral::resolve_referral_chain(
        lookup_, second_tier_lookup_, *request.referral_code);
    output.referrers = resolution.chain;
    output.warnings = std::move(resolution.warnings);
  }

  output.instruction =
      make_instruction(encoder_, config_, request.payer, *gross, output.referrers);
  output.request = payment_request_t{
      .gross_amount = *gross,
      .has_first_referrer = output.referrers.first.has_value(),
      .has_second_referrer = output.referrers.second.has_value()};
  spdlog::info("Built instruction for {} subunits from {} ({} referrer(s))",
               *gross, to_base58(request.payer),
               static_cast<int>(output.referrers.first.has_value()) +
                   static_cast<int>(output.referrers.second.has_value()));
  return output;
}

}  // namespace distributor::builder
