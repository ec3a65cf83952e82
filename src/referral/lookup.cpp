#include <distributor/referral/lookup.hpp>

#include <spdlog/spdlog.h>
#include <exception>

using namespace distributor::schema;

namespace {

std::optional<address_t> query_tier(
    const distributor::referral::referral_lookup_t& lookup,
    const distributor::referral::lookup_tier tier,
    const std::string_view key,
    std::vector<std::string>& warnings) {
  auto result = distributor::referral::lookup_result_t{};
  try {
    result = lookup(key);
  } catch (const std::exception& ex) {
    result.success = false;
    result.message = ex.what();
  }
  if (result.success && result.referrer_wallet) {
    spdlog::debug("{} referrer for '{}' is {}", to_string(tier), key,
                  to_base58(*result.referrer_wallet));
    return result.referrer_wallet;
  }

  auto warning = std::string{to_string(tier)} + " referrer lookup for '" +
                 std::string{key} + "' failed";
  if (!result.message.empty()) {
    warning += ": " + result.message;
  } else if (result.success) {
    warning += ": no referrer wallet returned";
  }
  spdlog::warn("{}", warning);
  warnings.push_back(std::move(warning));
  return std::nullopt;
}

}  // namespace

namespace distributor::referral {

resolution_t resolve_referral_chain(const referral_lookup_t& lookup,
                                    const std::string_view referral_code) {
  return resolve_referral_chain(lookup, lookup, referral_code);
}

resolution_t resolve_referral_chain(const referral_lookup_t& first_tier,
                                    const referral_lookup_t& second_tier,
                                    const std::string_view referral_code) {
  auto resolution = resolution_t{};
  if (!first_tier) {
    resolution.warnings.emplace_back("no referral lookup configured");
    spdlog::warn("Referral code '{}' supplied without a lookup service",
                 referral_code);
    return resolution;
  }

  resolution.chain.first = query_tier(first_tier, lookup_tier::first,
                                      referral_code, resolution.warnings);
  if (!resolution.chain.first) {
    return resolution;
  }
  resolution.chain.second =
      query_tier(second_tier ? second_tier : first_tier, lookup_tier::second,
                 to_base58(*resolution.chain.first), resolution.warnings);
  return resolution;
}

}  // namespace distributor::referral
