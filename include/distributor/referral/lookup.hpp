#pragma once

#include <distributor/schema/enum_string.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/schema/referral_chain.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distributor::referral {

enum class lookup_tier : uint8_t {
  first = 0,
  second = 1,
};

inline constexpr auto kLookupTierMappings = std::array{
    std::pair<std::string_view, lookup_tier>{"first-tier", lookup_tier::first},
    std::pair<std::string_view, lookup_tier>{"second-tier",
                                             lookup_tier::second},
};

inline constexpr std::string_view to_string(const lookup_tier value) {
  return distributor::schema::to_string(value, kLookupTierMappings)
      .value_or("unknown");
}

/// Answer from the referral service for one key.
struct lookup_result_t final {
  bool success{};
  std::optional<distributor::schema::address_t> referrer_wallet;
  std::string message;
};

/// Resolves a key (referral code or base58 wallet) to at most one referrer.
using referral_lookup_t =
    std::function<lookup_result_t(std::string_view key)>;

struct resolution_t final {
  distributor::schema::referral_chain_t chain;
  /// One entry per degraded tier.
  std::vector<std::string> warnings;
};

/// Walk the referral chain for `referral_code`.
///
/// The first tier is looked up by code, the second by the first tier's
/// base58 wallet. A failed first tier skips the second lookup. A failed
/// second tier keeps the first. Failures, including exceptions thrown by
/// `lookup`, become warnings and never propagate.
resolution_t resolve_referral_chain(const referral_lookup_t& lookup,
                                    std::string_view referral_code);

/// As above, with the second tier served by `second_tier`. An empty
/// `second_tier` falls back to `first_tier`.
resolution_t resolve_referral_chain(const referral_lookup_t& first_tier,
                                    const referral_lookup_t& second_tier,
                                    std::string_view referral_code);

}  // namespace distributor::referral
