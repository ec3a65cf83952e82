#pragma once

#include <distributor/schema/allocation.hpp>
#include <distributor/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace distributor::allocation {

inline constexpr auto kFirstReferrerPercent = uint64_t{20};
inline constexpr auto kSecondReferrerPercent = uint64_t{5};
inline constexpr auto kPercentDenominator = uint64_t{100};

/// 0.2 whole units.
inline constexpr auto kDefaultFirstReferrerCap =
    distributor::schema::amount_t{200'000'000};
/// 0.05 whole units.
inline constexpr auto kDefaultSecondReferrerCap =
    distributor::schema::amount_t{50'000'000};

/// Split `gross_amount` between treasury, team and up to two referrers.
///
/// Treasury always receives floor(gross / 2). A present referrer receives
/// its percentage share clamped to its cap; an absent one receives nothing.
/// Team receives the residual, so the four amounts always sum to the gross
/// amount. Percentage products use a 128-bit intermediate; a result that
/// cannot be represented as an amount fails and fills `error`.
std::optional<distributor::schema::allocation_t> allocate(
    distributor::schema::amount_t gross_amount,
    bool has_first_referrer,
    bool has_second_referrer,
    distributor::schema::amount_t first_cap,
    distributor::schema::amount_t second_cap,
    std::string& error);

}  // namespace distributor::allocation
