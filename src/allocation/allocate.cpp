#include <distributor/allocation/allocate.hpp>

#include <algorithm>
#include <limits>

using namespace distributor::schema;

namespace {

const auto kMaxAmount = wide_amount_t{std::numeric_limits<amount_t>::max()};

std::optional<amount_t> capped_share(const amount_t gross_amount,
                                     const uint64_t percent,
                                     const amount_t cap,
                                     std::string& error) {
  const wide_amount_t share = wide_amount_t{gross_amount} * percent /
               distributor::allocation::kPercentDenominator;
  if (share > kMaxAmount) {
    error = "referrer share exceeds amount range";
    return std::nullopt;
  }
  return std::min(share.convert_to<amount_t>(), cap);
}

}  // namespace

namespace distributor::allocation {

std::optional<allocation_t> allocate(const amount_t gross_amount,
                                     const bool has_first_referrer,
                                     const bool has_second_referrer,
                                     const amount_t first_cap,
                                     const amount_t second_cap,
                                     std::string& error) {
  auto result = allocation_t{};
  result.treasury = gross_amount / 2;

  if (has_first_referrer) {
    auto first =
        capped_share(gross_amount, kFirstReferrerPercent, first_cap, error);
    if (!first) {
      return std::nullopt;
    }
    result.first = *first;
  }

  if (has_second_referrer) {
    auto second =
        capped_share(gross_amount, kSecondReferrerPercent, second_cap, error);
    if (!second) {
      return std::nullopt;
    }
    result.second = *second;
  }

  const wide_amount_t distributed =
      wide_amount_t{result.treasury} + result.first + result.second;
  if (distributed > wide_amount_t{gross_amount}) {
    error = "allocated shares exceed gross amount";
    return std::nullopt;
  }
  result.team = gross_amount - distributed.convert_to<amount_t>();
  return result;
}

}  // namespace distributor::allocation
