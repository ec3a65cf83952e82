#include <distributor/builder/units.hpp>

#include <limits>

using namespace distributor::schema;

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

namespace distributor::builder {

std::optional<amount_t> to_subunits(const std::string_view whole_units,
                                    amount_parse_error& reason,
                                    std::string& error) {
  if (whole_units.starts_with('-')) {
    reason = amount_parse_error::negative;
    error = "amount must not be negative: " + std::string{whole_units};
    return std::nullopt;
  }

  const auto dot = whole_units.find('.');
  const auto integer = whole_units.substr(0, dot);
  const auto fraction = dot == std::string_view::npos
                            ? std::string_view{}
                            : whole_units.substr(dot + 1);
  auto valid = !(integer.empty() && fraction.empty());
  for (const auto c : integer) {
    valid = valid && is_digit(c);
  }
  for (const auto c : fraction) {
    valid = valid && is_digit(c);
  }
  if (!valid) {
    reason = amount_parse_error::malformed;
    error = "not a decimal amount: '" + std::string{whole_units} + "'";
    return std::nullopt;
  }

  const auto max_amount = wide_amount_t{std::numeric_limits<amount_t>::max()};
  auto total = wide_amount_t{0};
  for (const auto c : integer) {
    total = total * 10 + static_cast<unsigned>(c - '0');
    if (total * kSubunitsPerUnit > max_amount) {
      reason = amount_parse_error::overflow;
      error = "amount exceeds the subunit range: " + std::string{whole_units};
      return std::nullopt;
    }
  }
  total *= kSubunitsPerUnit;

  auto scale = wide_amount_t{kSubunitsPerUnit};
  for (std::size_t i = 0; i < fraction.size() && i < kSubunitDecimals; ++i) {
    scale /= 10;
    total += scale * static_cast<unsigned>(fraction[i] - '0');
  }
  if (total > max_amount) {
    reason = amount_parse_error::overflow;
    error = "amount exceeds the subunit range: " + std::string{whole_units};
    return std::nullopt;
  }
  return total.convert_to<amount_t>();
}

std::string format_units(const amount_t subunits) {
  auto out = std::to_string(subunits / kSubunitsPerUnit);
  auto fraction = std::to_string(subunits % kSubunitsPerUnit);
  if (fraction == "0") {
    return out;
  }
  fraction.insert(0, kSubunitDecimals - fraction.size(), '0');
  while (fraction.back() == '0') {
    fraction.pop_back();
  }
  return out + "." + fraction;
}

}  // namespace distributor::builder
