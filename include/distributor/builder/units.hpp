#pragma once

#include <distributor/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace distributor::builder {

enum class amount_parse_error : uint8_t { malformed, negative, overflow };

/// Convert a decimal string of whole units to subunits, floor(amount * 10^9).
///
/// Exact string arithmetic: fractional digits past the ninth are truncated.
/// Accepts `123`, `123.`, `.5` and `0.000000001`; rejects signs, exponents,
/// separators and values beyond the 64-bit subunit range.
std::optional<distributor::schema::amount_t> to_subunits(
    std::string_view whole_units,
    amount_parse_error& reason,
    std::string& error);

/// Render subunits as whole units with trailing fractional zeros removed.
std::string format_units(distributor::schema::amount_t subunits);

}  // namespace distributor::builder
