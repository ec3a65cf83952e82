#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace distributor::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using address_t = std::array<uint8_t, 32>;
/// Smallest indivisible value unit ("subunit").
using amount_t = uint64_t;
/// Intermediate width for percentage products of an amount_t.
using wide_amount_t = boost::multiprecision::uint128_t;

inline constexpr auto kSubunitDecimals = std::size_t{9};
inline constexpr auto kSubunitsPerUnit = amount_t{1'000'000'000};

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

std::string to_base58(const bytes_view_t& bytes);
std::string to_base58(const address_t& address);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Parse a base58 public key; std::nullopt unless it decodes to 32 bytes.
std::optional<address_t> try_make_address(std::string_view base58);
address_t make_zero_address();

}  // namespace distributor::schema
