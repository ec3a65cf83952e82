#pragma once

#include <distributor/schema/enum_string.hpp>
#include <distributor/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace distributor::schema {

/// Text encodings accepted and produced for instruction data on the
/// command line.
enum class payload_format : uint8_t {
  base64 = 0,
  hex = 1,
};

inline constexpr auto kPayloadFormatMappings = std::array{
    std::pair<std::string_view, payload_format>{"base64",
                                                payload_format::base64},
    std::pair<std::string_view, payload_format>{"hex", payload_format::hex},
};

template <>
inline std::optional<payload_format> try_from_string<payload_format>(
    const std::string_view value) {
  return from_string(value, kPayloadFormatMappings);
}

inline constexpr std::string_view to_string(const payload_format value) {
  return to_string(value, kPayloadFormatMappings).value_or("unknown");
}

inline std::string format_payload(const bytes_view_t& bytes,
                                  const payload_format format) {
  if (format == payload_format::hex) {
    return to_hex(bytes);
  }
  return to_base64(bytes);
}

inline std::optional<bytes_t> try_parse_payload(const std::string_view text,
                                                const payload_format format) {
  if (format == payload_format::hex) {
    return try_from_hex(text);
  }
  return try_from_base64(text);
}

}  // namespace distributor::schema
