#pragma once

#include <distributor/config/distribution_config.hpp>
#include <distributor/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace distributor::testing {

inline distributor::schema::address_t make_address(const uint8_t seed) {
  auto out = distributor::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline distributor::schema::address_t program_id() {
  return make_address(0x70);
}
inline distributor::schema::address_t treasury() {
  return make_address(0x10);
}
inline distributor::schema::address_t team() {
  return make_address(0x20);
}
inline distributor::schema::address_t payer() {
  return make_address(0x30);
}
inline distributor::schema::address_t first_referrer() {
  return make_address(0x40);
}
inline distributor::schema::address_t second_referrer() {
  return make_address(0x50);
}

inline distributor::config::distribution_config_t make_config() {
  return distributor::config::distribution_config_t{
      .program_id = program_id(),
      .treasury = treasury(),
      .team = team(),
      .system_program = distributor::schema::make_zero_address(),
      .first_referrer_cap = distributor::allocation::kDefaultFirstReferrerCap,
      .second_referrer_cap =
          distributor::allocation::kDefaultSecondReferrerCap};
}

}  // namespace distributor::testing
