#pragma once

#include <distributor/allocation/allocate.hpp>
#include <distributor/schema/primitives.hpp>

#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace distributor::config {

/// Base58 rendering of the all-zero system program address.
inline constexpr auto kSystemProgramAddress =
    std::string_view{"11111111111111111111111111111111"};

/// Process-wide settlement constants, fixed at deployment and injected into
/// both the instruction builder and the settlement engine.
struct distribution_config_t final {
  distributor::schema::address_t program_id{};
  distributor::schema::address_t treasury{};
  distributor::schema::address_t team{};
  distributor::schema::address_t system_program{};
  distributor::schema::amount_t first_referrer_cap{
      distributor::allocation::kDefaultFirstReferrerCap};
  distributor::schema::amount_t second_referrer_cap{
      distributor::allocation::kDefaultSecondReferrerCap};
};

/// Check the invariants the engine relies on. Run once at startup.
///
/// Treasury and team must be set, distinct, and neither may be the system
/// program. On failure `error` names the first violated rule.
bool validate_config(const distribution_config_t& config, std::string& error);

/// Register the distribution settings on a program_options description.
void add_distribution_options(
    boost::program_options::options_description& options);

/// Merge an INI-style file into `vm`. Values already on the command line
/// take precedence.
bool load_config_file(const std::string& path,
                      const boost::program_options::options_description& options,
                      boost::program_options::variables_map& vm,
                      std::string& error);

/// Build a config from parsed options. Caps arrive signed so that a negative
/// value is rejected rather than wrapped.
std::optional<distribution_config_t> make_distribution_config(
    const boost::program_options::variables_map& vm,
    std::string& error);

}  // namespace distributor::config
