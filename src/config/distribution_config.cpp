#include <distributor/config/distribution_config.hpp>

#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>

namespace po = boost::program_options;

using namespace distributor::schema;

namespace {

std::optional<address_t> read_address(const po::variables_map& vm,
                                      const std::string& name,
                                      const bool required,
                                      std::string& error) {
  if (!vm.contains(name)) {
    if (required) {
      error = "missing required option --" + name;
      return std::nullopt;
    }
    return make_zero_address();
  }
  auto value = vm[name].as<std::string>();
  auto address = try_make_address(value);
  if (!address) {
    error = "--" + name + " is not a base58 32-byte address: " + value;
    return std::nullopt;
  }
  return address;
}

std::optional<amount_t> read_cap(const po::variables_map& vm,
                                 const std::string& name,
                                 std::string& error) {
  auto value = vm[name].as<int64_t>();
  if (value < 0) {
    error = "--" + name + " must not be negative";
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

}  // namespace

namespace distributor::config {

bool validate_config(const distribution_config_t& config, std::string& error) {
  const auto zero = make_zero_address();
  if (config.treasury == zero) {
    error = "treasury address is not configured";
    return false;
  }
  if (config.team == zero) {
    error = "team address is not configured";
    return false;
  }
  if (config.treasury == config.team) {
    error = "treasury and team must be distinct addresses";
    return false;
  }
  if (config.treasury == config.system_program ||
      config.team == config.system_program) {
    error = "treasury and team must not be the system program";
    return false;
  }
  return true;
}

void add_distribution_options(po::options_description& options) {
  options.add_options()("program-id", po::value<std::string>(),
                        "settlement program base58 address")(
      "treasury", po::value<std::string>(), "treasury base58 address")(
      "team", po::value<std::string>(), "team base58 address")(
      "system-program",
      po::value<std::string>()->default_value(
          std::string{kSystemProgramAddress}),
      "system program base58 address")(
      "first-referrer-cap",
      po::value<int64_t>()->default_value(
          static_cast<int64_t>(allocation::kDefaultFirstReferrerCap)),
      "first-tier referrer cap in subunits")(
      "second-referrer-cap",
      po::value<int64_t>()->default_value(
          static_cast<int64_t>(allocation::kDefaultSecondReferrerCap)),
      "second-tier referrer cap in subunits")(
      "config", po::value<std::string>(), "INI-style config file path");
}

bool load_config_file(const std::string& path,
                      const po::options_description& options,
                      po::variables_map& vm,
                      std::string& error) {
  auto stream = std::ifstream{path};
  if (!stream) {
    error = "unable to open config file " + path;
    return false;
  }
  try {
    po::store(po::parse_config_file(stream, options), vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return false;
  }
  spdlog::debug("Loaded configuration from '{}'", path);
  return true;
}

std::optional<distribution_config_t> make_distribution_config(
    const po::variables_map& vm,
    std::string& error) {
  auto config = distribution_config_t{};

  auto program_id = read_address(vm, "program-id", false, error);
  if (!program_id) {
    return std::nullopt;
  }
  auto treasury = read_address(vm, "treasury", true, error);
  if (!treasury) {
    return std::nullopt;
  }
  auto team = read_address(vm, "team", true, error);
  if (!team) {
    return std::nullopt;
  }
  auto system_program = read_address(vm, "system-program", true, error);
  if (!system_program) {
    return std::nullopt;
  }
  auto first_cap = read_cap(vm, "first-referrer-cap", error);
  if (!first_cap) {
    return std::nullopt;
  }
  auto second_cap = read_cap(vm, "second-referrer-cap", error);
  if (!second_cap) {
    return std::nullopt;
  }

  config.program_id = *program_id;
  config.treasury = *treasury;
  config.team = *team;
  config.system_program = *system_program;
  config.first_referrer_cap = *first_cap;
  config.second_referrer_cap = *second_cap;
  return config;
}

}  // namespace distributor::config
