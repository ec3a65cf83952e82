#include <boost/program_options.hpp>
#include <distributor/allocation/allocate.hpp>
#include <distributor/builder/instruction_builder.hpp>
#include <distributor/builder/units.hpp>
#include <distributor/common/critical.hpp>
#include <distributor/common/logging.hpp>
#include <distributor/config/distribution_config.hpp>
#include <distributor/referral/http_lookup.hpp>
#include <distributor/schema/account_role.hpp>
#include <distributor/schema/encoding/scale/payment_request.hpp>
#include <distributor/schema/payload_format.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

using namespace distributor::schema;

namespace {

namespace po = boost::program_options;

address_t get_address(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    distributor::common::critical("missing required --{}", name);
  }
  auto value = vm[name].as<std::string>();
  auto address = try_make_address(value);
  if (!address) {
    distributor::common::critical("--{} is not a base58 address: {}", name,
                                  value);
  }
  return *address;
}

std::optional<address_t> get_optional_address(const po::variables_map& vm,
                                              const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_address(vm, name);
}

amount_t get_cap(const po::variables_map& vm, const std::string& name) {
  auto value = vm[name].as<int64_t>();
  if (value < 0) {
    distributor::common::critical("--{} must not be negative", name);
  }
  return static_cast<amount_t>(value);
}

amount_t get_amount(const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    distributor::common::critical("missing required --amount");
  }
  auto reason = distributor::builder::amount_parse_error::malformed;
  auto error = std::string{};
  auto amount = distributor::builder::to_subunits(
      vm["amount"].as<std::string>(), reason, error);
  if (!amount) {
    distributor::common::critical(error);
  }
  return *amount;
}

distributor::config::distribution_config_t get_config(
    const po::variables_map& vm) {
  auto error = std::string{};
  auto config = distributor::config::make_distribution_config(vm, error);
  if (!config) {
    distributor::common::critical(error);
  }
  if (!distributor::config::validate_config(*config, error)) {
    distributor::common::critical(error);
  }
  return *config;
}

payload_format get_format(const po::variables_map& vm) {
  auto value = vm["format"].as<std::string>();
  auto format = try_from_string<payload_format>(value);
  if (!format) {
    distributor::common::critical("--format must be base64 or hex, got '{}'",
                                  value);
  }
  return *format;
}

// First- and second-tier lookups; both empty without --referral-url.
std::pair<distributor::referral::referral_lookup_t,
          distributor::referral::referral_lookup_t>
make_lookups(const po::variables_map& vm) {
  if (!vm.contains("referral-url")) {
    return {};
  }
  auto options = distributor::referral::http_lookup_options_t{
      .base_url = vm["referral-url"].as<std::string>(),
      .path_prefix = vm["referral-path-prefix"].as<std::string>(),
      .second_tier_path_prefix =
          vm["referral-second-tier-path-prefix"].as<std::string>(),
      .timeout = std::chrono::milliseconds{
          vm["referral-timeout-ms"].as<uint32_t>()}};
  auto error = std::string{};
  auto first_tier = distributor::referral::make_http_lookup(options, error);
  if (!first_tier) {
    distributor::common::critical(error);
  }
  auto second_tier = distributor::referral::make_http_lookup(
      options, error, distributor::referral::lookup_tier::second);
  if (!second_tier) {
    distributor::common::critical(error);
  }
  return {std::move(*first_tier), std::move(*second_tier)};
}

void print_allocation(const amount_t gross, const allocation_t& allocation) {
  std::cout << "gross " << gross << '\n'
            << "treasury " << allocation.treasury << '\n'
            << "team " << allocation.team << '\n'
            << "first_referrer " << allocation.first << '\n'
            << "second_referrer " << allocation.second << '\n';
}

void print_instruction(const distributor::builder::build_output_t& output,
                       const payload_format format) {
  const auto& instruction = output.instruction;
  std::cout << "program_id " << to_base58(instruction.program_id) << '\n'
            << "data "
            << format_payload(make_bytes_view(instruction.data), format)
            << '\n';
  for (std::size_t i = 0; i < instruction.accounts.size(); ++i) {
    const auto& account = instruction.accounts[i];
    std::cout << "account " << i << ' '
              << to_string(static_cast<account_role_t>(i)) << ' '
              << to_base58(account.address)
              << " signer=" << (account.is_signer ? 1 : 0)
              << " writable=" << (account.is_writable ? 1 : 0) << '\n';
  }
  for (const auto& warning : output.warnings) {
    std::cout << "warning " << warning << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  instruction_builder instruction --payer <base58> --amount "
               "<units> [options]\n"
            << "  instruction_builder allocate --amount <units> [options]\n"
            << "  instruction_builder decode --data <payload> "
               "[--format base64|hex]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"instruction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "instruction|allocate|decode")(
      "verbose,v", "enable debug logging")(
      "payer", po::value<std::string>(), "payer base58 address")(
      "amount", po::value<std::string>(), "gross amount in whole units")(
      "referral-code", po::value<std::string>(), "referral code to resolve")(
      "referral-url", po::value<std::string>(),
      "referral service base URL (http://host[:port])")(
      "referral-path-prefix",
      po::value<std::string>()->default_value(
          std::string{distributor::referral::kDefaultLookupPathPrefix}),
      "referral service path prefix")(
      "referral-second-tier-path-prefix",
      po::value<std::string>()->default_value(""),
      "path prefix for referrer-of-referrer lookups (default: same as "
      "--referral-path-prefix)")(
      "referral-timeout-ms",
      po::value<uint32_t>()->default_value(static_cast<uint32_t>(
          distributor::referral::kDefaultLookupTimeout.count())),
      "per-lookup timeout")(
      "first-referrer", po::value<std::string>(),
      "explicit first-tier referrer base58 address")(
      "second-referrer", po::value<std::string>(),
      "explicit second-tier referrer base58 address")(
      "has-first-referrer", po::bool_switch(),
      "allocate: include the first-tier share")(
      "has-second-referrer", po::bool_switch(),
      "allocate: include the second-tier share")(
      "data", po::value<std::string>(), "encoded payment payload")(
      "format", po::value<std::string>()->default_value("base64"),
      "payload encoding for --data and output: base64|hex");
  distributor::config::add_distribution_options(options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto error = std::string{};
      if (!distributor::config::load_config_file(
              vm["config"].as<std::string>(), options, vm, error)) {
        std::cerr << error << '\n';
        return 1;
      }
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  distributor::common::configure_logging("instruction_builder",
                                         vm.contains("verbose"));
  auto encoder = encoding::scale_encoder_t{};

  if (command == "instruction") {
    auto config = get_config(vm);
    auto request = distributor::builder::build_request_t{
        .gross_whole_units = vm.contains("amount")
                                 ? vm["amount"].as<std::string>()
                                 : std::string{},
        .referral_code = std::nullopt,
        .payer = get_address(vm, "payer"),
        .referrers = std::nullopt};
    if (vm.contains("first-referrer") || vm.contains("second-referrer")) {
      request.referrers = referral_chain_t{
          .first = get_optional_address(vm, "first-referrer"),
          .second = get_optional_address(vm, "second-referrer")};
    } else if (vm.contains("referral-code")) {
      request.referral_code = vm["referral-code"].as<std::string>();
    }

    auto format = get_format(vm);
    auto [first_tier, second_tier] = make_lookups(vm);
    auto builder = distributor::builder::instruction_builder{
        encoder, config, std::move(first_tier), std::move(second_tier)};
    auto error = std::string{};
    auto output = builder.build(request, error);
    if (!output) {
      distributor::common::critical(error);
    }
    print_instruction(*output, format);
    spdlog::shutdown();
    return 0;
  }

  if (command == "allocate") {
    auto gross = get_amount(vm);
    auto error = std::string{};
    auto allocation = distributor::allocation::allocate(
        gross, vm["has-first-referrer"].as<bool>(),
        vm["has-second-referrer"].as<bool>(),
        get_cap(vm, "first-referrer-cap"), get_cap(vm, "second-referrer-cap"),
        error);
    if (!allocation) {
      distributor::common::critical(error);
    }
    print_allocation(gross, *allocation);
    spdlog::shutdown();
    return 0;
  }

  if (command == "decode") {
    if (!vm.contains("data")) {
      distributor::common::critical("decode mode requires --data");
    }
    auto format = get_format(vm);
    auto bytes = try_parse_payload(vm["data"].as<std::string>(), format);
    if (!bytes) {
      distributor::common::critical("--data is not valid {}",
                                    to_string(format));
    }
    auto error = std::string{};
    auto request = encoding::scale::decode(encoder, make_bytes_view(*bytes),
                                           error);
    if (!request) {
      distributor::common::critical(error);
    }
    std::cout << "gross " << request->gross_amount << '\n'
              << "units " << distributor::builder::format_units(
                                 request->gross_amount)
              << '\n'
              << "has_first_referrer " << (request->has_first_referrer ? 1 : 0)
              << '\n'
              << "has_second_referrer "
              << (request->has_second_referrer ? 1 : 0) << '\n';
    spdlog::shutdown();
    return 0;
  }

  distributor::common::critical("command must be instruction|allocate|decode");
}
