#include <boost/program_options.hpp>
#include <distributor/common/critical.hpp>
#include <distributor/common/logging.hpp>
#include <distributor/config/distribution_config.hpp>
#include <distributor/execution/account_list.hpp>
#include <distributor/execution/engine.hpp>
#include <distributor/ledger/memory/ledger.hpp>
#include <distributor/schema/account_role.hpp>
#include <distributor/schema/encoding/scale/encoder.hpp>
#include <distributor/schema/payload_format.hpp>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;

using namespace distributor::schema;

namespace {

address_t parse_address(const std::string_view value,
                        const std::string_view option) {
  auto address = try_make_address(value);
  if (!address) {
    distributor::common::critical("--{} is not a base58 address: {}", option,
                                  value);
  }
  return *address;
}

// <base58>=<subunits>
std::pair<address_t, amount_t> parse_balance(const std::string& value) {
  auto eq = value.find('=');
  if (eq == std::string::npos) {
    distributor::common::critical("--balance expects address=amount: {}",
                                  value);
  }
  auto amount = amount_t{};
  auto digits = std::string_view{value}.substr(eq + 1);
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), amount);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    distributor::common::critical(
        "--balance amount is not a subunit count: {}", value);
  }
  return {parse_address(std::string_view{value}.substr(0, eq), "balance"),
          amount};
}

// <base58>[:flags] where flags holds 's' for signer and 'w' for writable.
account_meta_t parse_account(const std::string& value) {
  auto colon = value.find(':');
  auto meta = account_meta_t{};
  meta.address =
      parse_address(std::string_view{value}.substr(0, colon), "account");
  if (colon == std::string::npos) {
    return meta;
  }
  for (const auto flag : std::string_view{value}.substr(colon + 1)) {
    if (flag == 's') {
      meta.is_signer = true;
    } else if (flag == 'w') {
      meta.is_writable = true;
    } else {
      distributor::common::critical("--account flags must be s and/or w: {}",
                                    value);
    }
  }
  return meta;
}

std::vector<account_meta_t> make_accounts(
    const po::variables_map& vm,
    const distributor::config::distribution_config_t& config) {
  if (vm.contains("account")) {
    auto accounts = std::vector<account_meta_t>{};
    for (const auto& value : vm["account"].as<std::vector<std::string>>()) {
      accounts.push_back(parse_account(value));
    }
    return accounts;
  }
  if (!vm.contains("payer")) {
    distributor::common::critical("either --account or --payer is required");
  }
  auto referrers = referral_chain_t{};
  if (vm.contains("first-referrer")) {
    referrers.first =
        parse_address(vm["first-referrer"].as<std::string>(), "first-referrer");
  }
  if (vm.contains("second-referrer")) {
    referrers.second = parse_address(vm["second-referrer"].as<std::string>(),
                                     "second-referrer");
  }
  return distributor::execution::make_account_list(
      config, parse_address(vm["payer"].as<std::string>(), "payer"),
      referrers);
}

void print_result(const settlement_result_t& result,
                  const distributor::ledger::balances_t& balances) {
  std::cout << "code " << result.code << '\n'
            << "log " << result.log << '\n';
  if (!result.codespace.empty()) {
    std::cout << "codespace " << result.codespace << '\n';
  }
  std::cout << "info " << result.info << '\n';
  for (const auto& transfer : result.transfers) {
    std::cout << "transfer " << to_string(transfer.role) << ' '
              << to_base58(transfer.to) << ' ' << transfer.amount << '\n';
  }
  for (const auto& [address, balance] : balances) {
    std::cout << "balance " << to_base58(address) << ' ' << balance << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto description = po::options_description{"Distributor"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "log-file", po::value<std::string>()->default_value(""),
      "Also write logs to this file")(
      "balance", po::value<std::vector<std::string>>()->multitoken(),
      "Seed a ledger balance: <base58>=<subunits>")(
      "freeze", po::value<std::vector<std::string>>()->multitoken(),
      "Accounts that cannot receive transfers")(
      "data", po::value<std::string>(), "Encoded payment payload")(
      "data-format", po::value<std::string>()->default_value("base64"),
      "Encoding of --data: base64|hex")(
      "account", po::value<std::vector<std::string>>()->multitoken(),
      "Positional account entry: <base58>[:sw]")(
      "payer", po::value<std::string>(),
      "Derive the account list for this payer instead of --account")(
      "first-referrer", po::value<std::string>(),
      "First-tier referrer for a derived account list")(
      "second-referrer", po::value<std::string>(),
      "Second-tier referrer for a derived account list");
  distributor::config::add_distribution_options(description);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto error = std::string{};
      if (!distributor::config::load_config_file(
              vm["config"].as<std::string>(), description, vm, error)) {
        std::cerr << error << '\n';
        return 1;
      }
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  distributor::common::configure_logging(
      "distributor", vm.contains("verbose"), vm["log-file"].as<std::string>());

  auto error = std::string{};
  auto config = distributor::config::make_distribution_config(vm, error);
  if (!config) {
    distributor::common::critical(error);
  }

  auto ledger = distributor::ledger::memory_ledger_t{config->system_program};
  if (vm.contains("freeze")) {
    for (const auto& value : vm["freeze"].as<std::vector<std::string>>()) {
      ledger.freeze(parse_address(value, "freeze"));
    }
  }
  if (vm.contains("balance")) {
    for (const auto& value : vm["balance"].as<std::vector<std::string>>()) {
      auto [address, amount] = parse_balance(value);
      ledger.deposit(address, amount);
    }
  }

  if (!vm.contains("data")) {
    distributor::common::critical("--data is required");
  }
  auto format_name = vm["data-format"].as<std::string>();
  auto format = try_from_string<payload_format>(format_name);
  if (!format) {
    distributor::common::critical(
        "--data-format must be base64 or hex, got '{}'", format_name);
  }
  auto data = try_parse_payload(vm["data"].as<std::string>(), *format);
  if (!data) {
    distributor::common::critical("--data is not valid {}", to_string(*format));
  }

  auto encoder = encoding::scale_encoder_t{};
  auto engine = distributor::execution::engine{encoder, ledger, *config};
  auto accounts = make_accounts(vm, *config);
  auto result = engine.process_instruction(make_bytes_view(*data), accounts);

  print_result(result, ledger.balances());
  spdlog::shutdown();
  return result.ok() ? 0 : 2;
}
