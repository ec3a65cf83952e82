#include <gtest/gtest.h>
#include <distributor/config/distribution_config.hpp>
#include <distributor/testing/common.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

po::variables_map parse(const std::vector<std::string>& args) {
  auto options = po::options_description{"test"};
  distributor::config::add_distribution_options(options);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(args).options(options).run(), vm);
  po::notify(vm);
  return vm;
}

std::string base58(const distributor::schema::address_t& address) {
  return distributor::schema::to_base58(address);
}

}  // namespace

TEST(distribution_config, defaults_match_documented_caps) {
  auto config = distributor::config::distribution_config_t{};
  EXPECT_EQ(config.first_referrer_cap, 200'000'000u);
  EXPECT_EQ(config.second_referrer_cap, 50'000'000u);
  EXPECT_EQ(config.system_program, distributor::schema::make_zero_address());
}

TEST(distribution_config, builds_from_command_line) {
  auto vm = parse({"--treasury", base58(distributor::testing::treasury()),
                   "--team", base58(distributor::testing::team()),
                   "--program-id", base58(distributor::testing::program_id()),
                   "--first-referrer-cap", "7"});
  auto error = std::string{};
  auto config = distributor::config::make_distribution_config(vm, error);
  ASSERT_TRUE(config.has_value()) << error;
  EXPECT_EQ(config->treasury, distributor::testing::treasury());
  EXPECT_EQ(config->team, distributor::testing::team());
  EXPECT_EQ(config->program_id, distributor::testing::program_id());
  EXPECT_EQ(config->system_program, distributor::schema::make_zero_address());
  EXPECT_EQ(config->first_referrer_cap, 7u);
  EXPECT_EQ(config->second_referrer_cap, 50'000'000u);
  EXPECT_TRUE(distributor::config::validate_config(*config, error)) << error;
}

TEST(distribution_config, reports_missing_and_invalid_values) {
  auto error = std::string{};
  auto vm = parse({"--team", base58(distributor::testing::team())});
  EXPECT_FALSE(distributor::config::make_distribution_config(vm, error));
  EXPECT_EQ(error, "missing required option --treasury");

  vm = parse({"--treasury", "not-base58!", "--team",
              base58(distributor::testing::team())});
  EXPECT_FALSE(distributor::config::make_distribution_config(vm, error));
  EXPECT_NE(error.find("--treasury"), std::string::npos);

  vm = parse({"--treasury", base58(distributor::testing::treasury()), "--team",
              base58(distributor::testing::team()),
              "--second-referrer-cap=-1"});
  EXPECT_FALSE(distributor::config::make_distribution_config(vm, error));
  EXPECT_EQ(error, "--second-referrer-cap must not be negative");
}

TEST(distribution_config, validation_rejects_unsafe_layouts) {
  auto error = std::string{};
  auto config = distributor::testing::make_config();
  EXPECT_TRUE(distributor::config::validate_config(config, error)) << error;

  auto unset = config;
  unset.treasury = distributor::schema::make_zero_address();
  EXPECT_FALSE(distributor::config::validate_config(unset, error));

  auto same = config;
  same.team = same.treasury;
  EXPECT_FALSE(distributor::config::validate_config(same, error));
  EXPECT_EQ(error, "treasury and team must be distinct addresses");

  auto system = config;
  system.system_program = config.team;
  EXPECT_FALSE(distributor::config::validate_config(system, error));
  EXPECT_EQ(error, "treasury and team must not be the system program");
}

TEST(distribution_config, loads_ini_file_under_command_line) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("distributor_config_" + std::to_string(now) + ".ini");
  {
    auto out = std::ofstream{path};
    out << "treasury = " << base58(distributor::testing::treasury()) << '\n'
        << "team = " << base58(distributor::testing::team()) << '\n'
        << "first-referrer-cap = 11\n";
  }

  auto options = po::options_description{"test"};
  distributor::config::add_distribution_options(options);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(
                std::vector<std::string>{"--first-referrer-cap", "5"})
                .options(options)
                .run(),
            vm);
  auto error = std::string{};
  ASSERT_TRUE(distributor::config::load_config_file(path.string(), options, vm,
                                                    error))
      << error;
  po::notify(vm);

  auto config = distributor::config::make_distribution_config(vm, error);
  ASSERT_TRUE(config.has_value()) << error;
  EXPECT_EQ(config->treasury, distributor::testing::treasury());
  EXPECT_EQ(config->first_referrer_cap, 5u);

  auto ignored = std::error_code{};
  std::filesystem::remove(path, ignored);
}

TEST(distribution_config, missing_file_is_an_error) {
  auto options = po::options_description{"test"};
  distributor::config::add_distribution_options(options);
  auto vm = po::variables_map{};
  auto error = std::string{};
  EXPECT_FALSE(distributor::config::load_config_file(
      "/nonexistent/distributor.ini", options, vm, error));
  EXPECT_FALSE(error.empty());
}
