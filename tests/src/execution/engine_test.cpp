#include <gtest/gtest.h>
#include <distributor/execution/engine.hpp>
#include <distributor/schema/account_role.hpp>
#include <distributor/testing/settlement_fixture.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace {

using distributor::schema::account_role_t;
using distributor::schema::index_of;
using distributor::schema::settlement_error_code;
using distributor::testing::settlement_fixture;

constexpr auto kOneUnit = uint64_t{1'000'000'000};

distributor::schema::referral_chain_t both_referrers() {
  return distributor::schema::referral_chain_t{
      .first = distributor::testing::first_referrer(),
      .second = distributor::testing::second_referrer()};
}

void expect_rejected(const distributor::schema::settlement_result_t& result,
                     const settlement_error_code code) {
  EXPECT_EQ(result.code, static_cast<uint32_t>(code));
  EXPECT_EQ(result.log, distributor::schema::to_string(code));
  EXPECT_EQ(result.codespace, distributor::schema::codespace_of(code));
  EXPECT_FALSE(result.allocation.has_value());
  EXPECT_TRUE(result.transfers.empty());
}

}  // namespace

TEST(engine, settles_one_unit_with_both_referrers) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), 3 * kOneUnit);

  auto result = fixture.settle(fixture.payload(kOneUnit, true, true),
                               fixture.accounts(both_referrers()));
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(result.log, "settled");
  ASSERT_TRUE(result.allocation.has_value());
  EXPECT_EQ(result.transfers.size(), 4u);

  auto& ledger = fixture.ledger();
  EXPECT_EQ(ledger.balance(distributor::testing::treasury()), 500'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::first_referrer()),
            200'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::second_referrer()),
            50'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::team()), 250'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::payer()), 2 * kOneUnit);
}

TEST(engine, settles_ten_units_at_caps) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), 10 * kOneUnit);

  auto result = fixture.settle(fixture.payload(10 * kOneUnit, true, true),
                               fixture.accounts(both_referrers()));
  ASSERT_TRUE(result.ok()) << result.info;
  auto& ledger = fixture.ledger();
  EXPECT_EQ(ledger.balance(distributor::testing::treasury()), 5'000'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::first_referrer()),
            200'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::second_referrer()),
            50'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::team()), 4'750'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::payer()), 0u);
}

TEST(engine, placeholder_slots_are_never_touched) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), 5 * kOneUnit);

  auto result = fixture.settle(fixture.payload(kOneUnit, false, false),
                               fixture.accounts());
  ASSERT_TRUE(result.ok()) << result.info;
  ASSERT_EQ(result.transfers.size(), 2u);
  EXPECT_EQ(result.transfers[0].role, account_role_t::treasury);
  EXPECT_EQ(result.transfers[1].role, account_role_t::team);
  for (const auto& transfer : result.transfers) {
    EXPECT_NE(transfer.to, distributor::testing::payer());
  }

  auto& ledger = fixture.ledger();
  EXPECT_EQ(ledger.balance(distributor::testing::payer()), 4 * kOneUnit);
  EXPECT_EQ(ledger.balance(distributor::testing::treasury()), 500'000'000u);
  EXPECT_EQ(ledger.balance(distributor::testing::team()), 500'000'000u);
}

TEST(engine, first_only_rolls_second_share_to_team) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);

  auto chain = distributor::schema::referral_chain_t{
      .first = distributor::testing::first_referrer(), .second = std::nullopt};
  auto result = fixture.settle(fixture.payload(kOneUnit, true, false),
                               fixture.accounts(chain));
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(result.allocation->second, 0u);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::team()),
            300'000'000u);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()), 0u);
}

TEST(engine, unset_flag_ignores_a_real_address_in_its_slot) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);

  auto result = fixture.settle(fixture.payload(kOneUnit, false, false),
                               fixture.accounts(both_referrers()));
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::first_referrer()),
            0u);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::team()),
            500'000'000u);
}

TEST(engine, zero_gross_is_a_valid_empty_settlement) {
  auto fixture = settlement_fixture{};
  auto result =
      fixture.settle(fixture.payload(0, true, true), fixture.accounts());
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_TRUE(result.transfers.empty());
  EXPECT_TRUE(fixture.ledger().balances().empty());
}

TEST(engine, rejects_payload_of_wrong_length) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);
  auto data = fixture.payload(kOneUnit, false, false);
  data.push_back(0);

  auto result = fixture.settle(data, fixture.accounts());
  expect_rejected(result, settlement_error_code::invalid_payload_length);
  EXPECT_EQ(result.codespace, "distributor.decode");
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()), kOneUnit);
}

TEST(engine, rejects_malformed_account_lists) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);
  auto data = fixture.payload(kOneUnit, false, false);

  auto accounts = fixture.accounts();
  accounts.push_back(accounts.back());
  expect_rejected(fixture.settle(data, accounts),
                  settlement_error_code::invalid_account_count);

  accounts = fixture.accounts();
  accounts[index_of(account_role_t::payer)].is_signer = false;
  expect_rejected(fixture.settle(data, accounts),
                  settlement_error_code::payer_not_signer);

  accounts = fixture.accounts();
  accounts[index_of(account_role_t::team)].is_writable = false;
  expect_rejected(fixture.settle(data, accounts),
                  settlement_error_code::account_not_writable);

  accounts = fixture.accounts();
  accounts[index_of(account_role_t::treasury)].address =
      distributor::testing::make_address(0x99);
  auto result = fixture.settle(data, accounts);
  expect_rejected(result, settlement_error_code::treasury_mismatch);
  EXPECT_EQ(result.codespace, "distributor.accounts");

  accounts = fixture.accounts();
  accounts[index_of(account_role_t::team)].address =
      distributor::testing::make_address(0x99);
  expect_rejected(fixture.settle(data, accounts),
                  settlement_error_code::team_mismatch);

  accounts = fixture.accounts();
  accounts[index_of(account_role_t::system_program)].address =
      distributor::testing::make_address(0x99);
  expect_rejected(fixture.settle(data, accounts),
                  settlement_error_code::system_program_mismatch);

  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()), kOneUnit);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::treasury()), 0u);
}

TEST(engine, insufficient_balance_applies_nothing) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit - 1);

  auto result = fixture.settle(fixture.payload(kOneUnit, true, true),
                               fixture.accounts(both_referrers()));
  expect_rejected(result, settlement_error_code::insufficient_balance);
  EXPECT_EQ(result.codespace, "distributor.transfer");
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()),
            kOneUnit - 1);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::treasury()), 0u);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::first_referrer()),
            0u);
}

TEST(engine, frozen_referrer_rejects_whole_settlement) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);
  fixture.ledger().freeze(distributor::testing::second_referrer());

  auto result = fixture.settle(fixture.payload(kOneUnit, true, true),
                               fixture.accounts(both_referrers()));
  expect_rejected(result, settlement_error_code::invalid_transfer_destination);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()), kOneUnit);
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::treasury()), 0u);
}

TEST(engine, system_program_as_referrer_is_an_invalid_destination) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);

  auto chain = distributor::schema::referral_chain_t{
      .first = distributor::schema::make_zero_address(),
      .second = std::nullopt};
  auto result = fixture.settle(fixture.payload(kOneUnit, true, false),
                               fixture.accounts(chain));
  expect_rejected(result, settlement_error_code::invalid_transfer_destination);
}

TEST(engine, destination_overflow_reports_arithmetic_overflow) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);
  fixture.ledger().deposit(distributor::testing::treasury(),
                           std::numeric_limits<uint64_t>::max());

  auto result = fixture.settle(fixture.payload(kOneUnit, false, false),
                               fixture.accounts());
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(settlement_error_code::arithmetic_overflow));
  EXPECT_EQ(result.codespace, "distributor.transfer");
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()), kOneUnit);
}

TEST(engine, referrer_equal_to_payer_nets_to_zero) {
  auto fixture = settlement_fixture{};
  fixture.ledger().deposit(distributor::testing::payer(), kOneUnit);

  auto chain = distributor::schema::referral_chain_t{
      .first = distributor::testing::payer(), .second = std::nullopt};
  auto result = fixture.settle(fixture.payload(kOneUnit, true, false),
                               fixture.accounts(chain));
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(fixture.ledger().balance(distributor::testing::payer()),
            200'000'000u);
}

TEST(engine, plan_transfers_skips_zero_shares) {
  auto accounts = distributor::execution::settlement_accounts_t{
      .payer = distributor::testing::payer(),
      .treasury = distributor::testing::treasury(),
      .team = distributor::testing::team(),
      .referrers = both_referrers(),
      .system_program = distributor::schema::make_zero_address()};
  auto allocation = distributor::schema::allocation_t{};
  allocation.treasury = 5;
  allocation.first = 1;

  auto transfers = distributor::execution::plan_transfers(accounts, allocation);
  ASSERT_EQ(transfers.size(), 2u);
  EXPECT_EQ(transfers[0].to, distributor::testing::treasury());
  EXPECT_EQ(transfers[0].amount, 5u);
  EXPECT_EQ(transfers[1].to, distributor::testing::first_referrer());
  EXPECT_EQ(transfers[1].role, account_role_t::first_referrer);
  for (const auto& transfer : transfers) {
    EXPECT_EQ(transfer.from, distributor::testing::payer());
  }
}
