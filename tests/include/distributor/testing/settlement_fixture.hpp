#pragma once

#include <distributor/config/distribution_config.hpp>
#include <distributor/execution/account_list.hpp>
#include <distributor/execution/engine.hpp>
#include <distributor/ledger/memory/ledger.hpp>
#include <distributor/schema/encoding/scale/payment_request.hpp>
#include <distributor/schema/primitives.hpp>
#include <distributor/testing/common.hpp>

#include <vector>

namespace distributor::testing {

using scale_encoder_t = distributor::schema::encoding::scale_encoder_t;

/// Engine wired to an in-memory ledger and the default test config.
class settlement_fixture final {
 public:
  explicit settlement_fixture(
      const distributor::config::distribution_config_t& config = make_config())
      : encoder_{},
        ledger_{config.system_program},
        engine_{encoder_, ledger_, config} {}

  settlement_fixture(const settlement_fixture&) = delete;
  settlement_fixture& operator=(const settlement_fixture&) = delete;
  settlement_fixture(settlement_fixture&&) = delete;
  settlement_fixture& operator=(settlement_fixture&&) = delete;

  scale_encoder_t& encoder() { return encoder_; }
  distributor::ledger::memory_ledger_t& ledger() { return ledger_; }
  distributor::execution::engine& engine() { return engine_; }

  distributor::schema::bytes_t payload(
      const distributor::schema::amount_t gross,
      const bool has_first,
      const bool has_second) {
    return distributor::schema::encoding::scale::encode(
        encoder_, distributor::schema::payment_request_t{
                      .gross_amount = gross,
                      .has_first_referrer = has_first,
                      .has_second_referrer = has_second});
  }

  std::vector<distributor::schema::account_meta_t> accounts(
      const distributor::schema::referral_chain_t& referrers = {}) const {
    return distributor::execution::make_account_list(engine_.config(),
                                                     payer(), referrers);
  }

  distributor::schema::settlement_result_t settle(
      const distributor::schema::bytes_t& data,
      const std::vector<distributor::schema::account_meta_t>& accounts) {
    return engine_.process_instruction(
        distributor::schema::make_bytes_view(data), accounts);
  }

 private:
  scale_encoder_t encoder_;
  distributor::ledger::memory_ledger_t ledger_;
  distributor::execution::engine engine_;
};

}  // namespace distributor::testing
