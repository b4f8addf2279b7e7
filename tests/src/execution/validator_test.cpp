#include <gtest/gtest.h>
#include <tally/execution/validator.hpp>
#include <tally/testing/common.hpp>

#include <variant>

using tally::testing::kSecond;
using tally::testing::make_account;

namespace {

constexpr auto kNow = uint64_t{1'700'000'000} * kSecond;

class validator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    config.minting_account = make_account(1);
    config.transfer_fee = 10;
    config.min_burn_amount = 5;
    config.max_supply = 5000;
    balances.mint(tally::schema::encode_account(make_account(2)), 1000);
  }

  tally::execution::validation_result_t validate(
      const tally::execution::transaction_request& request) {
    return tally::execution::validate(
        request, tally::execution::validation_context{
                     .config = config,
                     .balances = balances,
                     .recent = recent,
                     .now = kNow});
  }

  tally::execution::transaction_request transfer(const uint64_t amount) {
    auto request = tally::execution::transaction_request{};
    request.from = make_account(2);
    request.to = make_account(3);
    request.amount = amount;
    return request;
  }

  template <typename Error>
  static bool rejected_with(const tally::execution::validation_result_t& r) {
    const auto* error = std::get_if<tally::schema::transfer_error_t>(&r);
    return error != nullptr && std::holds_alternative<Error>(*error);
  }

  tally::schema::ledger_config_t config;
  tally::execution::balance_store balances;
  tally::execution::deduplication_index recent;
};

}  // namespace

TEST_F(validator_test, classifies_by_minting_account) {
  auto minting = make_account(1);
  auto zeroed_minting = make_account(1);
  zeroed_minting.subaccount = tally::schema::bytes_t(32, 0);
  EXPECT_EQ(tally::execution::classify(minting, make_account(3), minting),
            tally::schema::transaction_kind_t::mint);
  EXPECT_EQ(tally::execution::classify(make_account(3), zeroed_minting, minting),
            tally::schema::transaction_kind_t::burn);
  EXPECT_EQ(
      tally::execution::classify(make_account(3), make_account(4), minting),
      tally::schema::transaction_kind_t::transfer);
}

TEST_F(validator_test, accepts_transfer_and_charges_configured_fee) {
  auto result = validate(transfer(200));
  const auto* validated = std::get_if<tally::execution::validated_request>(&result);
  ASSERT_NE(validated, nullptr);
  EXPECT_EQ(validated->kind, tally::schema::transaction_kind_t::transfer);
  EXPECT_EQ(validated->fee, 10);
  EXPECT_FALSE(validated->supplied_fee.has_value());
}

TEST_F(validator_test, rejects_malformed_accounts_and_large_memos) {
  auto request = transfer(1);
  request.to.owner.clear();
  auto result = validate(request);
  ASSERT_TRUE(rejected_with<tally::schema::generic_error_t>(result));
  EXPECT_EQ(std::get<tally::schema::generic_error_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .error_code,
            static_cast<uint64_t>(
                tally::schema::generic_error_code::malformed_account));

  request = transfer(1);
  request.memo = tally::schema::bytes_t(33, 0x01);
  EXPECT_TRUE(rejected_with<tally::schema::generic_error_t>(validate(request)));
  request.memo = tally::schema::bytes_t(32, 0x01);
  EXPECT_FALSE(rejected_with<tally::schema::generic_error_t>(validate(request)));
}

TEST_F(validator_test, fee_must_match_when_supplied) {
  auto request = transfer(100);
  request.fee = tally::schema::amount_t{9};
  auto result = validate(request);
  ASSERT_TRUE(rejected_with<tally::schema::bad_fee_t>(result));
  EXPECT_EQ(std::get<tally::schema::bad_fee_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .expected_fee,
            10);

  request.fee = tally::schema::amount_t{10};
  EXPECT_TRUE(std::holds_alternative<tally::execution::validated_request>(
      validate(request)));
}

TEST_F(validator_test, burns_and_mints_carry_no_fee) {
  auto burn = transfer(100);
  burn.to = config.minting_account;
  burn.fee = tally::schema::amount_t{10};
  EXPECT_TRUE(rejected_with<tally::schema::bad_fee_t>(validate(burn)));

  burn.fee = tally::schema::amount_t{0};
  auto result = validate(burn);
  const auto* validated = std::get_if<tally::execution::validated_request>(&result);
  ASSERT_NE(validated, nullptr);
  EXPECT_EQ(validated->kind, tally::schema::transaction_kind_t::burn);
  EXPECT_EQ(validated->fee, 0);
}

TEST_F(validator_test, insufficient_funds_includes_fee) {
  auto result = validate(transfer(991));
  ASSERT_TRUE(rejected_with<tally::schema::insufficient_funds_t>(result));
  EXPECT_EQ(std::get<tally::schema::insufficient_funds_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .balance,
            1000);
  EXPECT_FALSE(rejected_with<tally::schema::insufficient_funds_t>(
      validate(transfer(990))));
}

TEST_F(validator_test, created_at_time_window) {
  auto request = transfer(1);
  request.created_at_time =
      kNow - config.transaction_window - config.permitted_drift - 1;
  EXPECT_TRUE(rejected_with<tally::schema::too_old_t>(validate(request)));

  request.created_at_time =
      kNow - config.transaction_window - config.permitted_drift;
  EXPECT_FALSE(rejected_with<tally::schema::too_old_t>(validate(request)));

  request.created_at_time = kNow + config.permitted_drift + 1;
  auto result = validate(request);
  ASSERT_TRUE(rejected_with<tally::schema::created_in_future_t>(result));
  EXPECT_EQ(std::get<tally::schema::created_in_future_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .ledger_time,
            kNow);

  request.created_at_time = kNow + config.permitted_drift;
  EXPECT_TRUE(std::holds_alternative<tally::execution::validated_request>(
      validate(request)));
}

TEST_F(validator_test, burn_below_minimum_is_rejected) {
  auto burn = transfer(4);
  burn.to = config.minting_account;
  auto result = validate(burn);
  ASSERT_TRUE(rejected_with<tally::schema::bad_burn_t>(result));
  EXPECT_EQ(std::get<tally::schema::bad_burn_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .min_burn_amount,
            5);
}

TEST_F(validator_test, duplicates_are_found_only_with_created_at_time) {
  auto request = transfer(10);
  request.created_at_time = kNow;
  auto first = validate(request);
  ASSERT_TRUE(std::holds_alternative<tally::execution::validated_request>(first));
  recent.insert(tally::execution::make_deduplication_key(
                    std::get<tally::execution::validated_request>(first)),
                7, kNow);

  auto result = validate(request);
  ASSERT_TRUE(rejected_with<tally::schema::duplicate_t>(result));
  EXPECT_EQ(std::get<tally::schema::duplicate_t>(
                std::get<tally::schema::transfer_error_t>(result))
                .duplicate_of,
            7u);

  request.created_at_time.reset();
  EXPECT_TRUE(std::holds_alternative<tally::execution::validated_request>(
      validate(request)));
}

TEST_F(validator_test, mint_respects_max_supply) {
  auto mint = tally::execution::transaction_request{};
  mint.from = config.minting_account;
  mint.to = make_account(3);
  mint.amount = 4000;
  EXPECT_TRUE(std::holds_alternative<tally::execution::validated_request>(
      validate(mint)));

  mint.amount = 4001;
  EXPECT_TRUE(rejected_with<tally::schema::generic_error_t>(validate(mint)));
}

TEST_F(validator_test, minting_account_cannot_send_to_itself) {
  auto request = tally::execution::transaction_request{};
  request.from = config.minting_account;
  request.to = config.minting_account;
  request.amount = 1;
  EXPECT_TRUE(rejected_with<tally::schema::generic_error_t>(validate(request)));
}

TEST_F(validator_test, fee_is_checked_before_funds) {
  auto request = transfer(5000);
  request.fee = tally::schema::amount_t{1};
  EXPECT_TRUE(rejected_with<tally::schema::bad_fee_t>(validate(request)));
}
