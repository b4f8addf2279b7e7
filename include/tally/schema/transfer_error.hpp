#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>

// Schema type: transfer error.
// Ledger workflow: Synchronous rejection of a write request. A rejected
// request never changes balances or the transaction log.
namespace tally::schema {

enum class transfer_error_code : uint32_t {
  bad_fee = 1,
  bad_burn = 2,
  insufficient_funds = 3,
  too_old = 4,
  created_in_future = 5,
  duplicate = 6,
  unauthorized = 7,
  generic_error = 8,
};

/// Codes carried inside `generic_error_t`.
enum class generic_error_code : uint64_t {
  malformed_account = 1,
  memo_too_large = 2,
  max_supply_exceeded = 3,
  invalid_operation = 4,
};

struct bad_fee_t final {
  amount_t expected_fee{};
};

struct bad_burn_t final {
  amount_t min_burn_amount{};
};

struct insufficient_funds_t final {
  amount_t balance{};
};

struct too_old_t final {};

struct created_in_future_t final {
  timestamp_nanoseconds_t ledger_time{};
};

struct duplicate_t final {
  transaction_index_t duplicate_of{};
};

struct unauthorized_t final {
  std::string message;
};

struct generic_error_t final {
  uint64_t error_code{};
  std::string message;
};

using transfer_error_t = std::variant<bad_fee_t,
                                      bad_burn_t,
                                      insufficient_funds_t,
                                      too_old_t,
                                      created_in_future_t,
                                      duplicate_t,
                                      unauthorized_t,
                                      generic_error_t>;

/// Either the index assigned to the committed transaction or the reason the
/// request was rejected.
using transfer_result_t = std::variant<transaction_index_t, transfer_error_t>;

transfer_error_code error_code(const transfer_error_t& error);
std::string describe(const transfer_error_t& error);

generic_error_t make_generic_error(generic_error_code code,
                                   std::string message);

}  // namespace tally::schema
