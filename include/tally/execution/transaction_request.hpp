#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_kind.hpp>
#include <optional>

namespace tally::execution {

/// Staged write request, built from caller arguments and discarded once it
/// has been validated and committed (or rejected).
struct transaction_request final {
  tally::schema::account_t from;
  tally::schema::account_t to;
  tally::schema::amount_t amount{};
  std::optional<tally::schema::amount_t> fee;
  std::optional<tally::schema::bytes_t> memo;
  std::optional<tally::schema::timestamp_nanoseconds_t> created_at_time;
};

/// Request that passed every policy check; carries canonical keys and the fee
/// actually charged.
struct validated_request final {
  tally::schema::transaction_kind_t kind{
      tally::schema::transaction_kind_t::transfer};
  tally::schema::account_t from;
  tally::schema::account_t to;
  tally::schema::account_key_t from_key;
  tally::schema::account_key_t to_key;
  tally::schema::amount_t amount{};
  tally::schema::amount_t fee{};
  std::optional<tally::schema::amount_t> supplied_fee;
  std::optional<tally::schema::bytes_t> memo;
  std::optional<tally::schema::timestamp_nanoseconds_t> created_at_time;
};

}  // namespace tally::execution
