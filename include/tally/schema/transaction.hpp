#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_kind.hpp>
#include <optional>

// Schema type: transaction.
// Ledger workflow: Committed, immutable record of one balance change. `from`
// is absent for mints, `to` for burns, and `fee` is only set on transfers.
namespace tally::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_index_t index{};
  transaction_kind_t kind{transaction_kind_t::transfer};
  std::optional<account_t> from;
  std::optional<account_t> to;
  amount_t amount{};
  std::optional<amount_t> fee;
  std::optional<bytes_t> memo;
  std::optional<timestamp_nanoseconds_t> created_at_time;
  timestamp_nanoseconds_t timestamp{};
};

using transaction_t = transaction<1>;

}  // namespace tally::schema
