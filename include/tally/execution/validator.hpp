#pragma once

#include <tally/execution/balance_store.hpp>
#include <tally/execution/deduplication.hpp>
#include <tally/execution/transaction_request.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/ledger_config.hpp>
#include <tally/schema/transaction_kind.hpp>
#include <tally/schema/transfer_error.hpp>
#include <variant>

namespace tally::execution {

/// Read-only view of ledger state consulted by `validate`.
struct validation_context final {
  const tally::schema::ledger_config_t& config;
  const balance_store& balances;
  const deduplication_index& recent;
  tally::schema::timestamp_nanoseconds_t now{};
};

using validation_result_t =
    std::variant<validated_request, tally::schema::transfer_error_t>;

/// `mint` when debiting the minting account, `burn` when crediting it,
/// `transfer` otherwise.
tally::schema::transaction_kind_t classify(
    const tally::schema::account_t& from,
    const tally::schema::account_t& to,
    const tally::schema::account_t& minting_account);

/// Check a staged request against ledger policy without mutating anything.
///
/// Checks run in a fixed order and the first failure wins: account and memo
/// shape, fee, funds, created_at_time window, burn minimum, duplicates, and
/// finally the supply cap for mints.
validation_result_t validate(const transaction_request& request,
                             const validation_context& context);

}  // namespace tally::execution
