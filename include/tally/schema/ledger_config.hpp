#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: ledger configuration.
// Ledger workflow: Initialization arguments. Validated once when the engine is
// constructed; an invalid configuration is fatal.
namespace tally::schema {

inline constexpr auto kDefaultMaxLogSize = uint64_t{2000};
inline constexpr auto kDefaultMaxArchiveQueryLength = uint64_t{5000};
inline constexpr auto kDefaultTransactionWindow =
    duration_nanoseconds_t{24ull * 60 * 60 * 1'000'000'000};
inline constexpr auto kDefaultPermittedDrift =
    duration_nanoseconds_t{60ull * 1'000'000'000};
inline constexpr auto kDefaultMaxMemoSize = uint64_t{32};

template <uint16_t Version>
struct archive_options;

template <>
struct archive_options<1> final {
  uint16_t version{1};
  uint64_t max_log_size{kDefaultMaxLogSize};
  uint64_t max_archive_query_length{kDefaultMaxArchiveQueryLength};
  uint64_t provisioning_cost{100'000'000'000};
  uint64_t resource_budget{1'000'000'000'000};
  uint64_t max_retry_backoff{64};
  uint64_t failure_alert_threshold{8};
};

using archive_options_t = archive_options<1>;

using genesis_balance_t = std::pair<account_t, amount_t>;

/// Parse `owner_hex[.subaccount_hex]=amount`.
std::optional<genesis_balance_t> try_parse_genesis_balance(
    std::string_view text);

template <uint16_t Version>
struct ledger_config;

template <>
struct ledger_config<1> final {
  uint16_t version{1};
  account_t minting_account;
  amount_t transfer_fee{};
  amount_t min_burn_amount{};
  amount_t max_supply{std::numeric_limits<amount_t>::max()};
  duration_nanoseconds_t transaction_window{kDefaultTransactionWindow};
  duration_nanoseconds_t permitted_drift{kDefaultPermittedDrift};
  uint64_t max_memo_size{kDefaultMaxMemoSize};
  std::vector<genesis_balance_t> genesis_balances;
  archive_options_t archive;
};

using ledger_config_t = ledger_config<1>;

}  // namespace tally::schema
