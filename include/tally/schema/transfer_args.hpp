#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>

// Schema type: transfer arguments.
// Ledger workflow: Caller supplied write requests. The caller principal fills
// in the owner of the debited account; mint and burn are rewritten into a
// transfer to or from the minting account.
namespace tally::schema {

using principal_t = bytes_t;

template <uint16_t Version>
struct transfer_args;

template <>
struct transfer_args<1> final {
  uint16_t version{1};
  std::optional<bytes_t> from_subaccount;
  account_t to;
  amount_t amount{};
  std::optional<amount_t> fee;
  std::optional<bytes_t> memo;
  std::optional<timestamp_nanoseconds_t> created_at_time;
};

using transfer_args_t = transfer_args<1>;

template <uint16_t Version>
struct mint_args;

template <>
struct mint_args<1> final {
  uint16_t version{1};
  account_t to;
  amount_t amount{};
  std::optional<bytes_t> memo;
  std::optional<timestamp_nanoseconds_t> created_at_time;
};

using mint_args_t = mint_args<1>;

template <uint16_t Version>
struct burn_args;

template <>
struct burn_args<1> final {
  uint16_t version{1};
  std::optional<bytes_t> from_subaccount;
  amount_t amount{};
  std::optional<bytes_t> memo;
  std::optional<timestamp_nanoseconds_t> created_at_time;
};

using burn_args_t = burn_args<1>;

}  // namespace tally::schema
