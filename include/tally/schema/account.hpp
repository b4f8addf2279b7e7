#pragma once

#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Schema type: account.
// Ledger workflow: Balance holder identity: owner principal bytes plus an
// optional 32 byte subaccount, compared through its canonical key.
namespace tally::schema {

inline constexpr auto kMaxOwnerSize = std::size_t{29};
inline constexpr auto kSubaccountSize = std::size_t{32};

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  bytes_t owner;
  std::optional<bytes_t> subaccount;
};

using account_t = account<1>;

/// Canonical, comparable encoding of an account.
using account_key_t = bytes_t;

/// Owner is 1..29 bytes and the subaccount, when present, is 32 bytes.
bool is_valid_account(const account_t& account);

/// A missing subaccount and the all-zero subaccount are the same account.
bool is_default_subaccount(const std::optional<bytes_t>& subaccount);

/// `len(owner) || owner || subaccount`, the subaccount omitted when it is
/// the default one. Terminates on a malformed account; validate first.
account_key_t encode_account(const account_t& account);

std::optional<account_t> try_decode_account(const bytes_view_t& key);

bool same_account(const account_t& lhs, const account_t& rhs);

/// Parse `owner_hex` or `owner_hex.subaccount_hex`.
std::optional<account_t> try_parse_account(std::string_view text);

std::string to_string(const account_t& account);

}  // namespace tally::schema
