#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tally::testing {

inline constexpr auto kSecond = uint64_t{1'000'000'000};

inline tally::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tally::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline tally::schema::bytes_t make_owner(const uint8_t seed,
                                         const std::size_t size = 10) {
  auto owner = tally::schema::bytes_t(size, seed);
  owner.back() = 0x01;
  return owner;
}

inline tally::schema::bytes_t make_subaccount(const uint8_t seed) {
  auto hash = make_hash(seed);
  return tally::schema::bytes_t{hash.begin(), hash.end()};
}

inline tally::schema::account_t make_account(
    const uint8_t seed,
    const std::optional<uint8_t> subaccount_seed = std::nullopt) {
  auto account = tally::schema::account_t{};
  account.owner = make_owner(seed);
  if (subaccount_seed) {
    account.subaccount = make_subaccount(*subaccount_seed);
  }
  return account;
}

/// Transfer record with the given index, as the ledger would log it.
inline tally::schema::transaction_t make_transaction(
    const tally::schema::transaction_index_t index,
    const uint64_t amount = 100) {
  auto tx = tally::schema::transaction_t{};
  tx.index = index;
  tx.kind = tally::schema::transaction_kind_t::transfer;
  tx.from = make_account(1);
  tx.to = make_account(2, 9);
  tx.amount = amount;
  tx.fee = tally::schema::amount_t{10};
  tx.memo = tally::schema::bytes_t{0xde, 0xad};
  tx.created_at_time = 1'000 * kSecond + index;
  tx.timestamp = 1'000 * kSecond + index;
  return tx;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tally::testing
