#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: transaction kind.
// Ledger workflow: Closed classification of a committed transaction: mint
// from the minting account, burn into it, or an ordinary transfer.
namespace tally::schema {

enum class transaction_kind_t : uint8_t { mint = 0, burn = 1, transfer = 2 };

inline constexpr auto kTransactionKindMappings =
    std::array{std::pair<std::string_view, transaction_kind_t>{
                   "mint", transaction_kind_t::mint},
               std::pair<std::string_view, transaction_kind_t>{
                   "burn", transaction_kind_t::burn},
               std::pair<std::string_view, transaction_kind_t>{
                   "transfer", transaction_kind_t::transfer}};

inline constexpr std::optional<transaction_kind_t> try_make_transaction_kind(
    const std::string_view value) {
  for (const auto& [name, kind] : kTransactionKindMappings) {
    if (name == value) {
      return kind;
    }
  }
  return std::nullopt;
}

inline constexpr std::optional<transaction_kind_t> try_make_transaction_kind(
    const uint8_t value) {
  for (const auto& [name, kind] : kTransactionKindMappings) {
    if (static_cast<uint8_t>(kind) == value) {
      return kind;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const transaction_kind_t value) {
  for (const auto& [name, kind] : kTransactionKindMappings) {
    if (kind == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace tally::schema
