#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <cstdint>
#include <vector>

// Schema type: transaction range.
// Ledger workflow: History read spanning the live log and the archive. The
// archived part is returned as fetch descriptors the caller resolves against
// the archive itself.
namespace tally::schema {

template <uint16_t Version>
struct get_transactions_request;

template <>
struct get_transactions_request<1> final {
  uint16_t version{1};
  transaction_index_t start{};
  uint64_t length{};
};

using get_transactions_request_t = get_transactions_request<1>;

template <uint16_t Version>
struct archived_range;

template <>
struct archived_range<1> final {
  uint16_t version{1};
  transaction_index_t start{};
  uint64_t length{};
};

using archived_range_t = archived_range<1>;

template <uint16_t Version>
struct get_transactions_response;

template <>
struct get_transactions_response<1> final {
  uint16_t version{1};
  uint64_t length{};
  transaction_index_t first_index{kNoTransactionIndex};
  std::vector<transaction_t> transactions;
  std::vector<archived_range_t> archived_transactions;
};

using get_transactions_response_t = get_transactions_response<1>;

}  // namespace tally::schema
