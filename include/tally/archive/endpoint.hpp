#pragma once

#include <tally/schema/archive_usage.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tally::archive {

/// Contract the ledger consumes from an archive, local or remote.
///
/// `append` is the only call the write path makes; it may block for as long
/// as the transport takes, and the ledger releases its lock around it.
class endpoint {
 public:
  virtual ~endpoint() = default;

  /// Store a contiguous batch whose first index equals the archive's current
  /// stored count. On failure returns false and sets `error`; nothing is
  /// stored.
  virtual bool append(const std::vector<tally::schema::transaction_t>& batch,
                      std::string& error) = 0;

  virtual std::optional<tally::schema::transaction_t> get_transaction(
      tally::schema::transaction_index_t index) = 0;

  /// Transactions in `[start, start + length)`, clipped to what is stored and
  /// to the per-call limit.
  virtual std::vector<tally::schema::transaction_t> get_transactions(
      tally::schema::transaction_index_t start,
      uint64_t length) = 0;

  virtual std::optional<tally::schema::archive_usage_t> usage() = 0;
};

/// Allocates a fresh archive; returns nullptr when allocation fails.
using provisioner_t = std::function<std::shared_ptr<endpoint>()>;

}  // namespace tally::archive
