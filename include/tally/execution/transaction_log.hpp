#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace tally::execution {

/// Bounded, append-only sequence of committed transactions still held by the
/// ledger. Entry `i` carries global index `stored_transactions + i`.
///
/// The bound is a migration trigger, not a hard limit: appends continue while
/// an archive migration is pending or failing.
class transaction_log final {
 public:
  explicit transaction_log(uint64_t capacity);

  /// Stamp `tx.index = stored_transactions + size()` and append it.
  tally::schema::transaction_index_t append(tally::schema::transaction_t tx,
                                            uint64_t stored_transactions);

  uint64_t size() const;
  bool empty() const;
  uint64_t capacity() const;
  bool is_full() const;

  /// Entry at a local offset (not a global index).
  std::optional<tally::schema::transaction_t> at(uint64_t offset) const;

  /// Entries in local offsets `[start, start + length)`, clipped to what the
  /// log holds.
  std::vector<tally::schema::transaction_t> slice(uint64_t start,
                                                  uint64_t length) const;

  /// Copy of every entry, oldest first.
  std::vector<tally::schema::transaction_t> snapshot() const;

  /// Drop the oldest `count` entries once the archive has confirmed them.
  void truncate_front(uint64_t count);

  void clear();

 private:
  std::deque<tally::schema::transaction_t> entries_;
  uint64_t capacity_{};
};

}  // namespace tally::execution
