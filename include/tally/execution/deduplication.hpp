#pragma once

#include <tally/execution/transaction_request.hpp>
#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace tally::execution {

/// Canonical byte key of a request for de-duplication: kind, both account
/// keys, amount, supplied fee, memo and created_at_time.
tally::schema::bytes_t make_deduplication_key(const validated_request& request);

/// Recently committed requests that carried `created_at_time`, so identical
/// resubmissions inside the transaction window are rejected.
class deduplication_index final {
 public:
  std::optional<tally::schema::transaction_index_t> find(
      const tally::schema::bytes_t& key) const;

  void insert(tally::schema::bytes_t key,
              tally::schema::transaction_index_t index,
              tally::schema::timestamp_nanoseconds_t created_at_time);

  /// Forget every entry created strictly before `oldest_allowed`.
  void prune(tally::schema::timestamp_nanoseconds_t oldest_allowed);

  std::size_t size() const;

 private:
  std::map<tally::schema::bytes_t, tally::schema::transaction_index_t>
      entries_;
  std::multimap<tally::schema::timestamp_nanoseconds_t, tally::schema::bytes_t>
      expiry_;
};

}  // namespace tally::execution
