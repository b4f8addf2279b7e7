#pragma once

#include <tally/execution/transaction_log.hpp>
#include <tally/schema/transaction_range.hpp>
#include <cstdint>

namespace tally::execution {

/// Partition `[start, start + length)` into the part served from the live log
/// and archive fetch descriptors of at most `max_archive_query_length`
/// entries each. Performs no archive calls.
tally::schema::get_transactions_response_t resolve_range(
    const transaction_log& log,
    uint64_t stored_transactions,
    tally::schema::transaction_index_t start,
    uint64_t length,
    uint64_t max_archive_query_length);

}  // namespace tally::execution
