#pragma once
#include <tally/schema/primitives.hpp>
#include <string_view>

// Key layout of the archive node's store.
namespace tally::schema::key {

extern const std::string_view kArchiveTransactionPrefix;
extern const std::string_view kArchiveCountKey;
extern const std::string_view kArchiveTipKey;

/// `ARC|TX|` followed by the big-endian index.
tally::schema::bytes_t make_archive_transaction_key(
    tally::schema::transaction_index_t index);

}  // namespace tally::schema::key
