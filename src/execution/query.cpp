#include <tally/common/critical.hpp>
#include <tally/execution/query.hpp>

#include <algorithm>
#include <limits>

using namespace tally::schema;

namespace tally::execution {

get_transactions_response_t resolve_range(const transaction_log& log,
                                          const uint64_t stored_transactions,
                                          const transaction_index_t start,
                                          const uint64_t length,
                                          const uint64_t max_archive_query_length) {
  if (max_archive_query_length == 0) {
    tally::common::critical("archive query length must be positive");
  }
  auto response = get_transactions_response_t{};
  auto tx_end = stored_transactions + log.size();
  auto end = length > std::numeric_limits<uint64_t>::max() - start
                 ? std::numeric_limits<uint64_t>::max()
                 : start + length;
  end = std::min(end, tx_end);
  if (length == 0 || start >= end) {
    return response;
  }

  auto archived_end = std::min(end, stored_transactions);
  for (auto chunk_start = start; chunk_start < archived_end;) {
    auto chunk_length =
        std::min(archived_end - chunk_start, max_archive_query_length);
    response.archived_transactions.push_back(
        archived_range_t{.start = chunk_start, .length = chunk_length});
    chunk_start += chunk_length;
  }

  auto local_start = std::max(start, stored_transactions);
  if (local_start < end) {
    response.transactions =
        log.slice(local_start - stored_transactions, end - local_start);
    response.first_index = local_start;
  }

  auto archived_count =
      archived_end > start ? archived_end - start : uint64_t{0};
  response.length = archived_count + response.transactions.size();
  return response;
}

}  // namespace tally::execution
