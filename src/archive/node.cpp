#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <tally/archive/node.hpp>
#include <tally/blake3/hash.hpp>
#include <tally/common/critical.hpp>
#include <tally/schema/key/archive_keys.hpp>
#include <utility>

using namespace tally::schema;
using namespace tally::schema::encoding::scale;

namespace tally::archive {

node::node(node_options options)
    : node{options,
           tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
               options.path)} {}

node::node(node_options options, storage_t storage)
    : options_{std::move(options)}, storage_{std::move(storage)} {
  if (options_.max_query_length == 0) {
    tally::common::critical("archive query length must be positive");
  }
  stored_ = storage_
                .get<encoder_t, uint64_t>(
                    encoder_, make_bytes_view(key::kArchiveCountKey))
                .value_or(0);
  tip_ = storage_
             .get<encoder_t, hash32_t>(encoder_,
                                       make_bytes_view(key::kArchiveTipKey))
             .value_or(make_zero_hash());
  spdlog::info("Archive node at {} holds {} transaction(s), capacity {} bytes",
               options_.path, stored_, options_.max_memory);
}

bool node::append(const std::vector<transaction_t>& batch,
                  std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  if (batch.empty()) {
    error = "empty batch";
    spdlog::warn("Archive rejected batch: {}", error);
    return false;
  }
  for (auto i = std::size_t{0}; i < batch.size(); ++i) {
    if (batch[i].index != stored_ + i) {
      error = fmt::format("expected index {} but batch position {} holds {}",
                          stored_ + i, i, batch[i].index);
      spdlog::warn("Archive rejected batch: {}", error);
      return false;
    }
  }
  auto capacity = options_.max_memory / kMaxTransactionSize;
  if (batch.size() > capacity || stored_ > capacity - batch.size()) {
    error = fmt::format(
        "batch of {} transaction(s) exceeds capacity; {} of {} used",
        batch.size(), stored_, capacity);
    spdlog::warn("Archive rejected batch: {}", error);
    return false;
  }

  auto entries = std::vector<tally::storage::key_value_entry_t>{};
  entries.reserve(batch.size() + 2);
  auto tip = tip_;
  for (const auto& tx : batch) {
    auto value = encoder_.encode(to_record(tx));
    tip = tally::blake3::chain(tip, make_bytes_view(value));
    entries.emplace_back(key::make_archive_transaction_key(tx.index),
                         std::move(value));
  }
  auto stored = stored_ + batch.size();
  entries.emplace_back(make_bytes(key::kArchiveCountKey),
                       encoder_.encode(stored));
  entries.emplace_back(make_bytes(key::kArchiveTipKey), encoder_.encode(tip));
  if (!storage_.write_batch(entries, error)) {
    spdlog::error("Archive failed to store batch at index {}: {}", stored_,
                  error);
    return false;
  }

  stored_ = stored;
  tip_ = tip;
  spdlog::info("Archive accepted {} transaction(s); now holding {}",
               batch.size(), stored_);
  return true;
}

std::optional<transaction_t> node::get_transaction(
    const transaction_index_t index) {
  auto lock = std::scoped_lock{mutex_};
  if (index >= stored_) {
    return std::nullopt;
  }
  auto key = key::make_archive_transaction_key(index);
  auto value = storage_.get_raw(make_bytes_view(key));
  if (!value) {
    tally::common::critical("archived transaction {} missing from store",
                            index);
  }
  return decode_record(*value);
}

std::vector<transaction_t> node::get_transactions(
    const transaction_index_t start,
    const uint64_t length) {
  auto lock = std::scoped_lock{mutex_};
  if (start >= stored_ || length == 0) {
    return {};
  }
  auto limit = std::min({length, options_.max_query_length, stored_ - start});
  auto first_key = key::make_archive_transaction_key(start);
  auto entries = storage_.list_range(
      make_bytes_view(key::kArchiveTransactionPrefix),
      make_bytes_view(first_key), limit);

  auto transactions = std::vector<transaction_t>{};
  transactions.reserve(entries.size());
  for (const auto& [_, value] : entries) {
    transactions.push_back(decode_record(value));
  }
  return transactions;
}

std::optional<archive_usage_t> node::usage() {
  auto lock = std::scoped_lock{mutex_};
  auto used = stored_ * kMaxTransactionSize;
  auto usage = archive_usage_t{};
  usage.stored_transactions = stored_;
  usage.used_bytes = used;
  usage.max_bytes = options_.max_memory;
  usage.remaining_capacity =
      used < options_.max_memory
          ? (options_.max_memory - used) / kMaxTransactionSize
          : 0;
  usage.tip_hash = tip_;
  return usage;
}

uint64_t node::stored_transactions() const {
  auto lock = std::scoped_lock{mutex_};
  return stored_;
}

hash32_t node::tip_hash() const {
  auto lock = std::scoped_lock{mutex_};
  return tip_;
}

transaction_t node::decode_record(const bytes_t& value) {
  auto record = encoder_.try_decode<transaction_record_t>(make_bytes_view(value));
  if (!record) {
    tally::common::critical("failed to decode archived transaction");
  }
  auto tx = from_record(*record);
  if (!tx) {
    tally::common::critical("archived transaction has unknown layout");
  }
  return *tx;
}

}  // namespace tally::archive
