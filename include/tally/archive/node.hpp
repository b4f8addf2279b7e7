#pragma once

#include <tally/archive/endpoint.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/ledger_config.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string>

namespace tally::archive {

inline constexpr auto kDefaultArchiveMaxMemory = uint64_t{1} << 30;

struct node_options final {
  std::string path;
  uint64_t max_memory{kDefaultArchiveMaxMemory};
  uint64_t max_query_length{tally::schema::kDefaultMaxArchiveQueryLength};
};

/// Archive endpoint backed by RocksDB.
///
/// Accepts only batches that continue exactly where the stored sequence
/// ends, and folds every accepted record into a BLAKE3 hash chain. Reopening
/// the same path resumes from the persisted count and tip.
class node final : public endpoint {
 public:
  using storage_t =
      tally::storage::storage<tally::storage::rocksdb_storage_tag>;

  explicit node(node_options options);
  /// Serve from a store the caller already opened at `options.path`.
  node(node_options options, storage_t storage);

  bool append(const std::vector<tally::schema::transaction_t>& batch,
              std::string& error) override;
  std::optional<tally::schema::transaction_t> get_transaction(
      tally::schema::transaction_index_t index) override;
  std::vector<tally::schema::transaction_t> get_transactions(
      tally::schema::transaction_index_t start,
      uint64_t length) override;
  std::optional<tally::schema::archive_usage_t> usage() override;

  uint64_t stored_transactions() const;
  tally::schema::hash32_t tip_hash() const;

 private:
  using encoder_t = tally::schema::encoding::encoder<
      tally::schema::encoding::scale_encoder_tag>;

  tally::schema::transaction_t decode_record(
      const tally::schema::bytes_t& value);

  node_options options_;
  storage_t storage_;
  encoder_t encoder_;
  mutable std::mutex mutex_;
  uint64_t stored_{};
  tally::schema::hash32_t tip_{};
};

}  // namespace tally::archive
