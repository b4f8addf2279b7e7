#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/storage/storage.hpp>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

namespace tally::storage {

namespace detail {

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline std::string_view to_string_view(const ROCKSDB_NAMESPACE::Slice& slice) {
  return std::string_view{slice.data(), slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<tally::schema::bytes_t> get_raw(
      const tally::schema::bytes_view_t& key) const;
  bool write_batch(const std::vector<key_value_entry_t>& entries,
                   std::string& error) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_range(
      const tally::schema::bytes_view_t& prefix,
      const tally::schema::bytes_view_t& first_key,
      uint64_t limit) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(tally::schema::make_bytes_view(*value))};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tally::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    tally::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<tally::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tally::common::critical("Failed to get value from RocksDB");
  }
  return tally::schema::make_bytes(value);
}

inline bool storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries,
    std::string& error) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      error = put_status.ToString();
      spdlog::error("Failed staging key in write batch: {}", error);
      return false;
    }
  }
  // Synced: a confirmed archive append must survive a crash.
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    error = write_status.ToString();
    spdlog::error("Failed to commit write batch: {}", error);
    return false;
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  return list_range(prefix, prefix, std::numeric_limits<uint64_t>::max());
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const tally::schema::bytes_view_t& prefix,
    const tally::schema::bytes_view_t& first_key,
    const uint64_t limit) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(first_key));
  while (iterator->Valid() && entries.size() < limit) {
    if (!detail::to_string_view(iterator->key()).starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    tally::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace tally::storage
