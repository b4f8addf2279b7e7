#pragma once

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <tally/storage/rocksdb/storage.hpp>

#include <string>

namespace tally::testing {

/// Open an existing RocksDB directory read-only; every write to it fails.
inline tally::storage::storage<tally::storage::rocksdb_storage_tag>
open_read_only_store(const std::string& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
      ROCKSDB_NAMESPACE::Options{}, path, &database);
  auto store = tally::storage::storage<tally::storage::rocksdb_storage_tag>{};
  if (status.ok()) {
    store.database.reset(database);
  }
  return store;
}

}  // namespace tally::testing
