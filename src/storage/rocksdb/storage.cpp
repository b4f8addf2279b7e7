#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace tally::storage {

namespace {

/// RocksDB only creates the last path component.
void ensure_parent_directory(const std::filesystem::path& path) {
  if (!path.has_parent_path()) {
    return;
  }
  auto error = std::error_code{};
  std::filesystem::create_directories(path.parent_path(), error);
  if (error) {
    tally::common::critical("cannot create directory for store {}: {}",
                            path.string(), error.message());
  }
}

ROCKSDB_NAMESPACE::Options make_archive_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Archived records are never rewritten; surface corruption on open.
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto location = std::filesystem::path{std::string{path}};
  ensure_parent_directory(location);

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_archive_options(),
                                            location.string(), &database);
  if (!status.ok()) {
    tally::common::critical("cannot open archive store at {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened archive store at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace tally::storage
