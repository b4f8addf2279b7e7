#pragma once
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<tally::schema::bytes_t> get_raw(
      const tally::schema::bytes_view_t& key) const;

  /// Persist all entries in one atomic write. On failure nothing is written,
  /// `error` describes why and false is returned.
  bool write_batch(const std::vector<key_value_entry_t>& entries,
                   std::string& error) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  /// Key-value pairs from `first_key` onward that share `prefix`, at most
  /// `limit` of them.
  std::vector<key_value_entry_t> list_range(
      const tally::schema::bytes_view_t& prefix,
      const tally::schema::bytes_view_t& first_key,
      uint64_t limit) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
