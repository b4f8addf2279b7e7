#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

/// Byte codec selected at build time by tag. The archive node and its storage
/// only ever see this interface.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tally::schema::bytes_t& out);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
