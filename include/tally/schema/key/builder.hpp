#pragma once
#include <tally/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tally::schema::key {

struct builder final {
  tally::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Integers are written big-endian so keys sort numerically.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&big);
    data.insert(data.end(), bytes, bytes + sizeof(T));
    return *this;
  }
};

}  // namespace tally::schema::key
