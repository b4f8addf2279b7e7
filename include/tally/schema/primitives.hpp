#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_nanoseconds_t = uint64_t;
using duration_nanoseconds_t = uint64_t;
using transaction_index_t = uint64_t;

/// Sentinel returned as `first_index` when a range response serves nothing
/// from the live log.
inline constexpr auto kNoTransactionIndex =
    std::numeric_limits<transaction_index_t>::max();

/// Upper bound of one encoded transaction, used for archive sizing.
inline constexpr auto kMaxTransactionSize = uint64_t{196};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Parse a non-negative decimal amount; std::nullopt on malformed input or
/// values that do not fit 256 bits.
std::optional<amount_t> try_make_amount(std::string_view decimal);
std::string to_string(const amount_t& amount);

/// Fixed width big-endian form of an amount, ordered like the amount itself.
hash32_t to_big_endian(const amount_t& amount);
amount_t from_big_endian(const hash32_t& bytes);

}  // namespace tally::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
