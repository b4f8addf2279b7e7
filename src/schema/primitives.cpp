#include <tally/common/critical.hpp>
#include <tally/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tally::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_zero_hash() {
  auto hash = hash32_t{};
  hash.fill(0);
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    tally::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }
  static const auto kMaxAmount =
      boost::multiprecision::cpp_int{std::numeric_limits<amount_t>::max()};
  auto value = boost::multiprecision::cpp_int{};
  for (const auto c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
    if (value > kMaxAmount) {
      return std::nullopt;
    }
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

hash32_t to_big_endian(const amount_t& amount) {
  auto minimal = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(minimal), 8);
  auto out = make_zero_hash();
  if (amount == 0) {
    return out;
  }
  std::copy(std::begin(minimal), std::end(minimal),
            std::next(std::begin(out),
                      static_cast<std::ptrdiff_t>(out.size() - minimal.size())));
  return out;
}

amount_t from_big_endian(const hash32_t& bytes) {
  auto amount = amount_t{};
  boost::multiprecision::import_bits(amount, std::begin(bytes),
                                     std::end(bytes), 8);
  return amount;
}

}  // namespace tally::schema
