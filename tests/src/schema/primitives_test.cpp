#include <gtest/gtest.h>
#include <tally/schema/primitives.hpp>

#include <limits>
#include <string>

TEST(primitives, hex_round_trips_bytes) {
  auto payload = tally::schema::bytes_t{0x00, 0x01, 0xab, 0xfe, 0xff};
  auto hex = tally::schema::to_hex(tally::schema::make_bytes_view(payload));
  EXPECT_EQ(hex, "0001abfeff");
  EXPECT_EQ(tally::schema::from_hex(hex), payload);
  EXPECT_EQ(tally::schema::from_hex("0x0001ABFEFF"), payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(tally::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(tally::schema::try_from_hex("zz").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = tally::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, amounts_parse_full_256_bit_range) {
  auto max = std::numeric_limits<tally::schema::amount_t>::max();
  auto parsed = tally::schema::try_make_amount(tally::schema::to_string(max));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, max);

  auto small = tally::schema::try_make_amount("1000");
  ASSERT_TRUE(small.has_value());
  EXPECT_EQ(*small, 1000);
}

TEST(primitives, amounts_reject_overflow_and_malformed_text) {
  auto max = std::numeric_limits<tally::schema::amount_t>::max();
  auto too_big = tally::schema::to_string(max) + "0";
  EXPECT_FALSE(tally::schema::try_make_amount(too_big).has_value());
  EXPECT_FALSE(tally::schema::try_make_amount("").has_value());
  EXPECT_FALSE(tally::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(tally::schema::try_make_amount("12a").has_value());
}

TEST(primitives, big_endian_amounts_are_right_aligned) {
  auto one = tally::schema::to_big_endian(tally::schema::amount_t{1});
  EXPECT_EQ(one[31], 1u);
  EXPECT_EQ(one[0], 0u);

  auto zero = tally::schema::to_big_endian(tally::schema::amount_t{0});
  EXPECT_EQ(zero, tally::schema::make_zero_hash());

  auto max = std::numeric_limits<tally::schema::amount_t>::max();
  auto encoded = tally::schema::to_big_endian(max);
  for (auto byte : encoded) {
    EXPECT_EQ(byte, 0xffu);
  }
  EXPECT_EQ(tally::schema::from_big_endian(encoded), max);

  auto value = *tally::schema::try_make_amount("123456789012345678901234567890");
  EXPECT_EQ(tally::schema::from_big_endian(tally::schema::to_big_endian(value)),
            value);
}

TEST(primitives, no_transaction_index_is_the_largest_index) {
  EXPECT_EQ(tally::schema::kNoTransactionIndex,
            std::numeric_limits<uint64_t>::max());
}
