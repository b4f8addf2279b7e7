#include <gtest/gtest.h>
#include <tally/schema/account.hpp>
#include <tally/testing/common.hpp>

#include <string>

using tally::testing::make_account;
using tally::testing::make_owner;

TEST(account, owner_and_subaccount_sizes_are_enforced) {
  auto account = tally::schema::account_t{};
  EXPECT_FALSE(tally::schema::is_valid_account(account));

  account.owner = make_owner(3, tally::schema::kMaxOwnerSize);
  EXPECT_TRUE(tally::schema::is_valid_account(account));

  account.owner = make_owner(3, tally::schema::kMaxOwnerSize + 1);
  EXPECT_FALSE(tally::schema::is_valid_account(account));

  account.owner = make_owner(3);
  account.subaccount = tally::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(tally::schema::is_valid_account(account));
  account.subaccount = tally::schema::bytes_t(32, 0x01);
  EXPECT_TRUE(tally::schema::is_valid_account(account));
}

TEST(account, default_subaccount_is_the_same_account) {
  auto plain = make_account(4);
  auto zeroed = make_account(4);
  zeroed.subaccount = tally::schema::bytes_t(tally::schema::kSubaccountSize, 0);

  EXPECT_TRUE(tally::schema::same_account(plain, zeroed));
  EXPECT_EQ(tally::schema::encode_account(plain),
            tally::schema::encode_account(zeroed));
  EXPECT_FALSE(tally::schema::same_account(plain, make_account(4, 7)));
}

TEST(account, canonical_key_layout) {
  auto account = make_account(5, 8);
  auto key = tally::schema::encode_account(account);
  ASSERT_EQ(key.size(), 1 + account.owner.size() + 32);
  EXPECT_EQ(key[0], account.owner.size());

  auto decoded =
      tally::schema::try_decode_account(tally::schema::make_bytes_view(key));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(tally::schema::same_account(*decoded, account));
  EXPECT_EQ(decoded->subaccount, account.subaccount);
}

TEST(account, try_decode_account_rejects_malformed_keys) {
  auto empty = tally::schema::bytes_t{};
  EXPECT_FALSE(tally::schema::try_decode_account(
                   tally::schema::make_bytes_view(empty))
                   .has_value());

  auto truncated = tally::schema::bytes_t{5, 0x01, 0x02};
  EXPECT_FALSE(tally::schema::try_decode_account(
                   tally::schema::make_bytes_view(truncated))
                   .has_value());

  auto short_subaccount = tally::schema::bytes_t{1, 0x01, 0x02, 0x03};
  EXPECT_FALSE(tally::schema::try_decode_account(
                   tally::schema::make_bytes_view(short_subaccount))
                   .has_value());
}

TEST(account, parses_command_line_form) {
  auto owner_only = tally::schema::try_parse_account("0a0b0c");
  ASSERT_TRUE(owner_only.has_value());
  EXPECT_EQ(owner_only->owner, (tally::schema::bytes_t{0x0a, 0x0b, 0x0c}));
  EXPECT_FALSE(owner_only->subaccount.has_value());

  auto sub = std::string(64, '0');
  sub.back() = '1';
  auto with_sub = tally::schema::try_parse_account("0a0b0c." + sub);
  ASSERT_TRUE(with_sub.has_value());
  ASSERT_TRUE(with_sub->subaccount.has_value());
  EXPECT_EQ(with_sub->subaccount->back(), 0x01);
  EXPECT_EQ(tally::schema::to_string(*with_sub), "0a0b0c." + sub);

  EXPECT_FALSE(tally::schema::try_parse_account("").has_value());
  EXPECT_FALSE(tally::schema::try_parse_account("xyz").has_value());
  EXPECT_FALSE(tally::schema::try_parse_account("0a.0102").has_value());
}

TEST(account, to_string_omits_default_subaccount) {
  auto account = tally::schema::account_t{};
  account.owner = tally::schema::bytes_t{0xab, 0xcd};
  account.subaccount = tally::schema::bytes_t(32, 0);
  EXPECT_EQ(tally::schema::to_string(account), "abcd");
}
