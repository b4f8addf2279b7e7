#include <gtest/gtest.h>
#include <tally/testing/engine_fixture.hpp>

#include <thread>
#include <variant>
#include <vector>

using tally::testing::engine_fixture;
using tally::testing::index_of;
using tally::testing::make_account;
using tally::testing::make_ledger_config;

namespace {

const auto kBob = make_account(3);

tally::schema::ledger_config_t make_small_log_config(const uint64_t log_size) {
  auto config = make_ledger_config();
  config.archive.max_log_size = log_size;
  return config;
}

}  // namespace

TEST(engine_migration, full_log_moves_to_archive) {
  auto f = engine_fixture{};
  auto& engine = f.engine();

  for (auto i = uint64_t{0}; i < 1999; ++i) {
    ASSERT_EQ(index_of(f.mint(kBob, 1)), i);
  }
  EXPECT_EQ(f.provisioned(), 0u);
  EXPECT_EQ(engine.log_size(), 1999u);

  EXPECT_EQ(index_of(f.mint(kBob, 1)), 1999u);
  EXPECT_EQ(f.provisioned(), 1u);
  EXPECT_EQ(engine.stored_transactions(), 2000u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_EQ(engine.total_transactions(), 2000u);
  EXPECT_EQ(f.archive().stored(), 2000u);
  EXPECT_EQ(f.archive().append_calls(), 1u);

  auto first = engine.get_transaction(0);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->index, 0u);
  EXPECT_EQ(first->kind, tally::schema::transaction_kind_t::mint);

  EXPECT_EQ(index_of(f.mint(kBob, 1)), 2000u);
  EXPECT_EQ(engine.log_size(), 1u);
  EXPECT_EQ(engine.balance_of(kBob), 2001);
  EXPECT_EQ(f.provisioned(), 1u);

  auto status = engine.archive_status();
  EXPECT_TRUE(status.bound);
  EXPECT_EQ(status.migrations, 1u);
}

TEST(engine_migration, failed_migration_keeps_log_and_retries_with_backoff) {
  auto f = engine_fixture{make_small_log_config(4)};
  auto& engine = f.engine();
  f.archive().set_fail(true);

  for (auto i = 0; i < 4; ++i) {
    f.mint(kBob, 10);
  }
  EXPECT_EQ(f.archive().append_calls(), 1u);
  EXPECT_EQ(engine.stored_transactions(), 0u);
  EXPECT_EQ(engine.log_size(), 4u);
  EXPECT_EQ(engine.balance_of(kBob), 40);
  EXPECT_EQ(engine.archive_status().consecutive_failures, 1u);
  ASSERT_TRUE(engine.get_transaction(3).has_value());

  // Retries on the next commit, then waits two commits.
  f.mint(kBob, 10);
  EXPECT_EQ(f.archive().append_calls(), 2u);
  f.archive().set_fail(false);
  f.mint(kBob, 10);
  EXPECT_EQ(f.archive().append_calls(), 2u);
  EXPECT_EQ(engine.log_size(), 6u);

  EXPECT_EQ(index_of(f.mint(kBob, 10)), 6u);
  EXPECT_EQ(f.archive().append_calls(), 3u);
  EXPECT_EQ(engine.stored_transactions(), 7u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_EQ(engine.archive_status().consecutive_failures, 0u);
  EXPECT_EQ(engine.archive_status().failed_attempts, 2u);
  EXPECT_EQ(f.provisioned(), 1u);

  auto tx = engine.get_transaction(5);
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->index, 5u);
  EXPECT_EQ(engine.balance_of(kBob), 70);
}

TEST(engine_migration, flush_archive_migrates_partial_log) {
  auto f = engine_fixture{};
  auto& engine = f.engine();
  EXPECT_FALSE(engine.flush_archive());
  EXPECT_EQ(f.provisioned(), 0u);

  f.mint(kBob, 1);
  f.mint(kBob, 1);
  EXPECT_TRUE(engine.flush_archive());
  EXPECT_EQ(engine.stored_transactions(), 2u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_FALSE(engine.flush_archive());

  EXPECT_EQ(index_of(f.mint(kBob, 1)), 2u);
  EXPECT_TRUE(engine.get_transaction(1).has_value());
  EXPECT_TRUE(engine.get_transaction(2).has_value());
}

TEST(engine_migration, commits_continue_while_archive_append_is_in_flight) {
  auto f = engine_fixture{make_small_log_config(4)};
  auto& engine = f.engine();
  for (auto i = 0; i < 3; ++i) {
    f.mint(kBob, 1);
  }

  f.archive().hold_next_append();
  auto trigger = tally::schema::transfer_result_t{};
  auto migrating = std::thread{[&] { trigger = f.mint(kBob, 1); }};
  f.archive().wait_until_entered();

  // The ledger stays writable and readable while the batch is in transit.
  for (auto i = uint64_t{4}; i < 7; ++i) {
    EXPECT_EQ(index_of(f.mint(kBob, 1)), i);
  }
  EXPECT_EQ(engine.total_transactions(), 7u);
  EXPECT_EQ(engine.stored_transactions(), 0u);
  EXPECT_EQ(engine.log_size(), 7u);
  ASSERT_TRUE(engine.get_transaction(5).has_value());
  EXPECT_EQ(engine.get_transaction(5)->index, 5u);
  EXPECT_EQ(f.archive().append_calls(), 1u);

  f.archive().release();
  migrating.join();
  EXPECT_EQ(index_of(trigger), 3u);

  EXPECT_EQ(engine.stored_transactions(), 4u);
  EXPECT_EQ(engine.log_size(), 3u);
  EXPECT_EQ(f.archive().stored(), 4u);
  EXPECT_EQ(engine.get_transaction(4)->index, 4u);
  EXPECT_EQ(engine.get_transaction(0)->index, 0u);

  // The commits made during the transfer trigger the next migration.
  EXPECT_EQ(index_of(f.mint(kBob, 1)), 7u);
  EXPECT_EQ(engine.stored_transactions(), 8u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_EQ(f.archive().append_calls(), 2u);
  EXPECT_EQ(engine.balance_of(kBob), 8);
}

TEST(engine_migration, range_reads_span_archive_and_log) {
  auto config = make_small_log_config(4);
  config.archive.max_archive_query_length = 3;
  auto f = engine_fixture{std::move(config)};
  auto& engine = f.engine();
  for (auto i = 0; i < 10; ++i) {
    f.mint(kBob, static_cast<uint64_t>(i + 1));
  }
  ASSERT_EQ(engine.stored_transactions(), 8u);
  ASSERT_EQ(engine.log_size(), 2u);

  auto response = engine.get_transactions(
      tally::schema::get_transactions_request_t{.start = 1, .length = 8});
  EXPECT_EQ(response.length, 8u);
  ASSERT_EQ(response.archived_transactions.size(), 3u);
  EXPECT_EQ(response.first_index, 8u);
  ASSERT_EQ(response.transactions.size(), 1u);

  auto assembled = std::vector<tally::schema::transaction_t>{};
  for (const auto& range : response.archived_transactions) {
    EXPECT_LE(range.length, 3u);
    auto part = engine.fetch_archived(range);
    EXPECT_EQ(part.size(), range.length);
    assembled.insert(assembled.end(), part.begin(), part.end());
  }
  assembled.insert(assembled.end(), response.transactions.begin(),
                   response.transactions.end());

  ASSERT_EQ(assembled.size(), 8u);
  for (auto i = std::size_t{0}; i < assembled.size(); ++i) {
    EXPECT_EQ(assembled[i].index, i + 1);
    EXPECT_EQ(assembled[i].amount, i + 2);
    auto single = engine.get_transaction(i + 1);
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->amount, assembled[i].amount);
  }
}

TEST(engine_migration, archive_is_not_provisioned_without_budget) {
  auto config = make_small_log_config(2);
  config.archive.resource_budget = 1;
  config.archive.provisioning_cost = 2;
  auto f = engine_fixture{std::move(config)};
  auto& engine = f.engine();

  for (auto i = 0; i < 6; ++i) {
    f.mint(kBob, 1);
  }
  EXPECT_EQ(f.provisioned(), 0u);
  EXPECT_FALSE(engine.archive_status().bound);
  EXPECT_EQ(engine.log_size(), 6u);
  EXPECT_FALSE(engine.flush_archive());
  EXPECT_EQ(engine.total_transactions(), 6u);
}

TEST(engine_migration, stored_batch_with_lost_reply_does_not_stall_migration) {
  auto f = engine_fixture{make_small_log_config(4)};
  auto& engine = f.engine();
  f.archive().set_lose_confirmation(true);

  for (auto i = uint64_t{0}; i < 200; ++i) {
    ASSERT_EQ(index_of(f.mint(kBob, 1)), i);
  }
  EXPECT_EQ(f.archive().stored(), 200u);
  EXPECT_EQ(engine.stored_transactions(), 200u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_EQ(f.archive().append_calls(), 50u);

  auto status = engine.archive_status();
  EXPECT_EQ(status.failed_attempts, 0u);
  EXPECT_EQ(status.migrations, 50u);
  EXPECT_EQ(status.phase, tally::archive::migration_phase_t::idle);

  auto tx = engine.get_transaction(137);
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->index, 137u);
  EXPECT_EQ(engine.balance_of(kBob), 200);
}

TEST(engine_migration, non_standard_exception_from_archive_is_a_failed_attempt) {
  auto f = engine_fixture{make_small_log_config(4)};
  auto& engine = f.engine();
  f.archive().set_throw(true);

  for (auto i = 0; i < 4; ++i) {
    f.mint(kBob, 1);
  }
  auto status = engine.archive_status();
  EXPECT_EQ(status.phase, tally::archive::migration_phase_t::idle);
  EXPECT_EQ(status.consecutive_failures, 1u);
  EXPECT_EQ(engine.log_size(), 4u);

  f.archive().set_throw(false);
  EXPECT_EQ(index_of(f.mint(kBob, 1)), 4u);
  EXPECT_EQ(engine.stored_transactions(), 5u);
  EXPECT_EQ(engine.log_size(), 0u);
  EXPECT_EQ(f.archive().stored(), 5u);
}
