#pragma once

#include <tally/archive/coordinator.hpp>
#include <tally/archive/endpoint.hpp>
#include <tally/execution/balance_store.hpp>
#include <tally/execution/deduplication.hpp>
#include <tally/execution/transaction_log.hpp>
#include <tally/execution/transaction_request.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/ledger_config.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_range.hpp>
#include <tally/schema/transfer_args.hpp>
#include <tally/schema/transfer_error.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace tally::execution {

using time_source_t = std::function<tally::schema::timestamp_nanoseconds_t()>;

/// Nanoseconds since the Unix epoch from the system clock.
time_source_t system_time_source();

/// Fungible-token ledger state machine.
///
/// Owns balances, the live transaction log and the archive coordinator as one
/// aggregate. Operations are serialized by an internal mutex; the only point
/// where another operation can run in the middle of a write is while a full
/// log is being transmitted to the archive.
class engine final {
 public:
  /// Construct the ledger and credit genesis balances.
  ///
  /// An invalid configuration (malformed minting account, zero max supply,
  /// genesis above max supply, zero log or query limits) is fatal.
  /// `provisioner` is called at most once, when the first migration needs an
  /// archive.
  engine(tally::schema::ledger_config_t config,
         tally::archive::provisioner_t provisioner,
         time_source_t clock = system_time_source());

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  tally::schema::amount_t total_supply() const;
  tally::schema::amount_t total_minted() const;
  tally::schema::amount_t total_burned() const;
  tally::schema::amount_t balance_of(
      const tally::schema::account_t& account) const;

  /// Archived plus live transactions.
  uint64_t total_transactions() const;
  uint64_t stored_transactions() const;
  uint64_t log_size() const;

  /// Served from the log, or from the archive for migrated indices.
  std::optional<tally::schema::transaction_t> get_transaction(
      tally::schema::transaction_index_t index) const;

  tally::schema::get_transactions_response_t get_transactions(
      const tally::schema::get_transactions_request_t& request) const;

  /// Resolve one archive descriptor returned by `get_transactions`.
  std::vector<tally::schema::transaction_t> fetch_archived(
      const tally::schema::archived_range_t& range) const;

  const tally::schema::account_t& minting_account() const;
  tally::schema::amount_t transfer_fee() const;
  tally::archive::archive_status archive_status() const;

  /// Debit `{caller, args.from_subaccount}`. A destination equal to the
  /// minting account burns.
  tally::schema::transfer_result_t transfer(
      const tally::schema::transfer_args_t& args,
      const tally::schema::principal_t& caller);

  /// Only the minting account owner may mint.
  tally::schema::transfer_result_t mint(
      const tally::schema::mint_args_t& args,
      const tally::schema::principal_t& caller);

  tally::schema::transfer_result_t burn(
      const tally::schema::burn_args_t& args,
      const tally::schema::principal_t& caller);

  /// Migrate whatever the log holds now, ignoring capacity and backoff.
  /// Returns true when a batch was confirmed by the archive.
  bool flush_archive();

 private:
  tally::schema::transfer_result_t submit(const transaction_request& request);

  /// Apply a validated request and append its record. Caller holds the lock.
  tally::schema::transaction_index_t commit(
      const validated_request& request,
      tally::schema::timestamp_nanoseconds_t now);

  /// Run one migration attempt; releases `lock` while transmitting.
  bool migrate(std::unique_lock<std::mutex>& lock, bool force);

  void apply_genesis();

  mutable std::mutex mutex_;
  tally::schema::ledger_config_t config_;
  time_source_t clock_;
  balance_store balances_;
  transaction_log log_;
  deduplication_index recent_;
  tally::archive::coordinator coordinator_;
};

}  // namespace tally::execution
