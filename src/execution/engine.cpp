#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <tally/common/critical.hpp>
#include <tally/execution/engine.hpp>
#include <tally/execution/query.hpp>
#include <tally/execution/validator.hpp>
#include <utility>

using namespace tally::schema;

namespace {

/// Stored count the archive reports, or nothing when it cannot be asked.
std::optional<uint64_t> reported_stored_transactions(
    tally::archive::endpoint& target) {
  try {
    auto usage = target.usage();
    if (usage) {
      return usage->stored_transactions;
    }
    spdlog::warn("Archive usage unavailable after a failed append");
  } catch (const std::exception& ex) {
    spdlog::warn("Archive usage failed after a failed append: {}", ex.what());
  } catch (...) {
    spdlog::warn("Archive usage threw a non-standard exception");
  }
  return std::nullopt;
}

void check_config(const ledger_config_t& config) {
  if (!is_valid_account(config.minting_account)) {
    tally::common::critical("minting account is malformed");
  }
  if (config.max_supply < 1) {
    tally::common::critical("max supply must be at least one base unit");
  }
  if (config.archive.max_log_size == 0) {
    tally::common::critical("max log size must be positive");
  }
  if (config.archive.max_archive_query_length == 0) {
    tally::common::critical("max archive query length must be positive");
  }
}

}  // namespace

namespace tally::execution {

time_source_t system_time_source() {
  return [] {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<timestamp_nanoseconds_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch)
            .count());
  };
}

engine::engine(ledger_config_t config,
               tally::archive::provisioner_t provisioner,
               time_source_t clock)
    : config_{std::move(config)},
      clock_{std::move(clock)},
      log_{config_.archive.max_log_size},
      coordinator_{config_.archive, std::move(provisioner)} {
  check_config(config_);
  if (!clock_) {
    tally::common::critical("ledger engine requires a time source");
  }
  apply_genesis();
  spdlog::info(
      "Ledger engine ready: minting account {}, fee {}, supply {} across {} "
      "account(s), log capacity {}",
      to_string(config_.minting_account), to_string(config_.transfer_fee),
      to_string(balances_.total_supply()), balances_.accounts(),
      log_.capacity());
}

amount_t engine::total_supply() const {
  auto lock = std::scoped_lock{mutex_};
  return balances_.total_supply();
}

amount_t engine::total_minted() const {
  auto lock = std::scoped_lock{mutex_};
  return balances_.total_minted();
}

amount_t engine::total_burned() const {
  auto lock = std::scoped_lock{mutex_};
  return balances_.total_burned();
}

amount_t engine::balance_of(const account_t& account) const {
  if (!is_valid_account(account)) {
    return amount_t{0};
  }
  auto key = encode_account(account);
  auto lock = std::scoped_lock{mutex_};
  return balances_.balance_of(key);
}

uint64_t engine::total_transactions() const {
  auto lock = std::scoped_lock{mutex_};
  return coordinator_.stored_transactions() + log_.size();
}

uint64_t engine::stored_transactions() const {
  auto lock = std::scoped_lock{mutex_};
  return coordinator_.stored_transactions();
}

uint64_t engine::log_size() const {
  auto lock = std::scoped_lock{mutex_};
  return log_.size();
}

std::optional<transaction_t> engine::get_transaction(
    const transaction_index_t index) const {
  auto lock = std::unique_lock{mutex_};
  auto stored = coordinator_.stored_transactions();
  if (index >= stored) {
    return log_.at(index - stored);
  }
  auto target = coordinator_.target();
  lock.unlock();
  if (!target) {
    return std::nullopt;
  }
  return target->get_transaction(index);
}

get_transactions_response_t engine::get_transactions(
    const get_transactions_request_t& request) const {
  auto lock = std::scoped_lock{mutex_};
  return resolve_range(log_, coordinator_.stored_transactions(), request.start,
                       request.length,
                       config_.archive.max_archive_query_length);
}

std::vector<transaction_t> engine::fetch_archived(
    const archived_range_t& range) const {
  auto lock = std::unique_lock{mutex_};
  auto stored = coordinator_.stored_transactions();
  auto target = coordinator_.target();
  lock.unlock();
  if (!target || range.start >= stored) {
    return {};
  }
  auto length = std::min(range.length, stored - range.start);
  return target->get_transactions(range.start, length);
}

const account_t& engine::minting_account() const {
  return config_.minting_account;
}

amount_t engine::transfer_fee() const {
  return config_.transfer_fee;
}

tally::archive::archive_status engine::archive_status() const {
  auto lock = std::scoped_lock{mutex_};
  return coordinator_.status();
}

transfer_result_t engine::transfer(const transfer_args_t& args,
                                   const principal_t& caller) {
  return submit(transaction_request{
      .from = account_t{.owner = caller, .subaccount = args.from_subaccount},
      .to = args.to,
      .amount = args.amount,
      .fee = args.fee,
      .memo = args.memo,
      .created_at_time = args.created_at_time});
}

transfer_result_t engine::mint(const mint_args_t& args,
                               const principal_t& caller) {
  if (caller != config_.minting_account.owner) {
    spdlog::debug("Rejected mint from non-minting caller");
    return unauthorized_t{.message = "only the minting account can mint"};
  }
  return submit(transaction_request{.from = config_.minting_account,
                                    .to = args.to,
                                    .amount = args.amount,
                                    .fee = std::nullopt,
                                    .memo = args.memo,
                                    .created_at_time = args.created_at_time});
}

transfer_result_t engine::burn(const burn_args_t& args,
                               const principal_t& caller) {
  return submit(transaction_request{
      .from = account_t{.owner = caller, .subaccount = args.from_subaccount},
      .to = config_.minting_account,
      .amount = args.amount,
      .fee = std::nullopt,
      .memo = args.memo,
      .created_at_time = args.created_at_time});
}

bool engine::flush_archive() {
  auto lock = std::unique_lock{mutex_};
  return migrate(lock, true);
}

transfer_result_t engine::submit(const transaction_request& request) {
  auto lock = std::unique_lock{mutex_};
  auto now = clock_();
  auto horizon = config_.transaction_window + config_.permitted_drift;
  recent_.prune(now > horizon ? now - horizon : 0);

  auto validated = validate(
      request, validation_context{.config = config_,
                                  .balances = balances_,
                                  .recent = recent_,
                                  .now = now});
  if (auto* error = std::get_if<transfer_error_t>(&validated)) {
    spdlog::debug("Rejected request: {}", describe(*error));
    return *error;
  }

  auto index = commit(std::get<validated_request>(validated), now);
  migrate(lock, false);
  return index;
}

transaction_index_t engine::commit(const validated_request& request,
                                   const timestamp_nanoseconds_t now) {
  auto tx = transaction_t{};
  tx.kind = request.kind;
  tx.amount = request.amount;
  tx.memo = request.memo;
  tx.created_at_time = request.created_at_time;
  tx.timestamp = now;

  switch (request.kind) {
    case transaction_kind_t::mint:
      balances_.mint(request.to_key, request.amount);
      tx.to = request.to;
      break;
    case transaction_kind_t::burn:
      if (!balances_.burn(request.from_key, request.amount)) {
        tally::common::critical("validated burn exceeds balance");
      }
      tx.from = request.from;
      break;
    case transaction_kind_t::transfer:
      if (!balances_.transfer(request.from_key, request.to_key, request.amount,
                              request.fee)) {
        tally::common::critical("validated transfer exceeds balance");
      }
      tx.from = request.from;
      tx.to = request.to;
      tx.fee = request.fee;
      break;
  }

  auto index = log_.append(std::move(tx), coordinator_.stored_transactions());
  if (request.created_at_time) {
    recent_.insert(make_deduplication_key(request), index,
                   *request.created_at_time);
  }
  spdlog::debug("Committed {} #{} amount {}", to_string(request.kind), index,
                to_string(request.amount));
  return index;
}

bool engine::migrate(std::unique_lock<std::mutex>& lock, const bool force) {
  auto ticket = coordinator_.prepare(log_, force);
  if (!ticket) {
    return false;
  }

  lock.unlock();
  auto error = std::string{};
  auto succeeded = false;
  try {
    succeeded = ticket->target->append(ticket->batch, error);
  } catch (const std::exception& ex) {
    error = ex.what();
  } catch (...) {
    error = "archive append threw a non-standard exception";
  }
  auto archive_stored = std::optional<uint64_t>{};
  if (!succeeded) {
    archive_stored = reported_stored_transactions(*ticket->target);
  }
  lock.lock();

  coordinator_.complete(*ticket, succeeded, error, log_, archive_stored);
  return succeeded;
}

void engine::apply_genesis() {
  auto total = amount_t{0};
  for (const auto& [account, amount] : config_.genesis_balances) {
    if (!is_valid_account(account)) {
      tally::common::critical("genesis balance names a malformed account");
    }
    if (same_account(account, config_.minting_account)) {
      tally::common::critical("genesis balance cannot credit the minting account");
    }
    if (amount > config_.max_supply - total) {
      tally::common::critical("genesis balances exceed the maximum supply");
    }
    total += amount;
    balances_.mint(encode_account(account), amount);
  }
}

}  // namespace tally::execution
