#include <algorithm>
#include <string>
#include <tuple>
#include <variant>
#include <tally/rpc/convert.hpp>

using namespace tally::schema;

namespace tally::rpc {

namespace {

std::optional<bytes_t> optional_bytes(const bool present,
                                      const std::string& value) {
  if (!present) {
    return std::nullopt;
  }
  return make_bytes(value);
}

tally::v1::TransactionKind to_proto(const transaction_kind_t kind) {
  switch (kind) {
    case transaction_kind_t::mint:
      return tally::v1::TRANSACTION_KIND_MINT;
    case transaction_kind_t::burn:
      return tally::v1::TRANSACTION_KIND_BURN;
    case transaction_kind_t::transfer:
      return tally::v1::TRANSACTION_KIND_TRANSFER;
  }
  return tally::v1::TRANSACTION_KIND_TRANSFER;
}

std::optional<transaction_kind_t> from_proto(
    const tally::v1::TransactionKind kind) {
  switch (kind) {
    case tally::v1::TRANSACTION_KIND_MINT:
      return transaction_kind_t::mint;
    case tally::v1::TRANSACTION_KIND_BURN:
      return transaction_kind_t::burn;
    case tally::v1::TRANSACTION_KIND_TRANSFER:
      return transaction_kind_t::transfer;
    default:
      return std::nullopt;
  }
}

}  // namespace

void to_proto(const account_t& account, tally::v1::Account* out) {
  out->set_owner(make_string(account.owner));
  if (account.subaccount) {
    out->set_subaccount(make_string(*account.subaccount));
  }
}

account_t from_proto(const tally::v1::Account& account) {
  return account_t{
      .owner = make_bytes(account.owner()),
      .subaccount =
          optional_bytes(account.has_subaccount(), account.subaccount())};
}

void to_proto(const transaction_t& tx, tally::v1::Transaction* out) {
  out->set_index(tx.index);
  out->set_kind(to_proto(tx.kind));
  if (tx.from) {
    to_proto(*tx.from, out->mutable_from());
  }
  if (tx.to) {
    to_proto(*tx.to, out->mutable_to());
  }
  out->set_amount(to_string(tx.amount));
  if (tx.fee) {
    out->set_fee(to_string(*tx.fee));
  }
  if (tx.memo) {
    out->set_memo(make_string(*tx.memo));
  }
  if (tx.created_at_time) {
    out->set_created_at_time(*tx.created_at_time);
  }
  out->set_timestamp(tx.timestamp);
}

std::optional<transaction_t> from_proto(const tally::v1::Transaction& tx) {
  auto kind = from_proto(tx.kind());
  auto amount = try_make_amount(tx.amount());
  if (!kind || !amount) {
    return std::nullopt;
  }
  auto out = transaction_t{};
  out.index = tx.index();
  out.kind = *kind;
  if (tx.has_from()) {
    out.from = from_proto(tx.from());
  }
  if (tx.has_to()) {
    out.to = from_proto(tx.to());
  }
  out.amount = *amount;
  if (tx.has_fee()) {
    out.fee = try_make_amount(tx.fee());
    if (!out.fee) {
      return std::nullopt;
    }
  }
  out.memo = optional_bytes(tx.has_memo(), tx.memo());
  if (tx.has_created_at_time()) {
    out.created_at_time = tx.created_at_time();
  }
  out.timestamp = tx.timestamp();
  return out;
}

void to_proto(const transfer_error_t& error, tally::v1::TransferError* out) {
  out->set_code(static_cast<uint32_t>(error_code(error)));
  out->set_message(describe(error));
  std::visit(
      overloaded{
          [out](const bad_fee_t& arg) {
            out->set_expected_fee(to_string(arg.expected_fee));
          },
          [out](const bad_burn_t& arg) {
            out->set_min_burn_amount(to_string(arg.min_burn_amount));
          },
          [out](const insufficient_funds_t& arg) {
            out->set_balance(to_string(arg.balance));
          },
          [](const too_old_t&) {},
          [out](const created_in_future_t& arg) {
            out->set_ledger_time(arg.ledger_time);
          },
          [out](const duplicate_t& arg) {
            out->set_duplicate_of(arg.duplicate_of);
          },
          [](const unauthorized_t&) {},
          [out](const generic_error_t& arg) {
            out->set_generic_error_code(arg.error_code);
          }},
      error);
}

void to_proto(const transfer_result_t& result,
              tally::v1::TransferResponse* out) {
  std::visit(overloaded{[out](const transaction_index_t index) {
                          out->set_index(index);
                        },
                        [out](const transfer_error_t& error) {
                          to_proto(error, out->mutable_error());
                        }},
             result);
}

std::optional<transfer_args_t> from_proto(
    const tally::v1::TransferRequest& request) {
  auto amount = try_make_amount(request.amount());
  if (!amount) {
    return std::nullopt;
  }
  auto args = transfer_args_t{};
  args.from_subaccount = optional_bytes(request.has_from_subaccount(),
                                        request.from_subaccount());
  args.to = from_proto(request.to());
  args.amount = *amount;
  if (request.has_fee()) {
    args.fee = try_make_amount(request.fee());
    if (!args.fee) {
      return std::nullopt;
    }
  }
  args.memo = optional_bytes(request.has_memo(), request.memo());
  if (request.has_created_at_time()) {
    args.created_at_time = request.created_at_time();
  }
  return args;
}

std::optional<mint_args_t> from_proto(const tally::v1::MintRequest& request) {
  auto amount = try_make_amount(request.amount());
  if (!amount) {
    return std::nullopt;
  }
  auto args = mint_args_t{};
  args.to = from_proto(request.to());
  args.amount = *amount;
  args.memo = optional_bytes(request.has_memo(), request.memo());
  if (request.has_created_at_time()) {
    args.created_at_time = request.created_at_time();
  }
  return args;
}

std::optional<burn_args_t> from_proto(const tally::v1::BurnRequest& request) {
  auto amount = try_make_amount(request.amount());
  if (!amount) {
    return std::nullopt;
  }
  auto args = burn_args_t{};
  args.from_subaccount = optional_bytes(request.has_from_subaccount(),
                                        request.from_subaccount());
  args.amount = *amount;
  args.memo = optional_bytes(request.has_memo(), request.memo());
  if (request.has_created_at_time()) {
    args.created_at_time = request.created_at_time();
  }
  return args;
}

void to_proto(const get_transactions_response_t& response,
              tally::v1::GetTransactionsResponse* out) {
  out->set_length(response.length);
  out->set_first_index(response.first_index);
  for (const auto& tx : response.transactions) {
    to_proto(tx, out->add_transactions());
  }
  for (const auto& range : response.archived_transactions) {
    auto* archived = out->add_archived_transactions();
    archived->set_start(range.start);
    archived->set_length(range.length);
  }
}

void to_proto(const tally::archive::archive_status& status,
              tally::v1::ArchiveStatus* out) {
  out->set_bound(status.bound);
  out->set_migrating(status.phase ==
                     tally::archive::migration_phase_t::migrating);
  out->set_stored_transactions(status.stored_transactions);
  out->set_consecutive_failures(status.consecutive_failures);
  out->set_failed_attempts(status.failed_attempts);
  out->set_migrations(status.migrations);
  out->set_resource_budget(status.resource_budget);
}

void to_proto(const archive_usage_t& usage, tally::v1::UsageResponse* out) {
  out->set_stored_transactions(usage.stored_transactions);
  out->set_used_bytes(usage.used_bytes);
  out->set_max_bytes(usage.max_bytes);
  out->set_remaining_capacity(usage.remaining_capacity);
  out->set_tip_hash(std::string{usage.tip_hash.begin(), usage.tip_hash.end()});
}

std::optional<archive_usage_t> from_proto(
    const tally::v1::UsageResponse& usage) {
  if (usage.tip_hash().size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto out = archive_usage_t{};
  out.stored_transactions = usage.stored_transactions();
  out.used_bytes = usage.used_bytes();
  out.max_bytes = usage.max_bytes();
  out.remaining_capacity = usage.remaining_capacity();
  std::copy_n(usage.tip_hash().begin(), out.tip_hash.size(),
              out.tip_hash.begin());
  return out;
}

}  // namespace tally::rpc
