#pragma once

#include <tally/archive/coordinator.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/archive_usage.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_range.hpp>
#include <tally/schema/transfer_args.hpp>
#include <tally/schema/transfer_error.hpp>
#include <tally/v1/ledger.pb.h>
#include <optional>

// Conversions between wire messages and ledger schema types. Decoding
// returns std::nullopt when an amount is not a valid 256 bit decimal or a
// transaction names an unknown kind; account shape is left to the ledger.
namespace tally::rpc {

void to_proto(const tally::schema::account_t& account,
              tally::v1::Account* out);
tally::schema::account_t from_proto(const tally::v1::Account& account);

void to_proto(const tally::schema::transaction_t& tx,
              tally::v1::Transaction* out);
std::optional<tally::schema::transaction_t> from_proto(
    const tally::v1::Transaction& tx);

void to_proto(const tally::schema::transfer_error_t& error,
              tally::v1::TransferError* out);
void to_proto(const tally::schema::transfer_result_t& result,
              tally::v1::TransferResponse* out);

std::optional<tally::schema::transfer_args_t> from_proto(
    const tally::v1::TransferRequest& request);
std::optional<tally::schema::mint_args_t> from_proto(
    const tally::v1::MintRequest& request);
std::optional<tally::schema::burn_args_t> from_proto(
    const tally::v1::BurnRequest& request);

void to_proto(const tally::schema::get_transactions_response_t& response,
              tally::v1::GetTransactionsResponse* out);

void to_proto(const tally::archive::archive_status& status,
              tally::v1::ArchiveStatus* out);

void to_proto(const tally::schema::archive_usage_t& usage,
              tally::v1::UsageResponse* out);
std::optional<tally::schema::archive_usage_t> from_proto(
    const tally::v1::UsageResponse& usage);

}  // namespace tally::rpc
