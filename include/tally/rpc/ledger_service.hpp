#pragma once

#include <grpcpp/grpcpp.h>
#include <tally/execution/engine.hpp>
#include <tally/v1/ledger.grpc.pb.h>

namespace tally::rpc {

/// Ledger read and write API over gRPC callback handlers.
///
/// Write calls run to completion on the handler thread, including any archive
/// migration they trigger. Their caller is the principal of the verified client
/// certificate; without one they fail with UNAUTHENTICATED.
struct ledger_service final : public tally::v1::Ledger::CallbackService {
  explicit ledger_service(tally::execution::engine& engine);

  /// Debit the caller's account; validation failures travel in the response,
  /// malformed amounts fail the call with INVALID_ARGUMENT.
  virtual grpc::ServerUnaryReactor* Transfer(
      grpc::CallbackServerContext* context,
      const tally::v1::TransferRequest* request,
      tally::v1::TransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Mint(
      grpc::CallbackServerContext* context,
      const tally::v1::MintRequest* request,
      tally::v1::TransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Burn(
      grpc::CallbackServerContext* context,
      const tally::v1::BurnRequest* request,
      tally::v1::TransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* BalanceOf(
      grpc::CallbackServerContext* context,
      const tally::v1::Account* request,
      tally::v1::BalanceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Supply(
      grpc::CallbackServerContext* context,
      const tally::v1::SupplyRequest* request,
      tally::v1::SupplyResponse* response) override final;

  /// NOT_FOUND when the index was never assigned or the archive is
  /// unreachable.
  virtual grpc::ServerUnaryReactor* GetTransaction(
      grpc::CallbackServerContext* context,
      const tally::v1::GetTransactionRequest* request,
      tally::v1::GetTransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransactions(
      grpc::CallbackServerContext* context,
      const tally::v1::GetTransactionsRequest* request,
      tally::v1::GetTransactionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LedgerInfo(
      grpc::CallbackServerContext* context,
      const tally::v1::LedgerInfoRequest* request,
      tally::v1::LedgerInfoResponse* response) override final;

  /// Operator hook; migrates the live log regardless of its size.
  virtual grpc::ServerUnaryReactor* FlushArchive(
      grpc::CallbackServerContext* context,
      const tally::v1::FlushArchiveRequest* request,
      tally::v1::FlushArchiveResponse* response) override final;

 private:
  tally::execution::engine& engine_;
};

}  // namespace tally::rpc
