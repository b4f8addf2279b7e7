#pragma once

#include <grpcpp/grpcpp.h>
#include <tally/archive/endpoint.hpp>
#include <tally/v1/ledger.grpc.pb.h>
#include <memory>

namespace tally::rpc {

/// Serves an archive endpoint (normally a RocksDB node) to remote ledgers.
struct archive_service final : public tally::v1::Archive::CallbackService {
  explicit archive_service(std::shared_ptr<tally::archive::endpoint> archive);

  /// A rejected batch is reported in the response, not as a call failure.
  virtual grpc::ServerUnaryReactor* Append(
      grpc::CallbackServerContext* context,
      const tally::v1::AppendRequest* request,
      tally::v1::AppendResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransaction(
      grpc::CallbackServerContext* context,
      const tally::v1::GetTransactionRequest* request,
      tally::v1::GetTransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransactions(
      grpc::CallbackServerContext* context,
      const tally::v1::GetTransactionsRequest* request,
      tally::v1::ArchivedTransactionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Usage(
      grpc::CallbackServerContext* context,
      const tally::v1::UsageRequest* request,
      tally::v1::UsageResponse* response) override final;

 private:
  std::shared_ptr<tally::archive::endpoint> archive_;
};

}  // namespace tally::rpc
