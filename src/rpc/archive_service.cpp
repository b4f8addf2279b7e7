#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/rpc/archive_service.hpp>
#include <tally/rpc/convert.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace tally::rpc;
using namespace tally::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

}  // namespace

archive_service::archive_service(
    std::shared_ptr<tally::archive::endpoint> archive)
    : archive_{std::move(archive)} {
  if (!archive_) {
    tally::common::critical("archive service requires an endpoint");
  }
}

grpc::ServerUnaryReactor* archive_service::Append(
    grpc::CallbackServerContext* context,
    const tally::v1::AppendRequest* request,
    tally::v1::AppendResponse* response) {
  auto batch = std::vector<transaction_t>{};
  batch.reserve(request->transactions_size());
  for (const auto& message : request->transactions()) {
    auto tx = from_proto(message);
    if (!tx) {
      spdlog::warn("Rejecting archive batch with undecodable transaction {}",
                   message.index());
      response->set_ok(false);
      response->set_error("undecodable transaction in batch");
      return finish(context, grpc::Status::OK);
    }
    batch.push_back(std::move(*tx));
  }
  auto error = std::string{};
  response->set_ok(archive_->append(batch, error));
  response->set_error(error);
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* archive_service::GetTransaction(
    grpc::CallbackServerContext* context,
    const tally::v1::GetTransactionRequest* request,
    tally::v1::GetTransactionResponse* response) {
  auto tx = archive_->get_transaction(request->index());
  if (!tx) {
    return finish(context, grpc::Status{grpc::StatusCode::NOT_FOUND,
                                        "index is not archived"});
  }
  to_proto(*tx, response->mutable_transaction());
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* archive_service::GetTransactions(
    grpc::CallbackServerContext* context,
    const tally::v1::GetTransactionsRequest* request,
    tally::v1::ArchivedTransactionsResponse* response) {
  for (const auto& tx :
       archive_->get_transactions(request->start(), request->length())) {
    to_proto(tx, response->add_transactions());
  }
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* archive_service::Usage(
    grpc::CallbackServerContext* context,
    const tally::v1::UsageRequest* /*request*/,
    tally::v1::UsageResponse* response) {
  auto usage = archive_->usage();
  if (!usage) {
    return finish(context, grpc::Status{grpc::StatusCode::UNAVAILABLE,
                                        "archive usage unavailable"});
  }
  to_proto(*usage, response);
  return finish(context, grpc::Status::OK);
}
