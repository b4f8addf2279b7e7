#include <spdlog/spdlog.h>
#include <tally/rpc/convert.hpp>
#include <tally/rpc/ledger_service.hpp>
#include <tally/rpc/principal.hpp>
#include <optional>

using namespace tally::rpc;
using namespace tally::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_invalid_amount(
    grpc::CallbackServerContext* context) {
  return finish(context,
                grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                             "amount is not an unsigned 256 bit decimal"});
}

grpc::ServerUnaryReactor* finish_unauthenticated(
    grpc::CallbackServerContext* context) {
  return finish(context,
                grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                             "write calls need a verified client certificate"});
}

std::optional<principal_t> caller_of(grpc::CallbackServerContext* context) {
  auto auth = context->auth_context();
  if (!auth) {
    return std::nullopt;
  }
  return authenticated_principal(*auth);
}

}  // namespace

ledger_service::ledger_service(tally::execution::engine& engine)
    : engine_{engine} {}

grpc::ServerUnaryReactor* ledger_service::Transfer(
    grpc::CallbackServerContext* context,
    const tally::v1::TransferRequest* request,
    tally::v1::TransferResponse* response) {
  auto args = from_proto(*request);
  if (!args) {
    return finish_invalid_amount(context);
  }
  auto caller = caller_of(context);
  if (!caller) {
    return finish_unauthenticated(context);
  }
  to_proto(engine_.transfer(*args, *caller), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::Mint(
    grpc::CallbackServerContext* context,
    const tally::v1::MintRequest* request,
    tally::v1::TransferResponse* response) {
  auto args = from_proto(*request);
  if (!args) {
    return finish_invalid_amount(context);
  }
  auto caller = caller_of(context);
  if (!caller) {
    return finish_unauthenticated(context);
  }
  to_proto(engine_.mint(*args, *caller), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::Burn(
    grpc::CallbackServerContext* context,
    const tally::v1::BurnRequest* request,
    tally::v1::TransferResponse* response) {
  auto args = from_proto(*request);
  if (!args) {
    return finish_invalid_amount(context);
  }
  auto caller = caller_of(context);
  if (!caller) {
    return finish_unauthenticated(context);
  }
  to_proto(engine_.burn(*args, *caller), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::BalanceOf(
    grpc::CallbackServerContext* context,
    const tally::v1::Account* request,
    tally::v1::BalanceResponse* response) {
  response->set_amount(to_string(engine_.balance_of(from_proto(*request))));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::Supply(
    grpc::CallbackServerContext* context,
    const tally::v1::SupplyRequest* /*request*/,
    tally::v1::SupplyResponse* response) {
  response->set_total_supply(to_string(engine_.total_supply()));
  response->set_total_minted(to_string(engine_.total_minted()));
  response->set_total_burned(to_string(engine_.total_burned()));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::GetTransaction(
    grpc::CallbackServerContext* context,
    const tally::v1::GetTransactionRequest* request,
    tally::v1::GetTransactionResponse* response) {
  auto tx = engine_.get_transaction(request->index());
  if (!tx) {
    return finish(context, grpc::Status{grpc::StatusCode::NOT_FOUND,
                                        "no transaction at that index"});
  }
  to_proto(*tx, response->mutable_transaction());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::GetTransactions(
    grpc::CallbackServerContext* context,
    const tally::v1::GetTransactionsRequest* request,
    tally::v1::GetTransactionsResponse* response) {
  auto range = engine_.get_transactions(get_transactions_request_t{
      .start = request->start(), .length = request->length()});
  to_proto(range, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::LedgerInfo(
    grpc::CallbackServerContext* context,
    const tally::v1::LedgerInfoRequest* /*request*/,
    tally::v1::LedgerInfoResponse* response) {
  to_proto(engine_.minting_account(), response->mutable_minting_account());
  response->set_transfer_fee(to_string(engine_.transfer_fee()));
  response->set_total_transactions(engine_.total_transactions());
  response->set_stored_transactions(engine_.stored_transactions());
  response->set_log_size(engine_.log_size());
  to_proto(engine_.archive_status(), response->mutable_archive());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* ledger_service::FlushArchive(
    grpc::CallbackServerContext* context,
    const tally::v1::FlushArchiveRequest* /*request*/,
    tally::v1::FlushArchiveResponse* response) {
  spdlog::info("Archive flush requested over RPC");
  response->set_migrated(engine_.flush_archive());
  return finish_ok(context);
}
