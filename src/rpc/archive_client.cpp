#include <spdlog/spdlog.h>
#include <tally/rpc/archive_client.hpp>
#include <tally/rpc/convert.hpp>
#include <utility>

using namespace tally::schema;

namespace tally::rpc {

archive_client::archive_client(std::shared_ptr<grpc::Channel> channel,
                               std::chrono::milliseconds deadline)
    : stub_{tally::v1::Archive::NewStub(std::move(channel))},
      deadline_{deadline} {}

bool archive_client::append(const std::vector<transaction_t>& batch,
                            std::string& error) {
  auto request = tally::v1::AppendRequest{};
  for (const auto& tx : batch) {
    to_proto(tx, request.add_transactions());
  }
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto response = tally::v1::AppendResponse{};
  auto status = stub_->Append(&context, request, &response);
  if (!status.ok()) {
    error = status.error_message();
    return false;
  }
  if (!response.ok()) {
    error = response.error();
    return false;
  }
  return true;
}

std::optional<transaction_t> archive_client::get_transaction(
    const transaction_index_t index) {
  auto request = tally::v1::GetTransactionRequest{};
  request.set_index(index);
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto response = tally::v1::GetTransactionResponse{};
  auto status = stub_->GetTransaction(&context, request, &response);
  if (!status.ok()) {
    if (status.error_code() != grpc::StatusCode::NOT_FOUND) {
      spdlog::warn("Archive lookup of transaction {} failed: {}", index,
                   status.error_message());
    }
    return std::nullopt;
  }
  return from_proto(response.transaction());
}

std::vector<transaction_t> archive_client::get_transactions(
    const transaction_index_t start,
    const uint64_t length) {
  auto request = tally::v1::GetTransactionsRequest{};
  request.set_start(start);
  request.set_length(length);
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto response = tally::v1::ArchivedTransactionsResponse{};
  auto status = stub_->GetTransactions(&context, request, &response);
  if (!status.ok()) {
    spdlog::warn("Archive range fetch at {} failed: {}", start,
                 status.error_message());
    return {};
  }
  auto transactions = std::vector<transaction_t>{};
  transactions.reserve(response.transactions_size());
  for (const auto& message : response.transactions()) {
    auto tx = from_proto(message);
    if (!tx) {
      spdlog::warn("Archive returned undecodable transaction {}",
                   message.index());
      return {};
    }
    transactions.push_back(std::move(*tx));
  }
  return transactions;
}

std::optional<archive_usage_t> archive_client::usage() {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto response = tally::v1::UsageResponse{};
  auto status =
      stub_->Usage(&context, tally::v1::UsageRequest{}, &response);
  if (!status.ok()) {
    spdlog::warn("Archive usage query failed: {}", status.error_message());
    return std::nullopt;
  }
  return from_proto(response);
}

void archive_client::set_deadline(grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + deadline_);
}

tally::archive::provisioner_t make_remote_provisioner(
    std::string target,
    std::shared_ptr<grpc::ChannelCredentials> credentials,
    std::chrono::milliseconds deadline) {
  return [target = std::move(target), credentials = std::move(credentials),
          deadline]() -> std::shared_ptr<tally::archive::endpoint> {
    spdlog::info("Connecting to archive node at {}", target);
    auto channel = grpc::CreateChannel(target, credentials);
    if (!channel) {
      return nullptr;
    }
    return std::make_shared<archive_client>(std::move(channel), deadline);
  };
}

}  // namespace tally::rpc
