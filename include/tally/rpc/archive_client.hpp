#pragma once

#include <grpcpp/grpcpp.h>
#include <tally/archive/endpoint.hpp>
#include <tally/v1/ledger.grpc.pb.h>
#include <chrono>
#include <memory>
#include <string>

namespace tally::rpc {

inline constexpr auto kDefaultArchiveDeadline = std::chrono::milliseconds{5000};

/// Archive endpoint living in another process, reached over gRPC.
///
/// Every call carries a deadline; a timed out or failed `append` is reported
/// as a failed attempt and the ledger retries it later.
class archive_client final : public tally::archive::endpoint {
 public:
  archive_client(std::shared_ptr<grpc::Channel> channel,
                 std::chrono::milliseconds deadline = kDefaultArchiveDeadline);

  bool append(const std::vector<tally::schema::transaction_t>& batch,
              std::string& error) override;
  std::optional<tally::schema::transaction_t> get_transaction(
      tally::schema::transaction_index_t index) override;
  std::vector<tally::schema::transaction_t> get_transactions(
      tally::schema::transaction_index_t start,
      uint64_t length) override;
  std::optional<tally::schema::archive_usage_t> usage() override;

 private:
  void set_deadline(grpc::ClientContext& context) const;

  std::unique_ptr<tally::v1::Archive::Stub> stub_;
  std::chrono::milliseconds deadline_;
};

/// Provisioner that connects to an archive node at `target` (host:port). The
/// connection is established lazily by gRPC.
tally::archive::provisioner_t make_remote_provisioner(
    std::string target,
    std::shared_ptr<grpc::ChannelCredentials> credentials,
    std::chrono::milliseconds deadline = kDefaultArchiveDeadline);

}  // namespace tally::rpc
