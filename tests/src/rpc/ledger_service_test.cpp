#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include <tally/rpc/convert.hpp>
#include <tally/rpc/ledger_service.hpp>
#include <tally/testing/engine_fixture.hpp>

#include <memory>

using tally::testing::engine_fixture;
using tally::testing::make_account;

namespace {

/// Ledger service on an in-process plaintext channel: no peer certificate.
class ledger_service_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
    ASSERT_TRUE(server != nullptr);
    stub = tally::v1::Ledger::NewStub(
        server->InProcessChannel(grpc::ChannelArguments{}));
  }

  void TearDown() override {
    if (server) {
      server->Shutdown();
    }
  }

  engine_fixture fixture;
  tally::rpc::ledger_service service{fixture.engine()};
  std::unique_ptr<grpc::Server> server;
  std::unique_ptr<tally::v1::Ledger::Stub> stub;
};

}  // namespace

TEST_F(ledger_service_test, writes_without_client_certificate_are_refused) {
  auto mint = tally::v1::MintRequest{};
  tally::rpc::to_proto(make_account(3), mint.mutable_to());
  mint.set_amount("500");
  auto response = tally::v1::TransferResponse{};
  auto context = grpc::ClientContext{};
  auto status = stub->Mint(&context, mint, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);

  auto transfer = tally::v1::TransferRequest{};
  tally::rpc::to_proto(make_account(3), transfer.mutable_to());
  transfer.set_amount("100");
  auto transfer_context = grpc::ClientContext{};
  status = stub->Transfer(&transfer_context, transfer, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);

  auto burn = tally::v1::BurnRequest{};
  burn.set_amount("100");
  auto burn_context = grpc::ClientContext{};
  status = stub->Burn(&burn_context, burn, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);

  EXPECT_EQ(fixture.engine().total_transactions(), 0u);
  EXPECT_EQ(fixture.engine().balance_of(make_account(2)), 1000);
  EXPECT_EQ(fixture.engine().balance_of(make_account(3)), 0);
}

TEST_F(ledger_service_test, reads_need_no_client_certificate) {
  auto account = tally::v1::Account{};
  tally::rpc::to_proto(make_account(2), &account);
  auto balance = tally::v1::BalanceResponse{};
  auto context = grpc::ClientContext{};
  ASSERT_TRUE(stub->BalanceOf(&context, account, &balance).ok());
  EXPECT_EQ(balance.amount(), "1000");
}
