#include <tally/schema/encoding/scale/transaction.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

namespace {

std::optional<account_record_t> to_record(
    const std::optional<account_t>& account) {
  if (!account) {
    return std::nullopt;
  }
  return to_record(*account);
}

std::optional<account_t> from_record(
    const std::optional<account_record_t>& record) {
  if (!record) {
    return std::nullopt;
  }
  return from_record(*record);
}

}  // namespace

account_record_t to_record(const account_t& account) {
  return account_record_t{account.owner, account.subaccount};
}

account_t from_record(const account_record_t& record) {
  return account_t{.owner = std::get<0>(record),
                   .subaccount = std::get<1>(record)};
}

transaction_record_t to_record(const transaction_t& tx) {
  auto fee = std::optional<hash32_t>{};
  if (tx.fee) {
    fee = to_big_endian(*tx.fee);
  }
  return transaction_record_t{tx.version,
                              tx.index,
                              static_cast<uint8_t>(tx.kind),
                              to_record(tx.from),
                              to_record(tx.to),
                              to_big_endian(tx.amount),
                              fee,
                              tx.memo,
                              tx.created_at_time,
                              tx.timestamp};
}

std::optional<transaction_t> from_record(const transaction_record_t& record) {
  if (std::get<0>(record) != 1) {
    return std::nullopt;
  }
  auto kind = try_make_transaction_kind(std::get<2>(record));
  if (!kind) {
    return std::nullopt;
  }
  auto tx = transaction_t{};
  tx.index = std::get<1>(record);
  tx.kind = *kind;
  tx.from = from_record(std::get<3>(record));
  tx.to = from_record(std::get<4>(record));
  tx.amount = from_big_endian(std::get<5>(record));
  if (const auto& fee = std::get<6>(record)) {
    tx.fee = from_big_endian(*fee);
  }
  tx.memo = std::get<7>(record);
  tx.created_at_time = std::get<8>(record);
  tx.timestamp = std::get<9>(record);
  return tx;
}

}  // namespace tally::schema::encoding::scale
