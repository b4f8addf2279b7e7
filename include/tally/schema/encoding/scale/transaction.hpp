#pragma once
#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <cstdint>
#include <optional>
#include <tuple>

namespace tally::schema::encoding::scale {

/// Owner and optional subaccount.
using account_record_t =
    std::tuple<tally::schema::bytes_t, std::optional<tally::schema::bytes_t>>;

/// SCALE layout of an archived transaction. Field order follows
/// `transaction<1>`; amounts are stored as 32 byte big-endian words.
using transaction_record_t =
    std::tuple<uint16_t,
               uint64_t,
               uint8_t,
               std::optional<account_record_t>,
               std::optional<account_record_t>,
               tally::schema::hash32_t,
               std::optional<tally::schema::hash32_t>,
               std::optional<tally::schema::bytes_t>,
               std::optional<uint64_t>,
               uint64_t>;

account_record_t to_record(const tally::schema::account_t& account);
tally::schema::account_t from_record(const account_record_t& record);

transaction_record_t to_record(const tally::schema::transaction_t& tx);

/// std::nullopt when the record names an unknown version or kind.
std::optional<tally::schema::transaction_t> from_record(
    const transaction_record_t& record);

}  // namespace tally::schema::encoding::scale
