#include <tally/execution/validator.hpp>

#include <fmt/format.h>
#include <limits>

using namespace tally::schema;

namespace {

timestamp_nanoseconds_t saturating_sub(const timestamp_nanoseconds_t lhs,
                                       const duration_nanoseconds_t rhs) {
  return lhs > rhs ? lhs - rhs : 0;
}

timestamp_nanoseconds_t saturating_add(const timestamp_nanoseconds_t lhs,
                                       const duration_nanoseconds_t rhs) {
  auto sum = lhs + rhs;
  return sum < lhs ? std::numeric_limits<timestamp_nanoseconds_t>::max() : sum;
}

}  // namespace

namespace tally::execution {

transaction_kind_t classify(const account_t& from,
                            const account_t& to,
                            const account_t& minting_account) {
  if (same_account(from, minting_account)) {
    return transaction_kind_t::mint;
  }
  if (same_account(to, minting_account)) {
    return transaction_kind_t::burn;
  }
  return transaction_kind_t::transfer;
}

validation_result_t validate(const transaction_request& request,
                             const validation_context& context) {
  const auto& config = context.config;

  if (!is_valid_account(request.from)) {
    return make_generic_error(generic_error_code::malformed_account,
                              "malformed source account");
  }
  if (!is_valid_account(request.to)) {
    return make_generic_error(generic_error_code::malformed_account,
                              "malformed destination account");
  }
  if (request.memo && request.memo->size() > config.max_memo_size) {
    return make_generic_error(
        generic_error_code::memo_too_large,
        fmt::format("memo of {} bytes exceeds the {} byte limit",
                    request.memo->size(), config.max_memo_size));
  }

  auto validated = validated_request{};
  validated.kind = classify(request.from, request.to, config.minting_account);
  validated.from = request.from;
  validated.to = request.to;
  validated.from_key = encode_account(request.from);
  validated.to_key = encode_account(request.to);
  validated.amount = request.amount;
  validated.supplied_fee = request.fee;
  validated.memo = request.memo;
  validated.created_at_time = request.created_at_time;

  if (validated.kind == transaction_kind_t::mint &&
      validated.from_key == validated.to_key) {
    return make_generic_error(generic_error_code::invalid_operation,
                              "minting account cannot transfer to itself");
  }

  switch (validated.kind) {
    case transaction_kind_t::transfer:
      if (request.fee && *request.fee != config.transfer_fee) {
        return bad_fee_t{.expected_fee = config.transfer_fee};
      }
      validated.fee = config.transfer_fee;
      break;
    case transaction_kind_t::mint:
    case transaction_kind_t::burn:
      if (request.fee && *request.fee != 0) {
        return bad_fee_t{.expected_fee = amount_t{0}};
      }
      validated.fee = 0;
      break;
  }

  if (validated.kind != transaction_kind_t::mint) {
    auto balance = context.balances.balance_of(validated.from_key);
    if (balance < validated.amount ||
        (balance - validated.amount) < validated.fee) {
      return insufficient_funds_t{.balance = balance};
    }
  }

  if (request.created_at_time) {
    auto oldest = saturating_sub(
        saturating_sub(context.now, config.transaction_window),
        config.permitted_drift);
    if (*request.created_at_time < oldest) {
      return too_old_t{};
    }
    if (*request.created_at_time >
        saturating_add(context.now, config.permitted_drift)) {
      return created_in_future_t{.ledger_time = context.now};
    }
  }

  if (validated.kind == transaction_kind_t::burn &&
      validated.amount < config.min_burn_amount) {
    return bad_burn_t{.min_burn_amount = config.min_burn_amount};
  }

  if (request.created_at_time) {
    if (auto duplicate_of =
            context.recent.find(make_deduplication_key(validated))) {
      return duplicate_t{.duplicate_of = *duplicate_of};
    }
  }

  if (validated.kind == transaction_kind_t::mint) {
    auto supply = context.balances.total_supply();
    if (supply > config.max_supply ||
        validated.amount > config.max_supply - supply) {
      return make_generic_error(generic_error_code::max_supply_exceeded,
                                "mint would exceed the maximum supply");
    }
  }

  return validated;
}

}  // namespace tally::execution
