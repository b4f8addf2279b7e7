#include <tally/schema/transfer_error.hpp>

#include <fmt/format.h>

namespace tally::schema {

transfer_error_code error_code(const transfer_error_t& error) {
  return std::visit(
      overloaded{
          [](const bad_fee_t&) { return transfer_error_code::bad_fee; },
          [](const bad_burn_t&) { return transfer_error_code::bad_burn; },
          [](const insufficient_funds_t&) {
            return transfer_error_code::insufficient_funds;
          },
          [](const too_old_t&) { return transfer_error_code::too_old; },
          [](const created_in_future_t&) {
            return transfer_error_code::created_in_future;
          },
          [](const duplicate_t&) { return transfer_error_code::duplicate; },
          [](const unauthorized_t&) {
            return transfer_error_code::unauthorized;
          },
          [](const generic_error_t&) {
            return transfer_error_code::generic_error;
          }},
      error);
}

std::string describe(const transfer_error_t& error) {
  return std::visit(
      overloaded{
          [](const bad_fee_t& value) {
            return fmt::format("bad fee, expected {}",
                               to_string(value.expected_fee));
          },
          [](const bad_burn_t& value) {
            return fmt::format("burn below minimum of {}",
                               to_string(value.min_burn_amount));
          },
          [](const insufficient_funds_t& value) {
            return fmt::format("insufficient funds, balance {}",
                               to_string(value.balance));
          },
          [](const too_old_t&) {
            return std::string{"created_at_time is too old"};
          },
          [](const created_in_future_t& value) {
            return fmt::format("created_at_time is ahead of ledger time {}",
                               value.ledger_time);
          },
          [](const duplicate_t& value) {
            return fmt::format("duplicate of transaction {}",
                               value.duplicate_of);
          },
          [](const unauthorized_t& value) {
            return fmt::format("unauthorized: {}", value.message);
          },
          [](const generic_error_t& value) {
            return fmt::format("error {}: {}", value.error_code,
                               value.message);
          }},
      error);
}

generic_error_t make_generic_error(const generic_error_code code,
                                   std::string message) {
  return generic_error_t{.error_code = static_cast<uint64_t>(code),
                         .message = std::move(message)};
}

}  // namespace tally::schema
