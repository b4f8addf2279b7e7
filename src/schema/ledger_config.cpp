#include <tally/schema/ledger_config.hpp>

namespace tally::schema {

std::optional<genesis_balance_t> try_parse_genesis_balance(
    const std::string_view text) {
  auto separator = text.find('=');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto account = try_parse_account(text.substr(0, separator));
  auto amount = try_make_amount(text.substr(separator + 1));
  if (!account || !amount) {
    return std::nullopt;
  }
  return genesis_balance_t{std::move(*account), *amount};
}

}  // namespace tally::schema
