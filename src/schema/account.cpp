#include <tally/common/critical.hpp>
#include <tally/schema/account.hpp>

#include <algorithm>
#include <iterator>

namespace tally::schema {

bool is_valid_account(const account_t& account) {
  if (account.owner.empty() || account.owner.size() > kMaxOwnerSize) {
    return false;
  }
  if (account.subaccount.has_value() &&
      account.subaccount->size() != kSubaccountSize) {
    return false;
  }
  return true;
}

bool is_default_subaccount(const std::optional<bytes_t>& subaccount) {
  if (!subaccount.has_value()) {
    return true;
  }
  return std::all_of(std::begin(*subaccount), std::end(*subaccount),
                     [](const uint8_t byte) { return byte == 0; });
}

account_key_t encode_account(const account_t& account) {
  if (!is_valid_account(account)) {
    tally::common::critical("cannot encode malformed account");
  }
  auto key = account_key_t{};
  key.reserve(1 + account.owner.size() + kSubaccountSize);
  key.push_back(static_cast<uint8_t>(account.owner.size()));
  key.insert(std::end(key), std::begin(account.owner),
             std::end(account.owner));
  if (!is_default_subaccount(account.subaccount)) {
    key.insert(std::end(key), std::begin(*account.subaccount),
               std::end(*account.subaccount));
  }
  return key;
}

std::optional<account_t> try_decode_account(const bytes_view_t& key) {
  if (key.empty()) {
    return std::nullopt;
  }
  auto owner_size = static_cast<std::size_t>(key[0]);
  if (owner_size == 0 || owner_size > kMaxOwnerSize ||
      key.size() < 1 + owner_size) {
    return std::nullopt;
  }
  auto account = account_t{};
  account.owner = make_bytes(key.subspan(1, owner_size));
  auto rest = key.subspan(1 + owner_size);
  if (rest.empty()) {
    return account;
  }
  if (rest.size() != kSubaccountSize) {
    return std::nullopt;
  }
  account.subaccount = make_bytes(rest);
  if (is_default_subaccount(account.subaccount)) {
    // Default subaccounts are never written into a canonical key.
    return std::nullopt;
  }
  return account;
}

bool same_account(const account_t& lhs, const account_t& rhs) {
  if (!is_valid_account(lhs) || !is_valid_account(rhs)) {
    return false;
  }
  return encode_account(lhs) == encode_account(rhs);
}

std::optional<account_t> try_parse_account(const std::string_view text) {
  auto separator = text.find('.');
  auto account = account_t{};
  auto owner = try_from_hex(text.substr(0, separator));
  if (!owner) {
    return std::nullopt;
  }
  account.owner = std::move(*owner);
  if (separator != std::string_view::npos) {
    auto subaccount = try_from_hex(text.substr(separator + 1));
    if (!subaccount) {
      return std::nullopt;
    }
    account.subaccount = std::move(*subaccount);
  }
  if (!is_valid_account(account)) {
    return std::nullopt;
  }
  return account;
}

std::string to_string(const account_t& account) {
  auto out = to_hex(make_bytes_view(account.owner));
  if (!is_default_subaccount(account.subaccount)) {
    out.push_back('.');
    out.append(to_hex(make_bytes_view(*account.subaccount)));
  }
  return out;
}

}  // namespace tally::schema
