#include <tally/common/critical.hpp>
#include <tally/execution/balance_store.hpp>

using namespace tally::schema;

namespace tally::execution {

amount_t balance_store::balance_of(const account_key_t& account) const {
  auto found = balances_.find(account);
  if (found == std::end(balances_)) {
    return amount_t{0};
  }
  return found->second;
}

void balance_store::mint(const account_key_t& to, const amount_t& amount) {
  credit(to, amount);
  minted_ += amount;
}

bool balance_store::burn(const account_key_t& from, const amount_t& amount) {
  if (balance_of(from) < amount) {
    return false;
  }
  debit(from, amount);
  burned_ += amount;
  return true;
}

bool balance_store::transfer(const account_key_t& from,
                             const account_key_t& to,
                             const amount_t& amount,
                             const amount_t& fee) {
  auto balance = balance_of(from);
  if (balance < amount || (balance - amount) < fee) {
    return false;
  }
  debit(from, amount + fee);
  credit(to, amount);
  burned_ += fee;
  return true;
}

const amount_t& balance_store::total_minted() const {
  return minted_;
}

const amount_t& balance_store::total_burned() const {
  return burned_;
}

amount_t balance_store::total_supply() const {
  return minted_ - burned_;
}

std::size_t balance_store::accounts() const {
  return balances_.size();
}

const std::map<account_key_t, amount_t>& balance_store::balances() const {
  return balances_;
}

void balance_store::credit(const account_key_t& account,
                           const amount_t& amount) {
  if (amount == 0) {
    return;
  }
  balances_[account] += amount;
}

void balance_store::debit(const account_key_t& account,
                          const amount_t& amount) {
  if (amount == 0) {
    return;
  }
  auto found = balances_.find(account);
  if (found == std::end(balances_) || found->second < amount) {
    tally::common::critical("balance debit exceeds available balance");
  }
  found->second -= amount;
  if (found->second == 0) {
    balances_.erase(found);
  }
}

}  // namespace tally::execution
