#pragma once

#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <map>

namespace tally::execution {

/// Balances keyed by canonical account key, plus the minted/burned counters
/// backing the conservation law `sum(balances) + burned == minted`.
///
/// Every mutator either applies completely or leaves the store untouched.
class balance_store final {
 public:
  /// Zero for unknown accounts.
  tally::schema::amount_t balance_of(
      const tally::schema::account_key_t& account) const;

  void mint(const tally::schema::account_key_t& to,
            const tally::schema::amount_t& amount);

  /// False (and no change) when the balance is below `amount`.
  bool burn(const tally::schema::account_key_t& from,
            const tally::schema::amount_t& amount);

  /// Moves `amount` and burns `fee`. False (and no change) when the balance
  /// is below `amount + fee`.
  bool transfer(const tally::schema::account_key_t& from,
                const tally::schema::account_key_t& to,
                const tally::schema::amount_t& amount,
                const tally::schema::amount_t& fee);

  const tally::schema::amount_t& total_minted() const;
  const tally::schema::amount_t& total_burned() const;
  tally::schema::amount_t total_supply() const;

  /// Number of accounts holding a non-zero balance.
  std::size_t accounts() const;

  const std::map<tally::schema::account_key_t, tally::schema::amount_t>&
  balances() const;

 private:
  void credit(const tally::schema::account_key_t& account,
              const tally::schema::amount_t& amount);
  void debit(const tally::schema::account_key_t& account,
             const tally::schema::amount_t& amount);

  std::map<tally::schema::account_key_t, tally::schema::amount_t> balances_;
  tally::schema::amount_t minted_{};
  tally::schema::amount_t burned_{};
};

}  // namespace tally::execution
