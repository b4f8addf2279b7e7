#include <tally/common/critical.hpp>
#include <tally/execution/transaction_log.hpp>

#include <algorithm>
#include <iterator>

using namespace tally::schema;

namespace tally::execution {

transaction_log::transaction_log(const uint64_t capacity)
    : capacity_{capacity} {
  if (capacity_ == 0) {
    tally::common::critical("transaction log capacity must be positive");
  }
}

transaction_index_t transaction_log::append(transaction_t tx,
                                            const uint64_t stored_transactions) {
  tx.index = stored_transactions + entries_.size();
  entries_.push_back(std::move(tx));
  return entries_.back().index;
}

uint64_t transaction_log::size() const {
  return entries_.size();
}

bool transaction_log::empty() const {
  return entries_.empty();
}

uint64_t transaction_log::capacity() const {
  return capacity_;
}

bool transaction_log::is_full() const {
  return entries_.size() >= capacity_;
}

std::optional<transaction_t> transaction_log::at(const uint64_t offset) const {
  if (offset >= entries_.size()) {
    return std::nullopt;
  }
  return entries_[offset];
}

std::vector<transaction_t> transaction_log::slice(const uint64_t start,
                                                  const uint64_t length) const {
  auto out = std::vector<transaction_t>{};
  if (start >= entries_.size()) {
    return out;
  }
  auto count = std::min<uint64_t>(length, entries_.size() - start);
  auto first = std::next(std::begin(entries_), static_cast<std::ptrdiff_t>(start));
  out.reserve(count);
  std::copy_n(first, count, std::back_inserter(out));
  return out;
}

std::vector<transaction_t> transaction_log::snapshot() const {
  return std::vector<transaction_t>{std::begin(entries_), std::end(entries_)};
}

void transaction_log::truncate_front(const uint64_t count) {
  if (count > entries_.size()) {
    tally::common::critical("cannot truncate more entries than the log holds");
  }
  entries_.erase(std::begin(entries_),
                 std::next(std::begin(entries_),
                           static_cast<std::ptrdiff_t>(count)));
}

void transaction_log::clear() {
  entries_.clear();
}

}  // namespace tally::execution
