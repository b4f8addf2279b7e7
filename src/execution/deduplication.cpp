#include <tally/execution/deduplication.hpp>

#include <boost/endian/conversion.hpp>
#include <iterator>

using namespace tally::schema;

namespace {

void append_u64(bytes_t& out, const uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto* first = reinterpret_cast<const uint8_t*>(&big);
  out.insert(std::end(out), first, first + sizeof(big));
}

void append_sized(bytes_t& out, const bytes_t& value) {
  append_u64(out, value.size());
  out.insert(std::end(out), std::begin(value), std::end(value));
}

void append_amount(bytes_t& out, const amount_t& value) {
  auto encoded = to_big_endian(value);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

}  // namespace

namespace tally::execution {

bytes_t make_deduplication_key(const validated_request& request) {
  auto key = bytes_t{};
  key.reserve(160);
  key.push_back(static_cast<uint8_t>(request.kind));
  append_sized(key, request.from_key);
  append_sized(key, request.to_key);
  append_amount(key, request.amount);
  key.push_back(request.supplied_fee.has_value() ? 1 : 0);
  if (request.supplied_fee) {
    append_amount(key, *request.supplied_fee);
  }
  key.push_back(request.memo.has_value() ? 1 : 0);
  if (request.memo) {
    append_sized(key, *request.memo);
  }
  append_u64(key, request.created_at_time.value_or(0));
  return key;
}

std::optional<transaction_index_t> deduplication_index::find(
    const bytes_t& key) const {
  auto found = entries_.find(key);
  if (found == std::end(entries_)) {
    return std::nullopt;
  }
  return found->second;
}

void deduplication_index::insert(bytes_t key,
                                 const transaction_index_t index,
                                 const timestamp_nanoseconds_t created_at_time) {
  auto inserted = entries_.emplace(key, index).second;
  if (inserted) {
    expiry_.emplace(created_at_time, std::move(key));
  }
}

void deduplication_index::prune(const timestamp_nanoseconds_t oldest_allowed) {
  auto last = expiry_.lower_bound(oldest_allowed);
  for (auto it = std::begin(expiry_); it != last; ++it) {
    entries_.erase(it->second);
  }
  expiry_.erase(std::begin(expiry_), last);
}

std::size_t deduplication_index::size() const {
  return entries_.size();
}

}  // namespace tally::execution
