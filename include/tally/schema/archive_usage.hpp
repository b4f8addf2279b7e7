#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>

// Schema type: archive usage.
// Ledger workflow: Capacity report of an archive endpoint, sized with the
// fixed per transaction budget.
namespace tally::schema {

template <uint16_t Version>
struct archive_usage;

template <>
struct archive_usage<1> final {
  uint16_t version{1};
  uint64_t stored_transactions{};
  uint64_t used_bytes{};
  uint64_t max_bytes{};
  uint64_t remaining_capacity{};
  hash32_t tip_hash{};
};

using archive_usage_t = archive_usage<1>;

}  // namespace tally::schema
