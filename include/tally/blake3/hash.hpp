#pragma once
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tally::blake3 {

tally::schema::hash32_t hash(const std::string_view& str);
tally::schema::hash32_t hash(const tally::schema::bytes_view_t& bytes);

/// BLAKE3 of `parent || payload`; links one archived record to the previous.
tally::schema::hash32_t chain(const tally::schema::hash32_t& parent,
                              const tally::schema::bytes_view_t& payload);

}  // namespace tally::blake3
