#include <blake3.h>
#include <tally/blake3/hash.hpp>

namespace tally::blake3 {

tally::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = tally::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

tally::schema::hash32_t hash(const tally::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = tally::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

tally::schema::hash32_t chain(const tally::schema::hash32_t& parent,
                              const tally::schema::bytes_view_t& payload) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, parent.data(), parent.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  auto output = tally::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace tally::blake3
