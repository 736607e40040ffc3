#include <blake3.h>
#include <revreg/blake3/hash.hpp>

namespace revreg::blake3 {

revreg::schema::hash32_t hash(const std::string_view& str) {
  return hash(revreg::schema::make_bytes_view(str));
}

revreg::schema::hash32_t hash(const revreg::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  static_assert(BLAKE3_OUT_LEN == 32);
  auto output = revreg::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace revreg::blake3
