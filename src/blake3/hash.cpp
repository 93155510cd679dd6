#include <blake3.h>
#include <accredit/blake3/hash.hpp>

namespace accredit::blake3 {

accredit::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = accredit::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

accredit::schema::hash32_t hash(const accredit::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = accredit::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace accredit::blake3
